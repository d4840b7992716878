/**
 * @file FrameQualityGate.cpp
 * @brief Implémentation de la porte de qualité image
 * @version 1.0
 * @date 2026-01-12
 */

#include "FrameQualityGate.hpp"
#include <algorithm>
#include <cmath>

namespace mede {

FrameQualityGate::FrameQualityGate(const FrameGateConfig& config)
    : config_(config)
{
}

std::optional<std::string> FrameQualityGate::check(const ImageFrame& frame) const {
    if (!frame.isConsistent()) {
        return std::string("Could not read image, using neutral fallback");
    }
    if (!config_.enabled) {
        return std::nullopt;
    }
    if (grayscaleStdDev(frame) < config_.min_pixel_stddev) {
        return std::string("No camera available, using neutral fallback");
    }
    return std::nullopt;
}

double FrameQualityGate::grayscaleStdDev(const ImageFrame& frame) {
    if (!frame.isConsistent()) {
        return 0.0;
    }

    size_t count = static_cast<size_t>(frame.width) * frame.height;
    size_t stride = static_cast<size_t>(frame.channels);

    double sum = 0.0;
    double sum_sq = 0.0;
    for (size_t p = 0; p < count; ++p) {
        const uint8_t* px = &frame.pixels[p * stride];
        double gray;
        if (stride >= 3) {
            gray = 0.114 * px[0] + 0.587 * px[1] + 0.299 * px[2];
        } else {
            gray = px[0];
        }
        sum += gray;
        sum_sq += gray * gray;
    }

    double mean = sum / count;
    double variance = std::max(0.0, sum_sq / count - mean * mean);
    return std::sqrt(variance);
}

} // namespace mede
