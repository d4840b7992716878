/**
 * @file AudioQualityGate.cpp
 * @brief Diagnostics audio (RMS, pic, ZCR, centroïde, bande de parole)
 * @version 1.0
 * @date 2026-01-12
 */

#include "AudioQualityGate.hpp"
#include "Errors.hpp"
#include <eigen3/unsupported/Eigen/FFT>
#include <algorithm>
#include <cmath>
#include <complex>
#include <iomanip>
#include <iostream>
#include <vector>

namespace mede {

namespace {

constexpr double SPECTRAL_EPSILON = 1e-8;

} // namespace anonyme

AudioQualityGate::AudioQualityGate(const QualityGateConfig& config)
    : config_(config)
{
}

// ═══════════════════════════════════════════════════════════════════════════
// VERDICT
// ═══════════════════════════════════════════════════════════════════════════

AudioQualityVerdict AudioQualityGate::evaluate(const AudioBuffer& audio) const {
    if (audio.empty()) {
        throw InputError("Buffer audio vide");
    }
    if (audio.sample_rate <= 0) {
        throw InputError("Taux d'échantillonnage invalide: " + std::to_string(audio.sample_rate));
    }

    AudioQualityVerdict verdict;

    double min_samples = config_.min_duration_s * audio.sample_rate;
    if (static_cast<double>(audio.samples.size()) < min_samples) {
        // Trop court : seuls RMS et pic sont calculés
        double sum_sq = 0.0;
        double peak = 0.0;
        for (float s : audio.samples) {
            sum_sq += static_cast<double>(s) * s;
            peak = std::max(peak, std::abs(static_cast<double>(s)));
        }
        verdict.report.rms = std::sqrt(sum_sq / audio.samples.size());
        verdict.report.peak = peak;
        verdict.is_reliable = false;
        verdict.issue = AudioQualityIssue::TOO_SHORT;
        verdict.fallback = fallbackPrediction(
            config_.too_short_confidence,
            "Audio too short for reliable analysis, using neutral fallback");

        if (!quiet_mode_) {
            std::cout << "[AudioQualityGate] Audio trop court (" << audio.samples.size()
                      << " échantillons, " << std::fixed << std::setprecision(3)
                      << audio.durationSeconds() << "s) → repli neutre\n";
        }
        return verdict;
    }

    verdict.report = analyze(audio);
    verdict.issue = classify(verdict.report);
    verdict.is_reliable = (verdict.issue == AudioQualityIssue::NONE);

    if (!quiet_mode_) {
        const auto& r = verdict.report;
        std::cout << "[AudioQualityGate] rms=" << std::fixed << std::setprecision(4) << r.rms
                  << " peak=" << std::setprecision(3) << r.peak
                  << " zcr=" << std::setprecision(4) << r.zero_crossing_rate
                  << " centroid=" << std::setprecision(1) << r.spectral_centroid << "Hz"
                  << " speech=" << std::setprecision(2) << r.speech_band_ratio
                  << " → " << (verdict.is_reliable ? "fiable" : issueToString(verdict.issue))
                  << "\n";
    }

    if (!verdict.is_reliable) {
        verdict.fallback = fallbackPrediction(
            config_.fallback_confidence,
            "Low-information audio (" + issueToString(verdict.issue) +
            "), using neutral fallback");
    }
    return verdict;
}

AudioQualityIssue AudioQualityGate::classify(const AudioQualityReport& report) const {
    if (report.rms < config_.min_rms || report.peak < config_.min_peak) {
        return AudioQualityIssue::TOO_QUIET;
    }
    if (report.speech_band_ratio < config_.min_speech_band_ratio) {
        return AudioQualityIssue::LOW_SPEECH_BAND;
    }
    if (report.zero_crossing_rate < config_.min_zero_crossing_rate ||
        report.spectral_centroid < config_.min_spectral_centroid_hz) {
        return AudioQualityIssue::NO_VARIATION;
    }
    return AudioQualityIssue::NONE;
}

// ═══════════════════════════════════════════════════════════════════════════
// DIAGNOSTICS
// ═══════════════════════════════════════════════════════════════════════════

AudioQualityReport AudioQualityGate::analyze(const AudioBuffer& audio) const {
    AudioQualityReport report;
    if (audio.empty()) {
        return report;
    }

    double sum_sq = 0.0;
    double peak = 0.0;
    for (float s : audio.samples) {
        sum_sq += static_cast<double>(s) * s;
        peak = std::max(peak, std::abs(static_cast<double>(s)));
    }
    report.rms = std::sqrt(sum_sq / audio.samples.size());
    report.peak = peak;
    report.zero_crossing_rate = zeroCrossingRate(audio.samples);

    if (audio.sample_rate > 0) {
        spectralFeatures(audio, report);
    }
    return report;
}

double AudioQualityGate::zeroCrossingRate(const std::vector<float>& samples) const {
    size_t n = samples.size();
    if (n < 2) {
        return 0.0;
    }

    size_t frame = std::min(config_.zcr_frame_length, n);
    size_t hop = std::max<size_t>(config_.zcr_hop_length, 1);

    double total = 0.0;
    size_t frames = 0;
    for (size_t start = 0; start + frame <= n; start += hop) {
        size_t crossings = 0;
        for (size_t i = start + 1; i < start + frame; ++i) {
            // Zéro compté comme positif : un signal nul ne croise jamais
            bool prev = samples[i - 1] >= 0.0f;
            bool cur = samples[i] >= 0.0f;
            if (prev != cur) {
                ++crossings;
            }
        }
        total += static_cast<double>(crossings) / frame;
        ++frames;
    }
    return frames > 0 ? total / frames : 0.0;
}

size_t AudioQualityGate::fftLength(size_t n) {
    for (size_t m = n; m > 1; --m) {
        size_t rest = m;
        for (size_t radix : {2, 3, 5}) {
            while (rest % radix == 0) {
                rest /= radix;
            }
        }
        if (rest == 1) {
            return m;
        }
    }
    return n;
}

void AudioQualityGate::spectralFeatures(const AudioBuffer& audio, AudioQualityReport& report) const {
    size_t length = fftLength(audio.samples.size());
    std::vector<double> time(audio.samples.begin(), audio.samples.begin() + length);
    std::vector<std::complex<double>> spectrum;

    Eigen::FFT<double> fft;
    fft.SetFlag(Eigen::FFT<double>::HalfSpectrum);
    fft.fwd(spectrum, time);

    double n = static_cast<double>(time.size());
    double bin_hz = audio.sample_rate / n;

    double total_mag = 0.0;
    double weighted = 0.0;
    double band_mag = 0.0;
    for (size_t k = 0; k < spectrum.size(); ++k) {
        double mag = std::abs(spectrum[k]);
        double freq = k * bin_hz;
        total_mag += mag;
        weighted += freq * mag;
        if (freq >= config_.speech_band_low_hz && freq <= config_.speech_band_high_hz) {
            band_mag += mag;
        }
    }

    report.spectral_centroid = total_mag > 0.0 ? weighted / total_mag : 0.0;
    report.speech_band_ratio = band_mag / (total_mag + SPECTRAL_EPSILON);
}

// ═══════════════════════════════════════════════════════════════════════════
// REPLI
// ═══════════════════════════════════════════════════════════════════════════

ModalityPrediction AudioQualityGate::fallbackPrediction(double confidence, const std::string& warning) {
    ModalityPrediction prediction;
    prediction.label = "neutral";
    prediction.confidence = confidence;
    prediction.modality = Modality::VOICE;
    prediction.warning = warning;
    prediction.distribution = EmotionDistribution{
        {"angry", 0.10},
        {"disgust", 0.10},
        {"fear", 0.10},
        {"happy", 0.15},
        {"neutral", confidence},
        {"sad", 0.15},
        {"surprise", 0.10}
    };
    return prediction;
}

} // namespace mede
