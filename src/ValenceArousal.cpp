/**
 * @file ValenceArousal.cpp
 * @brief Table valence/arousal et projection pondérée
 * @version 1.0
 * @date 2026-01-12
 */

#include "ValenceArousal.hpp"
#include "Types.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <utility>

namespace mede {

namespace {

const std::unordered_map<std::string, std::pair<double, double>>& coordinates() {
    static const std::unordered_map<std::string, std::pair<double, double>> table = {
        {"happy",    { 0.9,  0.7}},
        {"sad",      {-0.7, -0.4}},
        {"angry",    {-0.7,  0.8}},
        {"fear",     {-0.8,  0.9}},
        {"disgust",  {-0.8,  0.3}},
        {"surprise", { 0.6,  0.8}},
        {"neutral",  { 0.0,  0.0}}
    };
    return table;
}

const std::unordered_map<std::string, std::string>& aliases() {
    static const std::unordered_map<std::string, std::string> table = {
        {"calm",      "neutral"},
        {"relaxed",   "neutral"},
        {"bored",     "sad"},
        {"tired",     "sad"},
        {"excited",   "surprise"},
        {"energetic", "happy"},
        {"stressed",  "fear"}
    };
    return table;
}

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

} // namespace anonyme

ValenceArousal computeValenceArousal(const std::string& emotion, double confidence,
                                     double jitter, std::mt19937* rng) {
    std::string key = canonicalKey(emotion.empty() ? "neutral" : emotion);
    auto alias = aliases().find(key);
    if (alias != aliases().end()) {
        key = alias->second;
    }

    auto it = coordinates().find(key);
    auto base = (it != coordinates().end()) ? it->second : coordinates().at("neutral");

    double conf = std::clamp(std::isfinite(confidence) ? confidence : 0.0, 0.0, 1.0);
    double scale = 0.2 + conf * 0.8;

    double valence = base.first * scale;
    double arousal = base.second * scale;

    if (jitter > 0.0) {
        jitter = std::min(jitter, 0.2);
        double noise = jitter * std::sqrt(valence * valence + arousal * arousal);
        if (noise > 0.0) {
            thread_local std::mt19937 local_rng{std::random_device{}()};
            std::mt19937& gen = rng ? *rng : local_rng;
            std::uniform_real_distribution<double> dist(-noise, noise);
            valence += dist(gen);
            arousal += dist(gen);
        }
    }

    ValenceArousal result;
    result.valence = round3(std::clamp(valence, -1.0, 1.0));
    result.arousal = round3(std::clamp(arousal, -1.0, 1.0));
    return result;
}

} // namespace mede
