/**
 * @file EmotionDistribution.cpp
 * @brief Implémentation de la distribution émotionnelle
 * @version 1.0
 * @date 2026-01-12
 */

#include "EmotionDistribution.hpp"
#include "Types.hpp"
#include <algorithm>
#include <numeric>

namespace mede {

EmotionDistribution::EmotionDistribution(std::initializer_list<Entry> init) {
    for (const auto& [emotion, probability] : init) {
        set(emotion, probability);
    }
}

EmotionDistribution EmotionDistribution::fromMap(const std::unordered_map<std::string, double>& raw) {
    EmotionDistribution dist;
    for (const auto& [emotion, probability] : raw) {
        // Deux clés brutes peuvent se normaliser vers la même émotion
        dist.add(emotion, probability);
    }
    return dist;
}

double EmotionDistribution::get(const std::string& emotion) const {
    auto it = entries_.find(canonicalKey(emotion));
    return (it != entries_.end()) ? it->second : 0.0;
}

void EmotionDistribution::set(const std::string& emotion, double probability) {
    entries_[canonicalKey(emotion)] = probability;
}

void EmotionDistribution::add(const std::string& emotion, double probability) {
    entries_[canonicalKey(emotion)] += probability;
}

bool EmotionDistribution::contains(const std::string& emotion) const {
    return entries_.count(canonicalKey(emotion)) > 0;
}

double EmotionDistribution::total() const {
    return std::accumulate(entries_.begin(), entries_.end(), 0.0,
        [](double sum, const auto& entry) { return sum + entry.second; });
}

std::vector<std::string> EmotionDistribution::orderedKeys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());

    for (const auto& name : EMOTION_NAMES) {
        if (entries_.count(name) > 0) {
            keys.push_back(name);
        }
    }

    // std::map est déjà trié : les clés inconnues sortent par ordre alphabétique
    for (const auto& [key, value] : entries_) {
        if (!parseEmotion(key).has_value()) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::optional<EmotionDistribution::Entry> EmotionDistribution::argmax() const {
    if (entries_.empty()) {
        return std::nullopt;
    }

    std::optional<Entry> best;
    for (const auto& key : orderedKeys()) {
        double p = entries_.at(key);
        // Strictement supérieur : le premier maximum rencontré l'emporte
        if (!best || p > best->second) {
            best = Entry{key, p};
        }
    }
    return best;
}

std::vector<EmotionDistribution::Entry> EmotionDistribution::sortedByProbability() const {
    std::vector<Entry> sorted;
    sorted.reserve(entries_.size());
    for (const auto& key : orderedKeys()) {
        sorted.emplace_back(key, entries_.at(key));
    }

    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Entry& a, const Entry& b) { return a.second > b.second; });
    return sorted;
}

} // namespace mede
