/**
 * @file Types.cpp
 * @brief Normalisation et conversion des libellés d'émotion
 * @version 1.0
 * @date 2026-01-12
 */

#include "Types.hpp"
#include <algorithm>
#include <cctype>

namespace mede {

std::string normalizeLabel(const std::string& label) {
    auto first = label.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = label.find_last_not_of(" \t\r\n");

    std::string result = label.substr(first, last - first + 1);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<EmotionLabel> parseEmotion(const std::string& label) {
    static const std::unordered_map<std::string, EmotionLabel> emotionMap = {
        {"angry", EmotionLabel::ANGRY},
        {"anger", EmotionLabel::ANGRY},
        {"disgust", EmotionLabel::DISGUST},
        {"fear", EmotionLabel::FEAR},
        {"happy", EmotionLabel::HAPPY},
        {"happiness", EmotionLabel::HAPPY},
        {"neutral", EmotionLabel::NEUTRAL},
        {"sad", EmotionLabel::SAD},
        {"sadness", EmotionLabel::SAD},
        {"surprise", EmotionLabel::SURPRISE}
    };
    auto it = emotionMap.find(normalizeLabel(label));
    if (it == emotionMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string canonicalKey(const std::string& label) {
    auto emotion = parseEmotion(label);
    return emotion ? emotionToString(*emotion) : normalizeLabel(label);
}

} // namespace mede
