/**
 * @file EmotionCatalog.hpp
 * @brief Métadonnées d'affichage des émotions (emoji, couleur, description)
 * @version 1.0
 * @date 2026-01-12
 */

#ifndef MEDE_EMOTION_CATALOG_HPP
#define MEDE_EMOTION_CATALOG_HPP

#include "Types.hpp"
#include <string>
#include <unordered_map>

namespace mede {

struct EmotionInfo {
    std::string emoji;
    std::string color;          // Code hexadécimal #RRGGBB
    std::string description;
};

/**
 * @brief Métadonnées d'une émotion, entrée "unknown" si le libellé est inconnu
 */
inline const EmotionInfo& emotionInfo(const std::string& emotion) {
    static const std::unordered_map<std::string, EmotionInfo> catalog = {
        {"angry",    {"😠", "#EF4444", "Displeasure, frustration"}},
        {"disgust",  {"🤢", "#8B5CF6", "Revulsion, disapproval"}},
        {"fear",     {"😨", "#F59E0B", "Anxiety, apprehension"}},
        {"happy",    {"😊", "#10B981", "Joy, contentment"}},
        {"neutral",  {"😐", "#6B7280", "Baseline state"}},
        {"sad",      {"😢", "#3B82F6", "Sorrow, melancholy"}},
        {"surprise", {"😲", "#EC4899", "Astonishment"}}
    };
    static const EmotionInfo unknown{"🎭", "#6B7280", "Unknown emotion"};

    auto it = catalog.find(canonicalKey(emotion));
    return it != catalog.end() ? it->second : unknown;
}

} // namespace mede

#endif // MEDE_EMOTION_CATALOG_HPP
