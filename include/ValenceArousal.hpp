/**
 * @file ValenceArousal.hpp
 * @brief Projection d'une émotion discrète dans le plan valence/arousal
 * @version 1.0
 * @date 2026-01-12
 */

#ifndef MEDE_VALENCE_AROUSAL_HPP
#define MEDE_VALENCE_AROUSAL_HPP

#include <random>
#include <string>

namespace mede {

struct ValenceArousal {
    double valence = 0.0;   // [-1, 1]
    double arousal = 0.0;   // [-1, 1]
};

/**
 * @brief Coordonnées (valence, arousal) d'une émotion, pondérées par la confiance
 * @param emotion Libellé (alias calm, relaxed, bored, tired, excited, energetic, stressed acceptés)
 * @param confidence Confiance, bornée à [0, 1]
 * @param jitter Bruit relatif optionnel, borné à [0, 0.2]
 * @param rng Générateur pour le bruit (générateur local au thread si nullptr)
 *
 * Échelle = 0.2 + 0.8·confiance : une émotion incertaine reste proche de
 * l'origine. Résultat borné à [-1, 1] et arrondi à 3 décimales.
 * Une émotion inconnue est traitée comme neutral.
 */
ValenceArousal computeValenceArousal(const std::string& emotion, double confidence,
                                     double jitter = 0.0, std::mt19937* rng = nullptr);

} // namespace mede

#endif // MEDE_VALENCE_AROUSAL_HPP
