/**
 * @file FusionEngine.hpp
 * @brief Fusion par règles des prédictions voix et visage
 * @version 1.0
 * @date 2026-01-12
 *
 * merged[e] = voix[e]·w_v + visage[e]·w_f sur l'union des clés.
 * Niveau d'accord par priorité : égalité exacte (strong), compatibilité
 * >= 0.6 (moderate), >= 0.3 (weak), sinon conflict.
 */

#ifndef MEDE_FUSION_ENGINE_HPP
#define MEDE_FUSION_ENGINE_HPP

#include "Types.hpp"
#include "EngineConfig.hpp"
#include "CompatibilityMatrix.hpp"
#include <string>

namespace mede {

/**
 * @class FusionEngine
 * @brief Sans état mutable : partageable entre requêtes concurrentes
 */
class FusionEngine {
public:
    explicit FusionEngine(const FusionConfig& config = FusionConfig{},
                          const CompatibilityMatrix& matrix = CompatibilityMatrix::defaultMatrix());

    FusionEngine(const FusionEngine&) = delete;
    FusionEngine& operator=(const FusionEngine&) = delete;

    /**
     * @brief Fusionne une prédiction vocale et une prédiction faciale
     * @throws InputError si les deux distributions sont vides
     *
     * Un visage sans distribution est traité comme une masse ponctuelle :
     * face.confidence·w_f est ajouté à merged[face.label].
     */
    [[nodiscard]] FusionVerdict merge(const ModalityPrediction& voice,
                                      const ModalityPrediction& face) const;

    /**
     * @brief Niveau d'accord pour un couple (égalité, compatibilité)
     */
    [[nodiscard]] AgreementTier classify(bool exact_match, double compatibility) const;

    /**
     * @brief Émotion à transmettre à la recommandation musicale
     *
     * Conflit + confiance finale < conflict_min_confidence → émotion par défaut.
     */
    [[nodiscard]] std::string recommendationEmotion(const FusionVerdict& verdict) const;

    /**
     * @brief Résumé lisible d'un verdict, une ligne
     */
    [[nodiscard]] static std::string summary(const FusionVerdict& verdict);

    [[nodiscard]] const FusionConfig& config() const { return config_; }
    [[nodiscard]] const CompatibilityMatrix& matrix() const { return matrix_; }

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    FusionConfig config_;
    const CompatibilityMatrix& matrix_;
    bool quiet_mode_ = false;

    [[nodiscard]] static std::string explain(AgreementTier tier, const std::string& voice,
                                             const std::string& face, const std::string& final_emotion);
};

} // namespace mede

#endif // MEDE_FUSION_ENGINE_HPP
