/**
 * @file JsonCodec.hpp
 * @brief Format JSON du service (requêtes, prédictions, verdicts, résultats)
 * @version 1.0
 * @date 2026-01-12
 */

#ifndef MEDE_JSON_CODEC_HPP
#define MEDE_JSON_CODEC_HPP

#include "Types.hpp"
#include "AudioQualityGate.hpp"
#include "Orchestrator.hpp"
#include "Predictors.hpp"
#include <nlohmann/json.hpp>

namespace mede {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ENCODAGE
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Objet {émotion: probabilité}
 */
json toJson(const EmotionDistribution& distribution);

/**
 * @brief Tableau [{emotion, probability}] trié par probabilité décroissante
 */
json toSortedJson(const EmotionDistribution& distribution);

json toJson(const ModalityPrediction& prediction);
json toJson(const AudioQualityReport& report);
json toJson(const AudioQualityVerdict& verdict);
json toJson(const FusionVerdict& verdict);
json toJson(const AnalysisResult& result);

json audioToJson(const AudioBuffer& audio);
json imageToJson(const ImageFrame& image);

// ═══════════════════════════════════════════════════════════════════════════
// DÉCODAGE
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @throws InputError si un champ a un type ou une valeur invalide
 */
AudioBuffer audioFromJson(const json& j);

/**
 * @throws InputError si les dimensions ne correspondent pas au nombre de pixels
 */
ImageFrame imageFromJson(const json& j);

/**
 * @brief Décode une requête d'analyse ({audio?, image?, frames?, request_id?})
 * @throws InputError si la requête est mal formée
 */
AnalysisRequest requestFromJson(const json& j);

/**
 * @brief Décode la réponse d'un serveur de modèle
 *
 * {success, emotion, confidence, all_emotions, error?, warning?}, ou la même
 * forme imbriquée sous "prediction".
 * @throws InferenceFailure si la réponse est inexploitable
 */
PredictorResult predictorResultFromJson(const json& j);

} // namespace mede

#endif // MEDE_JSON_CODEC_HPP
