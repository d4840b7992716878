/**
 * @file Orchestrator.cpp
 * @brief Implémentation de l'arbre de décision multimodal
 * @version 1.0
 * @date 2026-01-12
 */

#include "Orchestrator.hpp"
#include "ValenceArousal.hpp"
#include <iostream>
#include <utility>

namespace mede {

namespace {

const char* const FACE_FAILED_WARNING = "Face detection failed, using neutral fallback";
const char* const FACE_UNAVAILABLE_WARNING = "Face model unavailable, using neutral fallback";
const char* const FUSION_EXPLANATION = "Learned fusion model jointly encoded audio + video.";

/**
 * @brief Distribution d'une prédiction, masse ponctuelle si absente
 */
EmotionDistribution distributionOrPointMass(const ModalityPrediction& prediction) {
    if (!prediction.distribution.empty()) {
        return prediction.distribution;
    }
    EmotionDistribution point;
    point.set(prediction.label, prediction.confidence);
    return point;
}

} // namespace anonyme

Orchestrator::Orchestrator(const EngineConfig& config,
                           VoicePredictor* voice,
                           FacePredictor* face,
                           FusionPredictor* fusion)
    : config_(config)
    , audio_gate_(config.quality_gate)
    , frame_gate_(config.frame_gate)
    , fusion_engine_(config.fusion)
    , voice_(voice)
    , face_(face)
    , fusion_(fusion)
{
}

void Orchestrator::setQuietMode(bool quiet) {
    quiet_mode_ = quiet;
    audio_gate_.setQuietMode(quiet);
    fusion_engine_.setQuietMode(quiet);
}

void Orchestrator::log(const std::string& message) const {
    if (!quiet_mode_) {
        std::cout << "[Orchestrator] " << message << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CHAÎNE DE DÉCISION
// ═══════════════════════════════════════════════════════════════════════════

AnalysisResult Orchestrator::analyze(const AnalysisRequest& request) {
    AnalysisResult result;
    result.request_id = request.request_id;

    // 1. Aucune entrée exploitable
    if (!request.hasAudio() && !request.hasVisual()) {
        result.error_kind = ErrorKind::NO_USABLE_INPUT;
        result.error = "No usable input: provide audio and/or an image";
        std::cerr << "[Orchestrator] Requête " << request.request_id << " sans audio ni image\n";
        return result;
    }

    // 2. Modèle de fusion appris, prioritaire quand il répond
    if (auto fused = tryLearnedFusion(request)) {
        result.success = true;
        result.mode = ResolutionMode::FUSION;
        result.recommendation_emotion = fused->final_emotion;
        result.verdict = std::move(*fused);
        finalize(result);
        return result;
    }

    std::optional<VoiceOutcome> voice;
    if (request.hasAudio()) {
        voice = runVoice(*request.audio, result);
    }

    std::optional<ModalityPrediction> face;
    if (request.hasVisual()) {
        face = runFace(request);
        if (face->warning) {
            result.warnings.push_back(*face->warning);
        }
    }

    const bool voice_ok = voice.has_value() && voice->prediction.has_value();

    if (voice_ok && face) {
        // 3. Fusion par règles
        log("Fusion par règles (voix + visage)");
        FusionVerdict verdict = fusion_engine_.merge(*voice->prediction, *face);
        result.mode = ResolutionMode::MULTIMODAL;
        result.recommendation_emotion = fusion_engine_.recommendationEmotion(verdict);
        result.verdict = std::move(verdict);
    } else if (voice_ok) {
        // 4. Voix seule
        log("Voix seule");
        result.mode = ResolutionMode::VOICE_ONLY;
        result.verdict = singleModalityVerdict(*voice->prediction);
        result.recommendation_emotion = result.verdict->final_emotion;
    } else if (face) {
        // 5. Visage seul (y compris après un échec vocal)
        if (voice) {
            result.voice_error = voice->error;
            log("Échec vocal, repli sur le visage seul");
        } else {
            log("Visage seul");
        }
        result.mode = ResolutionMode::FACE_ONLY;
        result.verdict = singleModalityVerdict(*face);
        result.recommendation_emotion = result.verdict->final_emotion;
    } else {
        // Voix en échec et aucune image : l'échec vocal est reporté
        result.error_kind = voice->error_kind;
        result.error = "Could not analyze any modality: " + voice->error;
        result.voice_error = voice->error;
        std::cerr << "[Orchestrator] " << result.error << "\n";
        return result;
    }

    result.success = true;
    finalize(result);
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// FUSION APPRISE
// ═══════════════════════════════════════════════════════════════════════════

std::optional<FusionVerdict> Orchestrator::tryLearnedFusion(const AnalysisRequest& request) {
    if (fusion_ == nullptr || !request.hasAudio() || !request.hasVisual()) {
        return std::nullopt;
    }
    if (!fusion_->isAvailable()) {
        log("Modèle de fusion indisponible, fusion par règles");
        return std::nullopt;
    }

    try {
        std::vector<ImageFrame> frames = selectFusionFrames(request);
        PredictorResult r = fusion_->predict(*request.audio, frames);
        if (!r.success || r.emotion.empty()) {
            std::cerr << "[Orchestrator] Échec du modèle de fusion: "
                      << (r.error.empty() ? "réponse sans émotion" : r.error) << "\n";
            return std::nullopt;
        }

        ModalityPrediction prediction = r.toPrediction(Modality::FUSION);

        FusionVerdict verdict;
        verdict.final_emotion = prediction.label;
        verdict.final_confidence = prediction.confidence;
        verdict.agreement_tier = AgreementTier::FUSION;
        verdict.agreement_score = prediction.confidence;
        verdict.explanation = FUSION_EXPLANATION;
        verdict.merged_distribution = distributionOrPointMass(prediction);

        log("Modèle de fusion: " + verdict.final_emotion + " (" +
            std::to_string(frames.size()) + " trames)");
        return verdict;
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Erreur du modèle de fusion: " << e.what() << "\n";
        return std::nullopt;
    }
}

std::vector<ImageFrame> Orchestrator::selectFusionFrames(const AnalysisRequest& request) const {
    if (request.frames.empty()) {
        return {*request.image};
    }

    const size_t total = request.frames.size();
    const size_t limit = config_.orchestrator.max_fusion_frames;
    if (limit == 0 || total <= limit) {
        return request.frames;
    }

    // Échantillonnage régulier sur toute la vidéo
    std::vector<ImageFrame> selected;
    selected.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        selected.push_back(request.frames[i * total / limit]);
    }
    return selected;
}

// ═══════════════════════════════════════════════════════════════════════════
// BRANCHE VOCALE
// ═══════════════════════════════════════════════════════════════════════════

Orchestrator::VoiceOutcome Orchestrator::runVoice(const AudioBuffer& audio, AnalysisResult& result) {
    VoiceOutcome outcome;

    try {
        // Le repli de la porte qualité ne masque pas l'absence du modèle
        if (voice_ == nullptr || !voice_->isAvailable()) {
            throw ModelUnavailable("Voice model unavailable");
        }

        AudioQualityVerdict quality = audio_gate_.evaluate(audio);
        result.quality = quality;

        if (!quality.is_reliable) {
            // Audio peu informatif : résultat dégradé, pas une erreur
            outcome.prediction = *quality.fallback;
            result.warnings.push_back(*quality.fallback->warning);
            return outcome;
        }

        PredictorResult r = voice_->predict(audio);
        if (!r.success) {
            outcome.error_kind = ErrorKind::INFERENCE_FAILURE;
            outcome.error = r.error.empty() ? "Voice prediction failed" : r.error;
            std::cerr << "[Orchestrator] Échec de la prédiction vocale: " << outcome.error << "\n";
            return outcome;
        }
        if (r.emotion.empty()) {
            throw InferenceFailure("Voice predictor returned no emotion");
        }

        ModalityPrediction prediction = r.toPrediction(Modality::VOICE);
        prediction.distribution = distributionOrPointMass(prediction);
        outcome.prediction = std::move(prediction);
    } catch (const MedeError& e) {
        outcome.error_kind = e.kind();
        outcome.error = e.what();
        std::cerr << "[Orchestrator] Erreur vocale (" << errorKindToString(e.kind())
                  << "): " << e.what() << "\n";
    } catch (const std::exception& e) {
        outcome.error_kind = ErrorKind::INFERENCE_FAILURE;
        outcome.error = e.what();
        std::cerr << "[Orchestrator] Erreur vocale: " << e.what() << "\n";
    }

    return outcome;
}

// ═══════════════════════════════════════════════════════════════════════════
// BRANCHE FACIALE
// ═══════════════════════════════════════════════════════════════════════════

const ImageFrame& Orchestrator::selectFaceFrame(const AnalysisRequest& request) const {
    if (request.hasImage()) {
        return *request.image;
    }
    size_t index = config_.orchestrator.use_middle_frame_for_face ? request.frames.size() / 2 : 0;
    return request.frames[index];
}

ModalityPrediction Orchestrator::runFace(const AnalysisRequest& request) {
    const ImageFrame& frame = selectFaceFrame(request);

    if (auto warning = frame_gate_.check(frame)) {
        log(*warning);
        return faceFallback(*warning);
    }

    if (face_ == nullptr || !face_->isAvailable()) {
        log("Modèle facial indisponible");
        return faceFallback(FACE_UNAVAILABLE_WARNING);
    }

    try {
        PredictorResult r = face_->predict(frame);
        if (!r.success || r.emotion.empty()) {
            std::cerr << "[Orchestrator] Échec de la détection faciale: "
                      << (r.error.empty() ? "réponse sans émotion" : r.error) << "\n";
            return faceFallback(FACE_FAILED_WARNING);
        }
        return r.toPrediction(Modality::FACE);
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Erreur de détection faciale: " << e.what() << "\n";
        return faceFallback(FACE_FAILED_WARNING);
    }
}

ModalityPrediction Orchestrator::faceFallback(const std::string& warning) const {
    ModalityPrediction prediction;
    prediction.label = canonicalKey(config_.face_fallback.emotion);
    prediction.confidence = config_.face_fallback.confidence;
    prediction.distribution.set(prediction.label, prediction.confidence);
    prediction.modality = Modality::FACE;
    prediction.warning = warning;
    return prediction;
}

// ═══════════════════════════════════════════════════════════════════════════
// VERDICT
// ═══════════════════════════════════════════════════════════════════════════

FusionVerdict Orchestrator::singleModalityVerdict(const ModalityPrediction& prediction) {
    FusionVerdict verdict;
    verdict.final_emotion = prediction.label;
    verdict.final_confidence = prediction.confidence;
    verdict.merged_distribution = distributionOrPointMass(prediction);
    verdict.explanation = (prediction.modality == Modality::FACE ? "Face-only" : "Voice-only") +
                          std::string(" prediction '") + prediction.label + "'";
    if (prediction.warning) {
        verdict.explanation += " (" + *prediction.warning + ")";
    }

    if (prediction.modality == Modality::FACE) {
        verdict.face_prediction = prediction;
    } else {
        verdict.voice_prediction = prediction;
    }
    return verdict;
}

void Orchestrator::finalize(AnalysisResult& result) const {
    const FusionVerdict& verdict = *result.verdict;

    ValenceArousal va = computeValenceArousal(result.recommendation_emotion, verdict.final_confidence);
    result.valence = va.valence;
    result.arousal = va.arousal;
    result.summary = FusionEngine::summary(verdict);

    log("Mode " + modeToString(result.mode) + " → " + verdict.final_emotion +
        ", recommandation: " + result.recommendation_emotion);
}

} // namespace mede
