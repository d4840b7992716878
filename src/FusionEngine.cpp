/**
 * @file FusionEngine.cpp
 * @brief Implémentation de la fusion voix/visage
 * @version 1.0
 * @date 2026-01-12
 */

#include "FusionEngine.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace mede {

namespace {

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value * 100.0 << "%";
    return oss.str();
}

} // namespace anonyme

FusionEngine::FusionEngine(const FusionConfig& config, const CompatibilityMatrix& matrix)
    : config_(config)
    , matrix_(matrix)
{
}

// ═══════════════════════════════════════════════════════════════════════════
// FUSION
// ═══════════════════════════════════════════════════════════════════════════

FusionVerdict FusionEngine::merge(const ModalityPrediction& voice, const ModalityPrediction& face) const {
    if (voice.distribution.empty() && face.distribution.empty()) {
        throw InputError("Fusion impossible: distributions voix et visage vides");
    }

    std::string voice_label = canonicalKey(voice.label);
    std::string face_label = canonicalKey(face.label);

    const double w_v = config_.weights.voice();
    const double w_f = config_.weights.face();

    if (!quiet_mode_) {
        std::cout << "[FusionEngine] Voix: " << voice_label << " (" << percent(voice.confidence)
                  << "), Visage: " << face_label << " (" << percent(face.confidence) << ")\n";
    }

    FusionVerdict verdict;
    verdict.exact_match = (voice_label == face_label);
    verdict.compatibility_score = matrix_.get(voice_label, face_label);

    EmotionDistribution merged;
    for (const auto& [emotion, prob] : voice.distribution.entries()) {
        merged.add(emotion, prob * w_v);
    }
    if (face.distribution.empty()) {
        merged.add(face_label, face.confidence * w_f);
    } else {
        for (const auto& [emotion, prob] : face.distribution.entries()) {
            merged.add(emotion, prob * w_f);
        }
    }

    auto best = merged.argmax();
    if (!best) {
        throw InputError("Fusion impossible: distribution fusionnée vide");
    }
    verdict.final_emotion = best->first;
    verdict.final_confidence = best->second;

    AgreementTier tier = classify(verdict.exact_match, verdict.compatibility_score);
    verdict.agreement_tier = tier;
    verdict.agreement_score = (tier == AgreementTier::STRONG) ? 1.0 : verdict.compatibility_score;
    verdict.explanation = explain(tier, voice_label, face_label, verdict.final_emotion);
    verdict.merged_distribution = std::move(merged);

    verdict.voice_prediction = voice;
    verdict.voice_prediction->label = voice_label;
    verdict.face_prediction = face;
    verdict.face_prediction->label = face_label;

    if (!quiet_mode_) {
        std::cout << "[FusionEngine] Résultat: " << verdict.final_emotion << " ("
                  << percent(verdict.final_confidence) << ") - accord "
                  << agreementToString(tier) << "\n";
    }

    return verdict;
}

AgreementTier FusionEngine::classify(bool exact_match, double compatibility) const {
    if (exact_match) {
        return AgreementTier::STRONG;
    }
    if (compatibility >= config_.moderate_threshold) {
        return AgreementTier::MODERATE;
    }
    if (compatibility >= config_.weak_threshold) {
        return AgreementTier::WEAK;
    }
    return AgreementTier::CONFLICT;
}

std::string FusionEngine::explain(AgreementTier tier, const std::string& voice,
                                  const std::string& face, const std::string& final_emotion) {
    switch (tier) {
        case AgreementTier::STRONG:
            if (final_emotion != voice) {
                return "Both voice and face models strongly agree on '" + voice +
                       "', final '" + final_emotion + "'";
            }
            return "Both voice and face models strongly agree on '" + final_emotion + "'";
        case AgreementTier::MODERATE:
            return "Voice detected '" + voice + "' and face detected '" + face +
                   "' - related emotions, final '" + final_emotion + "'";
        case AgreementTier::WEAK:
            return "Voice detected '" + voice + "' and face detected '" + face +
                   "' - partially related, final '" + final_emotion + "'";
        case AgreementTier::CONFLICT:
        default:
            return "Voice detected '" + voice + "' but face detected '" + face +
                   "' - conflicting emotions, final '" + final_emotion + "'";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RECOMMANDATION ET RÉSUMÉ
// ═══════════════════════════════════════════════════════════════════════════

std::string FusionEngine::recommendationEmotion(const FusionVerdict& verdict) const {
    if (verdict.agreement_tier == AgreementTier::CONFLICT &&
        verdict.final_confidence < config_.conflict_min_confidence) {
        if (!quiet_mode_) {
            std::cout << "[FusionEngine] Conflit à faible confiance ("
                      << percent(verdict.final_confidence) << ") → "
                      << config_.safe_default_emotion << "\n";
        }
        return config_.safe_default_emotion;
    }
    return verdict.final_emotion;
}

std::string FusionEngine::summary(const FusionVerdict& verdict) {
    std::ostringstream oss;
    const std::string final_upper = upper(verdict.final_emotion);
    const std::string confidence = "(confidence: " + percent(verdict.final_confidence) + ")";

    if (!verdict.agreement_tier) {
        const char* source = verdict.voice_prediction ? "Voice" : "Face";
        oss << source << " only: " << final_upper << " " << confidence;
        return oss.str();
    }

    const std::string voice = verdict.voice_prediction ? verdict.voice_prediction->label : "?";
    const std::string face = verdict.face_prediction ? verdict.face_prediction->label : "?";

    switch (*verdict.agreement_tier) {
        case AgreementTier::FUSION:
            oss << "Fusion model: " << verdict.final_emotion << " (" << percent(verdict.final_confidence) << ")";
            break;
        case AgreementTier::STRONG:
            oss << "Both models agree: " << final_upper << " " << confidence;
            break;
        case AgreementTier::MODERATE:
            oss << "Models show related emotions: Voice=" << voice << ", Face=" << face
                << " → Final: " << final_upper << " " << confidence;
            break;
        case AgreementTier::WEAK:
            oss << "Models show partially related emotions: Voice=" << voice << ", Face=" << face
                << " → Final: " << final_upper << " " << confidence;
            break;
        case AgreementTier::CONFLICT:
            oss << "Models show conflicting emotions: Voice=" << voice << " ("
                << percent(verdict.voice_prediction ? verdict.voice_prediction->confidence : 0.0)
                << "), Face=" << face << " ("
                << percent(verdict.face_prediction ? verdict.face_prediction->confidence : 0.0)
                << ") → Final: " << final_upper << " " << confidence;
            break;
    }
    return oss.str();
}

} // namespace mede
