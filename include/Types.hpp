/**
 * @file Types.hpp
 * @brief Types et structures de données du MEDE (Multimodal Emotion Decision Engine)
 * @version 1.0
 * @date 2026-01-12
 */

#ifndef MEDE_TYPES_HPP
#define MEDE_TYPES_HPP

#include "EmotionDistribution.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mede {

// Constantes du système
constexpr size_t NUM_EMOTIONS = 7;
constexpr int DEFAULT_SAMPLE_RATE = 16000;

/**
 * @brief Les 7 émotions canoniques, dans l'ordre canonique
 *
 * L'ordre sert aussi de règle de départage en cas d'égalité de probabilité.
 */
enum class EmotionLabel {
    ANGRY,
    DISGUST,
    FEAR,
    HAPPY,
    NEUTRAL,
    SAD,
    SURPRISE
};

/**
 * @brief Noms des émotions, indexés par EmotionLabel
 */
inline const std::array<std::string, NUM_EMOTIONS> EMOTION_NAMES = {
    "angry", "disgust", "fear", "happy", "neutral", "sad", "surprise"
};

inline std::string emotionToString(EmotionLabel label) {
    return EMOTION_NAMES[static_cast<size_t>(label)];
}

/**
 * @brief Normalise un libellé (minuscules, espaces retirés)
 */
std::string normalizeLabel(const std::string& label);

/**
 * @brief Convertit un libellé en émotion canonique
 *
 * Les alias du modèle facial (happiness, anger, sadness) sont acceptés.
 * @return std::nullopt si le libellé est hors des 7 émotions
 */
std::optional<EmotionLabel> parseEmotion(const std::string& label);

/**
 * @brief Libellé normalisé, alias faciaux ramenés au nom canonique
 *
 * Un libellé inconnu est conservé tel quel (clé opaque).
 */
std::string canonicalKey(const std::string& label);

/**
 * @brief Canal d'entrée d'une prédiction
 */
enum class Modality {
    VOICE,
    FACE,
    FUSION
};

inline std::string modalityToString(Modality modality) {
    switch (modality) {
        case Modality::VOICE:  return "voice";
        case Modality::FACE:   return "face";
        case Modality::FUSION: return "fusion";
        default:               return "unknown";
    }
}

/**
 * @brief Niveau d'accord entre les deux modalités
 */
enum class AgreementTier {
    STRONG,
    MODERATE,
    WEAK,
    CONFLICT,
    FUSION
};

inline std::string agreementToString(AgreementTier tier) {
    switch (tier) {
        case AgreementTier::STRONG:   return "strong";
        case AgreementTier::MODERATE: return "moderate";
        case AgreementTier::WEAK:     return "weak";
        case AgreementTier::CONFLICT: return "conflict";
        case AgreementTier::FUSION:   return "fusion";
        default:                      return "unknown";
    }
}

/**
 * @brief Chemin de résolution retenu par l'orchestrateur
 */
enum class ResolutionMode {
    NONE,
    FUSION,
    MULTIMODAL,
    VOICE_ONLY,
    FACE_ONLY
};

inline std::string modeToString(ResolutionMode mode) {
    switch (mode) {
        case ResolutionMode::NONE:       return "none";
        case ResolutionMode::FUSION:     return "fusion";
        case ResolutionMode::MULTIMODAL: return "multimodal";
        case ResolutionMode::VOICE_ONLY: return "voice-only";
        case ResolutionMode::FACE_ONLY:  return "face-only";
        default:                         return "unknown";
    }
}

/**
 * @brief Prédiction d'une modalité, immuable après création
 */
struct ModalityPrediction {
    std::string label;                       // Libellé normalisé
    double confidence = 0.0;                 // [0, 1]
    EmotionDistribution distribution;        // Peut être vide (masse ponctuelle)
    Modality modality = Modality::VOICE;
    std::optional<std::string> warning;      // Présent si prédiction de repli

    [[nodiscard]] std::optional<EmotionLabel> canonical() const { return parseEmotion(label); }
    [[nodiscard]] bool isFallback() const { return warning.has_value(); }
};

/**
 * @brief Diagnostics de qualité d'un buffer audio
 */
struct AudioQualityReport {
    double rms = 0.0;
    double peak = 0.0;
    double zero_crossing_rate = 0.0;
    double spectral_centroid = 0.0;          // Hz
    double speech_band_ratio = 0.0;          // Énergie [85, 4000] Hz / énergie totale
};

/**
 * @brief Buffer PCM mono décodé, échantillons dans [-1, 1]
 */
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate = DEFAULT_SAMPLE_RATE;

    [[nodiscard]] bool empty() const { return samples.empty(); }
    [[nodiscard]] double durationSeconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/**
 * @brief Image décodée (BGR, BGRA ou niveaux de gris), pixels entrelacés
 */
struct ImageFrame {
    int width = 0;
    int height = 0;
    int channels = 3;
    std::vector<uint8_t> pixels;

    [[nodiscard]] bool empty() const { return pixels.empty() || width <= 0 || height <= 0; }
    [[nodiscard]] bool isConsistent() const {
        return !empty() && channels > 0 &&
               pixels.size() == static_cast<size_t>(width) * height * channels;
    }
};

/**
 * @brief Verdict final d'un appel d'orchestration
 *
 * agreement_tier est absent pour les chemins mono-modalité.
 */
struct FusionVerdict {
    std::string final_emotion;
    double final_confidence = 0.0;
    std::optional<AgreementTier> agreement_tier;
    double agreement_score = 0.0;
    std::string explanation;
    EmotionDistribution merged_distribution;
    bool exact_match = false;
    double compatibility_score = 0.0;
    std::optional<ModalityPrediction> voice_prediction;
    std::optional<ModalityPrediction> face_prediction;
};

} // namespace mede

#endif // MEDE_TYPES_HPP
