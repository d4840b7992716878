/**
 * @file AudioQualityGate.hpp
 * @brief Porte de qualité audio : décide si un buffer mérite l'inférence vocale
 * @version 1.0
 * @date 2026-01-12
 *
 * Le buffer n'est jamais transformé. La porte produit un diagnostic
 * (AudioQualityReport), un verdict de fiabilité et, si l'audio est peu
 * informatif, une prédiction de repli à faible confiance biaisée vers neutral.
 */

#ifndef MEDE_AUDIO_QUALITY_GATE_HPP
#define MEDE_AUDIO_QUALITY_GATE_HPP

#include "Types.hpp"
#include "EngineConfig.hpp"
#include <optional>
#include <string>

namespace mede {

/**
 * @brief Raison d'un audio jugé peu fiable
 */
enum class AudioQualityIssue {
    NONE,
    TOO_SHORT,          // < 250 ms, analyse spectrale ignorée
    TOO_QUIET,          // RMS ou pic trop faible
    LOW_SPEECH_BAND,    // Peu d'énergie dans [85, 4000] Hz
    NO_VARIATION        // Offset DC, ronflement bande étroite
};

inline std::string issueToString(AudioQualityIssue issue) {
    switch (issue) {
        case AudioQualityIssue::NONE:            return "NONE";
        case AudioQualityIssue::TOO_SHORT:       return "TOO_SHORT";
        case AudioQualityIssue::TOO_QUIET:       return "TOO_QUIET";
        case AudioQualityIssue::LOW_SPEECH_BAND: return "LOW_SPEECH_BAND";
        case AudioQualityIssue::NO_VARIATION:    return "NO_VARIATION";
        default:                                 return "UNKNOWN";
    }
}

struct AudioQualityVerdict {
    AudioQualityReport report;
    bool is_reliable = false;
    AudioQualityIssue issue = AudioQualityIssue::NONE;
    std::optional<ModalityPrediction> fallback;    // Présent ssi !is_reliable
};

/**
 * @class AudioQualityGate
 * @brief Fonction pure sur un buffer PCM mono
 */
class AudioQualityGate {
public:
    explicit AudioQualityGate(const QualityGateConfig& config = QualityGateConfig{});

    /**
     * @brief Évalue un buffer audio
     * @throws InputError si le buffer est vide ou le taux d'échantillonnage invalide
     */
    [[nodiscard]] AudioQualityVerdict evaluate(const AudioBuffer& audio) const;

    /**
     * @brief Calcule les diagnostics complets (temporels et spectraux)
     */
    [[nodiscard]] AudioQualityReport analyze(const AudioBuffer& audio) const;

    /**
     * @brief Distribution de repli : neutral = confidence, happy/sad 0.15, autres 0.10
     */
    [[nodiscard]] static ModalityPrediction fallbackPrediction(double confidence,
                                                               const std::string& warning);

    /**
     * @brief Plus grande longueur <= n dont les seuls facteurs premiers sont 2, 3 et 5
     *
     * Le spectre est calculé sur les `fftLength(n)` premiers échantillons :
     * kissfft n'a de papillons rapides que pour ces radix.
     */
    [[nodiscard]] static size_t fftLength(size_t n);

    [[nodiscard]] const QualityGateConfig& config() const { return config_; }

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    QualityGateConfig config_;
    bool quiet_mode_ = false;

    [[nodiscard]] AudioQualityIssue classify(const AudioQualityReport& report) const;
    [[nodiscard]] double zeroCrossingRate(const std::vector<float>& samples) const;
    void spectralFeatures(const AudioBuffer& audio, AudioQualityReport& report) const;
};

} // namespace mede

#endif // MEDE_AUDIO_QUALITY_GATE_HPP
