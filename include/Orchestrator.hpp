/**
 * @file Orchestrator.hpp
 * @brief Arbre de décision : fusion apprise, fusion par règles ou modalité seule
 * @version 1.0
 * @date 2026-01-12
 *
 * Ordre de priorité (la première branche applicable gagne) :
 *   1. Ni audio ni image       → échec NO_USABLE_INPUT
 *   2. Modèle de fusion chargé + audio + ≥1 trame → verdict du modèle (mode fusion)
 *   3. Voix et visage réussis  → FusionEngine (mode multimodal)
 *   4. Voix seule              → prédiction vocale telle quelle
 *   5. Visage seul             → prédiction faciale telle quelle
 *
 * Politique asymétrique : un échec facial n'est jamais terminal (repli
 * neutre avec avertissement), un échec vocal est reporté comme tel.
 */

#ifndef MEDE_ORCHESTRATOR_HPP
#define MEDE_ORCHESTRATOR_HPP

#include "Types.hpp"
#include "Errors.hpp"
#include "EngineConfig.hpp"
#include "AudioQualityGate.hpp"
#include "FrameQualityGate.hpp"
#include "FusionEngine.hpp"
#include "Predictors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mede {

/**
 * @brief Requête d'analyse : audio, image fixe et/ou trames vidéo
 */
struct AnalysisRequest {
    std::optional<AudioBuffer> audio;
    std::optional<ImageFrame> image;
    std::vector<ImageFrame> frames;
    std::string request_id;

    [[nodiscard]] bool hasAudio() const { return audio.has_value() && !audio->empty(); }
    [[nodiscard]] bool hasImage() const { return image.has_value() && !image->empty(); }
    [[nodiscard]] bool hasVisual() const { return hasImage() || !frames.empty(); }
};

/**
 * @brief Résultat d'orchestration, transmis par valeur à l'appelant
 */
struct AnalysisResult {
    bool success = false;
    std::string request_id;
    ResolutionMode mode = ResolutionMode::NONE;
    std::optional<FusionVerdict> verdict;

    std::string recommendation_emotion;
    double valence = 0.0;
    double arousal = 0.0;
    std::string summary;

    std::optional<AudioQualityVerdict> quality;
    std::vector<std::string> warnings;

    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;
    std::optional<std::string> voice_error;     // Échec vocal masqué par un repli facial
};

/**
 * @class Orchestrator
 * @brief Exécute la chaîne de décision de bout en bout sur le thread appelant
 *
 * Les prédicteurs sont injectés (pointeurs non possédés, nullptr = absent)
 * et doivent survivre à l'orchestrateur.
 */
class Orchestrator {
public:
    Orchestrator(const EngineConfig& config,
                 VoicePredictor* voice,
                 FacePredictor* face,
                 FusionPredictor* fusion = nullptr);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Analyse une requête, ne lève jamais pour un désaccord ou un échec facial
     */
    [[nodiscard]] AnalysisResult analyze(const AnalysisRequest& request);

    [[nodiscard]] const FusionEngine& fusionEngine() const { return fusion_engine_; }
    [[nodiscard]] const AudioQualityGate& audioGate() const { return audio_gate_; }
    [[nodiscard]] const EngineConfig& config() const { return config_; }

    void setQuietMode(bool quiet);
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    /**
     * @brief Issue de la branche vocale
     */
    struct VoiceOutcome {
        std::optional<ModalityPrediction> prediction;
        ErrorKind error_kind = ErrorKind::NONE;
        std::string error;
    };

    EngineConfig config_;
    AudioQualityGate audio_gate_;
    FrameQualityGate frame_gate_;
    FusionEngine fusion_engine_;

    VoicePredictor* voice_;
    FacePredictor* face_;
    FusionPredictor* fusion_;

    bool quiet_mode_ = false;

    [[nodiscard]] std::optional<FusionVerdict> tryLearnedFusion(const AnalysisRequest& request);
    [[nodiscard]] VoiceOutcome runVoice(const AudioBuffer& audio, AnalysisResult& result);
    [[nodiscard]] ModalityPrediction runFace(const AnalysisRequest& request);
    [[nodiscard]] ModalityPrediction faceFallback(const std::string& warning) const;
    [[nodiscard]] std::vector<ImageFrame> selectFusionFrames(const AnalysisRequest& request) const;
    [[nodiscard]] const ImageFrame& selectFaceFrame(const AnalysisRequest& request) const;

    [[nodiscard]] static FusionVerdict singleModalityVerdict(const ModalityPrediction& prediction);
    void finalize(AnalysisResult& result) const;
    void log(const std::string& message) const;
};

} // namespace mede

#endif // MEDE_ORCHESTRATOR_HPP
