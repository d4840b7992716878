/**
 * @file EngineConfig.hpp
 * @brief Configuration du moteur de décision émotionnelle multimodale
 * @version 1.0
 * @date 2026-01-12
 *
 * Tous les seuils sont des valeurs empiriques, conservées comme défauts
 * configurables. Chargement optionnel depuis un fichier JSON dont chaque
 * clé est facultative.
 */

#ifndef MEDE_ENGINE_CONFIG_HPP
#define MEDE_ENGINE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace mede {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// PORTE DE QUALITÉ AUDIO
// ═══════════════════════════════════════════════════════════════════════════

struct QualityGateConfig {
    double min_duration_s = 0.25;              // En dessous : trop court, pas d'analyse spectrale

    // Silence / volume trop faible
    double min_rms = 0.05;
    double min_peak = 0.15;

    // Énergie dans la bande de la parole
    double speech_band_low_hz = 85.0;
    double speech_band_high_hz = 4000.0;
    double min_speech_band_ratio = 0.05;

    // Absence de variation (offset DC, ronflement)
    double min_zero_crossing_rate = 0.01;
    double min_spectral_centroid_hz = 80.0;

    // Trames du taux de passage par zéro
    size_t zcr_frame_length = 1024;
    size_t zcr_hop_length = 512;

    // Confiances des distributions de repli
    double fallback_confidence = 0.25;
    double too_short_confidence = 0.20;
};

// ═══════════════════════════════════════════════════════════════════════════
// PORTE DE QUALITÉ IMAGE (détection d'image factice)
// ═══════════════════════════════════════════════════════════════════════════

struct FrameGateConfig {
    bool enabled = true;
    double min_pixel_stddev = 10.0;            // Image quasi uniforme = pas de caméra
};

// ═══════════════════════════════════════════════════════════════════════════
// FUSION
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @class FusionWeights
 * @brief Poids voix/visage, normalisés à la construction (somme = 1)
 */
class FusionWeights {
public:
    /**
     * @throws ConfigError si un poids est négatif ou si la somme est nulle
     */
    FusionWeights(double voice = 0.6, double face = 0.4);

    [[nodiscard]] double voice() const { return voice_; }
    [[nodiscard]] double face() const { return face_; }

private:
    double voice_;
    double face_;
};

struct FusionConfig {
    FusionWeights weights;

    double moderate_threshold = 0.6;           // compatibilité >= : accord modéré
    double weak_threshold = 0.3;               // compatibilité >= : accord faible

    // Conflit + confiance finale sous ce seuil → émotion de recommandation par défaut
    double conflict_min_confidence = 0.4;
    std::string safe_default_emotion = "neutral";
};

struct FaceFallbackConfig {
    std::string emotion = "neutral";
    double confidence = 0.3;
};

struct OrchestratorConfig {
    size_t max_fusion_frames = 16;             // Trames transmises au modèle de fusion
    bool use_middle_frame_for_face = true;     // Sans image fixe : trame du milieu
};

// ═══════════════════════════════════════════════════════════════════════════
// SERVICES EXTERNES
// ═══════════════════════════════════════════════════════════════════════════

struct PredictorEndpoint {
    std::string url;                           // Vide = prédicteur non configuré
    long timeout_seconds = 30;
};

struct PredictorEndpoints {
    PredictorEndpoint voice{"http://localhost:8001/predict/voice", 30};
    PredictorEndpoint face{"http://localhost:8002/predict/face", 15};
    PredictorEndpoint fusion{"", 60};
    std::string fusion_status_url;             // GET → {"fusion_model_available": bool}
    int fusion_status_poll_seconds = 30;       // 0 = interrogé au démarrage seulement
};

struct RabbitMQConfig {
    std::string host = "localhost";
    int port = 5672;
    std::string user = "guest";
    std::string password = "guest";

    std::string request_queue = "mede.analysis.requests";
    std::string verdict_exchange = "mede.verdicts";
    std::string verdict_routing_prefix = "verdict";

    int consume_timeout_ms = 500;
    int prefetch_count = 1;
};

// ═══════════════════════════════════════════════════════════════════════════
// CONFIGURATION GLOBALE
// ═══════════════════════════════════════════════════════════════════════════

struct EngineConfig {
    QualityGateConfig quality_gate;
    FrameGateConfig frame_gate;
    FusionConfig fusion;
    FaceFallbackConfig face_fallback;
    OrchestratorConfig orchestrator;
    PredictorEndpoints predictors;
    RabbitMQConfig rabbitmq;

    /**
     * @brief Charge la configuration depuis un fichier JSON
     * @param path Chemin du fichier
     * @return false si le fichier est absent (défauts conservés)
     * @throws ConfigError si le fichier est illisible ou invalide
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief Applique les clés présentes dans un document JSON
     * @throws ConfigError si une valeur a un type invalide
     */
    void loadFromJson(const json& j);

    /**
     * @brief Configuration effective en JSON
     */
    [[nodiscard]] json toJson() const;
};

} // namespace mede

#endif // MEDE_ENGINE_CONFIG_HPP
