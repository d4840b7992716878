/**
 * @file EngineConfig.cpp
 * @brief Chargement et export JSON de la configuration
 * @version 1.0
 * @date 2026-01-12
 */

#include "EngineConfig.hpp"
#include "Errors.hpp"
#include <fstream>
#include <iostream>

namespace mede {

FusionWeights::FusionWeights(double voice, double face) {
    if (voice < 0.0 || face < 0.0) {
        throw ConfigError("Poids de fusion négatif (voix=" + std::to_string(voice) +
                          ", visage=" + std::to_string(face) + ")");
    }
    double total = voice + face;
    if (total <= 0.0) {
        throw ConfigError("Somme des poids de fusion nulle");
    }
    voice_ = voice / total;
    face_ = face / total;
}

bool EngineConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Fichier introuvable: " << path << ", valeurs par défaut conservées\n";
        return false;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("JSON invalide dans " + path + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "[Config] Configuration chargée depuis " << path << "\n";
    return true;
}

void EngineConfig::loadFromJson(const json& j) {
    try {
        if (j.contains("quality_gate")) {
            const auto& q = j["quality_gate"];
            quality_gate.min_duration_s = q.value("min_duration_s", quality_gate.min_duration_s);
            quality_gate.min_rms = q.value("min_rms", quality_gate.min_rms);
            quality_gate.min_peak = q.value("min_peak", quality_gate.min_peak);
            quality_gate.speech_band_low_hz = q.value("speech_band_low_hz", quality_gate.speech_band_low_hz);
            quality_gate.speech_band_high_hz = q.value("speech_band_high_hz", quality_gate.speech_band_high_hz);
            quality_gate.min_speech_band_ratio = q.value("min_speech_band_ratio", quality_gate.min_speech_band_ratio);
            quality_gate.min_zero_crossing_rate = q.value("min_zero_crossing_rate", quality_gate.min_zero_crossing_rate);
            quality_gate.min_spectral_centroid_hz = q.value("min_spectral_centroid_hz", quality_gate.min_spectral_centroid_hz);
            quality_gate.zcr_frame_length = q.value("zcr_frame_length", quality_gate.zcr_frame_length);
            quality_gate.zcr_hop_length = q.value("zcr_hop_length", quality_gate.zcr_hop_length);
            quality_gate.fallback_confidence = q.value("fallback_confidence", quality_gate.fallback_confidence);
            quality_gate.too_short_confidence = q.value("too_short_confidence", quality_gate.too_short_confidence);

            if (quality_gate.zcr_frame_length == 0 || quality_gate.zcr_hop_length == 0) {
                throw ConfigError("quality_gate: zcr_frame_length et zcr_hop_length doivent être > 0");
            }
        }

        if (j.contains("frame_gate")) {
            const auto& f = j["frame_gate"];
            frame_gate.enabled = f.value("enabled", frame_gate.enabled);
            frame_gate.min_pixel_stddev = f.value("min_pixel_stddev", frame_gate.min_pixel_stddev);
        }

        if (j.contains("fusion")) {
            const auto& f = j["fusion"];
            double voice_weight = f.value("voice_weight", fusion.weights.voice());
            double face_weight = f.value("face_weight", fusion.weights.face());
            fusion.weights = FusionWeights(voice_weight, face_weight);
            fusion.moderate_threshold = f.value("moderate_threshold", fusion.moderate_threshold);
            fusion.weak_threshold = f.value("weak_threshold", fusion.weak_threshold);
            fusion.conflict_min_confidence = f.value("conflict_min_confidence", fusion.conflict_min_confidence);
            fusion.safe_default_emotion = f.value("safe_default_emotion", fusion.safe_default_emotion);

            if (fusion.weak_threshold > fusion.moderate_threshold) {
                throw ConfigError("fusion: weak_threshold doit être <= moderate_threshold");
            }
        }

        if (j.contains("face_fallback")) {
            const auto& f = j["face_fallback"];
            face_fallback.emotion = f.value("emotion", face_fallback.emotion);
            face_fallback.confidence = f.value("confidence", face_fallback.confidence);
        }

        if (j.contains("orchestrator")) {
            const auto& o = j["orchestrator"];
            orchestrator.max_fusion_frames = o.value("max_fusion_frames", orchestrator.max_fusion_frames);
            orchestrator.use_middle_frame_for_face = o.value("use_middle_frame_for_face", orchestrator.use_middle_frame_for_face);
        }

        if (j.contains("predictors")) {
            const auto& p = j["predictors"];
            auto loadEndpoint = [&p](const char* name, PredictorEndpoint& endpoint) {
                if (!p.contains(name)) return;
                const auto& e = p[name];
                endpoint.url = e.value("url", endpoint.url);
                endpoint.timeout_seconds = e.value("timeout_seconds", endpoint.timeout_seconds);
            };
            loadEndpoint("voice", predictors.voice);
            loadEndpoint("face", predictors.face);
            loadEndpoint("fusion", predictors.fusion);
            predictors.fusion_status_url = p.value("fusion_status_url", predictors.fusion_status_url);
            predictors.fusion_status_poll_seconds = p.value("fusion_status_poll_seconds", predictors.fusion_status_poll_seconds);
            if (predictors.fusion_status_poll_seconds < 0) {
                throw ConfigError("predictors: fusion_status_poll_seconds doit être >= 0");
            }
        }

        if (j.contains("rabbitmq")) {
            const auto& r = j["rabbitmq"];
            rabbitmq.host = r.value("host", rabbitmq.host);
            rabbitmq.port = r.value("port", rabbitmq.port);
            rabbitmq.user = r.value("user", rabbitmq.user);
            rabbitmq.password = r.value("password", rabbitmq.password);
            rabbitmq.request_queue = r.value("request_queue", rabbitmq.request_queue);
            rabbitmq.verdict_exchange = r.value("verdict_exchange", rabbitmq.verdict_exchange);
            rabbitmq.verdict_routing_prefix = r.value("verdict_routing_prefix", rabbitmq.verdict_routing_prefix);
            rabbitmq.consume_timeout_ms = r.value("consume_timeout_ms", rabbitmq.consume_timeout_ms);
            rabbitmq.prefetch_count = r.value("prefetch_count", rabbitmq.prefetch_count);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Valeur de configuration invalide: ") + e.what());
    }
}

json EngineConfig::toJson() const {
    json j;

    j["quality_gate"] = {
        {"min_duration_s", quality_gate.min_duration_s},
        {"min_rms", quality_gate.min_rms},
        {"min_peak", quality_gate.min_peak},
        {"speech_band_low_hz", quality_gate.speech_band_low_hz},
        {"speech_band_high_hz", quality_gate.speech_band_high_hz},
        {"min_speech_band_ratio", quality_gate.min_speech_band_ratio},
        {"min_zero_crossing_rate", quality_gate.min_zero_crossing_rate},
        {"min_spectral_centroid_hz", quality_gate.min_spectral_centroid_hz},
        {"zcr_frame_length", quality_gate.zcr_frame_length},
        {"zcr_hop_length", quality_gate.zcr_hop_length},
        {"fallback_confidence", quality_gate.fallback_confidence},
        {"too_short_confidence", quality_gate.too_short_confidence}
    };

    j["frame_gate"] = {
        {"enabled", frame_gate.enabled},
        {"min_pixel_stddev", frame_gate.min_pixel_stddev}
    };

    j["fusion"] = {
        {"voice_weight", fusion.weights.voice()},
        {"face_weight", fusion.weights.face()},
        {"moderate_threshold", fusion.moderate_threshold},
        {"weak_threshold", fusion.weak_threshold},
        {"conflict_min_confidence", fusion.conflict_min_confidence},
        {"safe_default_emotion", fusion.safe_default_emotion}
    };

    j["face_fallback"] = {
        {"emotion", face_fallback.emotion},
        {"confidence", face_fallback.confidence}
    };

    j["orchestrator"] = {
        {"max_fusion_frames", orchestrator.max_fusion_frames},
        {"use_middle_frame_for_face", orchestrator.use_middle_frame_for_face}
    };

    auto endpointJson = [](const PredictorEndpoint& e) {
        return json{{"url", e.url}, {"timeout_seconds", e.timeout_seconds}};
    };
    j["predictors"] = {
        {"voice", endpointJson(predictors.voice)},
        {"face", endpointJson(predictors.face)},
        {"fusion", endpointJson(predictors.fusion)},
        {"fusion_status_url", predictors.fusion_status_url},
        {"fusion_status_poll_seconds", predictors.fusion_status_poll_seconds}
    };

    // Le mot de passe n'est jamais réécrit en clair
    j["rabbitmq"] = {
        {"host", rabbitmq.host},
        {"port", rabbitmq.port},
        {"user", rabbitmq.user},
        {"password", "***"},
        {"request_queue", rabbitmq.request_queue},
        {"verdict_exchange", rabbitmq.verdict_exchange},
        {"verdict_routing_prefix", rabbitmq.verdict_routing_prefix},
        {"consume_timeout_ms", rabbitmq.consume_timeout_ms},
        {"prefetch_count", rabbitmq.prefetch_count}
    };

    return j;
}

} // namespace mede
