/**
 * @file JsonCodec.cpp
 * @brief Encodage et décodage JSON du service
 * @version 1.0
 * @date 2026-01-12
 */

#include "JsonCodec.hpp"
#include "EmotionCatalog.hpp"
#include "Errors.hpp"
#include <climits>
#include <cstdint>

namespace mede {

// ═══════════════════════════════════════════════════════════════════════════
// ENCODAGE
// ═══════════════════════════════════════════════════════════════════════════

json toJson(const EmotionDistribution& distribution) {
    json j = json::object();
    for (const auto& [emotion, prob] : distribution.entries()) {
        j[emotion] = prob;
    }
    return j;
}

json toSortedJson(const EmotionDistribution& distribution) {
    json j = json::array();
    for (const auto& [emotion, prob] : distribution.sortedByProbability()) {
        j.push_back({{"emotion", emotion}, {"probability", prob}});
    }
    return j;
}

json toJson(const ModalityPrediction& prediction) {
    json j;
    j["emotion"] = prediction.label;
    j["confidence"] = prediction.confidence;
    j["modality"] = modalityToString(prediction.modality);

    if (prediction.distribution.empty()) {
        j["all_emotions"] = {{prediction.label, prediction.confidence}};
    } else {
        j["all_emotions"] = toJson(prediction.distribution);
    }

    if (prediction.warning) {
        j["warning"] = *prediction.warning;
    }
    return j;
}

json toJson(const AudioQualityReport& report) {
    return {
        {"rms", report.rms},
        {"peak", report.peak},
        {"zero_crossing_rate", report.zero_crossing_rate},
        {"spectral_centroid", report.spectral_centroid},
        {"speech_band_ratio", report.speech_band_ratio}
    };
}

json toJson(const AudioQualityVerdict& verdict) {
    json j = toJson(verdict.report);
    j["is_reliable"] = verdict.is_reliable;
    j["issue"] = issueToString(verdict.issue);
    return j;
}

json toJson(const FusionVerdict& verdict) {
    json j;
    j["final_emotion"] = verdict.final_emotion;
    j["final_confidence"] = verdict.final_confidence;
    j["agreement"] = verdict.agreement_tier ? json(agreementToString(*verdict.agreement_tier)) : json(nullptr);
    j["agreement_score"] = verdict.agreement_score;
    j["explanation"] = verdict.explanation;
    j["merged_probabilities"] = toSortedJson(verdict.merged_distribution);
    j["emotions_match"] = verdict.exact_match;
    j["compatibility"] = verdict.compatibility_score;
    j["voice_prediction"] = verdict.voice_prediction ? toJson(*verdict.voice_prediction) : json(nullptr);
    j["face_prediction"] = verdict.face_prediction ? toJson(*verdict.face_prediction) : json(nullptr);
    j["summary"] = FusionEngine::summary(verdict);
    return j;
}

json toJson(const AnalysisResult& result) {
    json j = json::object();

    if (result.verdict) {
        j = toJson(*result.verdict);
    }

    j["success"] = result.success;
    j["mode"] = modeToString(result.mode);
    if (!result.request_id.empty()) {
        j["request_id"] = result.request_id;
    }

    if (result.success) {
        const auto& info = emotionInfo(result.recommendation_emotion);
        j["recommendation_emotion"] = result.recommendation_emotion;
        j["valence"] = result.valence;
        j["arousal"] = result.arousal;
        j["summary"] = result.summary;
        j["display"] = {
            {"emoji", info.emoji},
            {"color", info.color},
            {"description", info.description}
        };
    } else {
        j["error"] = result.error;
    }
    j["error_kind"] = errorKindToString(result.error_kind);

    if (result.quality) {
        j["quality"] = toJson(*result.quality);
    }
    j["warnings"] = result.warnings;
    if (result.voice_error) {
        j["voice_error"] = *result.voice_error;
    }
    return j;
}

json audioToJson(const AudioBuffer& audio) {
    return {
        {"sample_rate", audio.sample_rate},
        {"samples", audio.samples}
    };
}

json imageToJson(const ImageFrame& image) {
    return {
        {"width", image.width},
        {"height", image.height},
        {"channels", image.channels},
        {"pixels", image.pixels}
    };
}

namespace {

// Entier JSON lu sans troncature : un non signé au-delà de INT_MAX est rejeté
int intField(const json& j, const char* key, const char* context, int fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& v = j[key];
    if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(INT_MAX)) {
        throw InputError(std::string(context) + "." + key + ": entier hors limites");
    }
    if (v.is_number_integer() && !v.is_number_unsigned()) {
        auto value = v.get<int64_t>();
        if (value > INT_MAX || value < INT_MIN) {
            throw InputError(std::string(context) + "." + key + ": entier hors limites");
        }
    }
    return v.get<int>();
}

bool isByte(const json& p) {
    if (p.is_number_unsigned()) {
        return p.get<uint64_t>() <= 255;
    }
    auto value = p.get<int64_t>();
    return value >= 0 && value <= 255;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// DÉCODAGE
// ═══════════════════════════════════════════════════════════════════════════

AudioBuffer audioFromJson(const json& j) {
    if (!j.is_object()) {
        throw InputError("audio: objet attendu");
    }

    AudioBuffer audio;
    try {
        audio.sample_rate = intField(j, "sample_rate", "audio", DEFAULT_SAMPLE_RATE);
        if (j.contains("samples")) {
            const auto& samples = j["samples"];
            if (!samples.is_array()) {
                throw InputError("audio.samples: tableau attendu");
            }
            audio.samples.reserve(samples.size());
            for (const auto& s : samples) {
                if (!s.is_number()) {
                    throw InputError("audio.samples: valeur non numérique");
                }
                audio.samples.push_back(s.get<float>());
            }
        }
    } catch (const json::exception& e) {
        throw InputError(std::string("audio invalide: ") + e.what());
    }
    return audio;
}

ImageFrame imageFromJson(const json& j) {
    if (!j.is_object()) {
        throw InputError("image: objet attendu");
    }

    ImageFrame image;
    try {
        image.width = intField(j, "width", "image", 0);
        image.height = intField(j, "height", "image", 0);
        image.channels = intField(j, "channels", "image", 3);

        if (j.contains("pixels")) {
            const auto& pixels = j["pixels"];
            if (!pixels.is_array()) {
                throw InputError("image.pixels: tableau attendu");
            }
            image.pixels.reserve(pixels.size());
            for (const auto& p : pixels) {
                if (!p.is_number_integer()) {
                    throw InputError("image.pixels: entier attendu");
                }
                if (!isByte(p)) {
                    throw InputError("image.pixels: valeur hors [0, 255]");
                }
                image.pixels.push_back(static_cast<uint8_t>(p.get<int>()));
            }
        }
    } catch (const json::exception& e) {
        throw InputError(std::string("image invalide: ") + e.what());
    }

    if (!image.pixels.empty() && !image.isConsistent()) {
        throw InputError("image: " + std::to_string(image.pixels.size()) +
                         " pixels pour " + std::to_string(image.width) + "x" +
                         std::to_string(image.height) + "x" + std::to_string(image.channels));
    }
    return image;
}

AnalysisRequest requestFromJson(const json& j) {
    if (!j.is_object()) {
        throw InputError("Requête: objet JSON attendu");
    }

    AnalysisRequest request;

    if (j.contains("request_id")) {
        const auto& id = j["request_id"];
        request.request_id = id.is_string() ? id.get<std::string>() : id.dump();
    }
    if (j.contains("audio") && !j["audio"].is_null()) {
        request.audio = audioFromJson(j["audio"]);
    }
    if (j.contains("image") && !j["image"].is_null()) {
        request.image = imageFromJson(j["image"]);
    }
    if (j.contains("frames") && !j["frames"].is_null()) {
        const auto& frames = j["frames"];
        if (!frames.is_array()) {
            throw InputError("frames: tableau attendu");
        }
        for (const auto& frame : frames) {
            request.frames.push_back(imageFromJson(frame));
        }
    }
    return request;
}

PredictorResult predictorResultFromJson(const json& j) {
    if (!j.is_object()) {
        throw InferenceFailure("Réponse du prédicteur: objet JSON attendu");
    }

    try {
        const json& p = (j.contains("prediction") && j["prediction"].is_object()) ? j["prediction"] : j;

        bool success = j.value("success", p.contains("emotion"));
        if (!success) {
            return PredictorResult::failure(j.value("error", std::string("unknown predictor error")));
        }

        PredictorResult result;
        result.success = true;
        result.emotion = p.at("emotion").get<std::string>();
        result.confidence = p.value("confidence", 0.0);

        if (p.contains("all_emotions") && p["all_emotions"].is_object()) {
            for (const auto& [emotion, prob] : p["all_emotions"].items()) {
                result.distribution.add(emotion, prob.get<double>());
            }
        }

        if (j.contains("warning") && j["warning"].is_string()) {
            result.warning = j["warning"].get<std::string>();
        }
        return result;
    } catch (const json::exception& e) {
        throw InferenceFailure(std::string("Réponse du prédicteur invalide: ") + e.what());
    }
}

} // namespace mede
