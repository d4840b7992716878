/**
 * @file test_json_codec.cpp
 * @brief Tests du format JSON (requêtes, réponses des modèles, résultats)
 */

#include "TestHarness.hpp"
#include "JsonCodec.hpp"
#include "Errors.hpp"

using namespace mede;

// ═══════════════════════════════════════════════════════════════════════════
// REQUÊTES
// ═══════════════════════════════════════════════════════════════════════════

void test_request_decoded() {
    json j = {
        {"request_id", "abc-42"},
        {"audio", {{"sample_rate", 8000}, {"samples", {0.0, 0.5, -0.5}}}},
        {"image", {{"width", 2}, {"height", 1}, {"channels", 1}, {"pixels", {10, 200}}}}
    };

    auto request = requestFromJson(j);
    ASSERT_EQ(request.request_id, std::string("abc-42"));
    ASSERT_TRUE(request.hasAudio());
    ASSERT_EQ(request.audio->sample_rate, 8000);
    ASSERT_EQ(request.audio->samples.size(), static_cast<size_t>(3));
    ASSERT_NEAR(request.audio->samples[2], -0.5, 1e-6);
    ASSERT_TRUE(request.hasImage());
    ASSERT_EQ(request.image->pixels[1], 200);
    ASSERT_TRUE(request.frames.empty());
}

void test_request_defaults_and_nulls() {
    json j = {
        {"request_id", 17},
        {"audio", {{"samples", json::array({0.1})}}},
        {"image", nullptr}
    };

    auto request = requestFromJson(j);
    ASSERT_EQ(request.request_id, std::string("17"));
    ASSERT_EQ(request.audio->sample_rate, DEFAULT_SAMPLE_RATE);
    ASSERT_FALSE(request.image.has_value());
}

void test_request_frames_decoded() {
    json frame = imageToJson(makeTexturedFrame(4, 4));
    json j = {{"audio", audioToJson(makeTone(440.0, 0.5, 0.01))}, {"frames", {frame, frame, frame}}};

    auto request = requestFromJson(j);
    ASSERT_EQ(request.frames.size(), static_cast<size_t>(3));
    ASSERT_TRUE(request.frames[0].isConsistent());
    ASSERT_TRUE(request.hasVisual());
    ASSERT_FALSE(request.hasImage());
}

void test_malformed_request_rejected() {
    ASSERT_THROWS(requestFromJson(json::array()), InputError);
    ASSERT_THROWS(requestFromJson(json{{"frames", "oops"}}), InputError);
    ASSERT_THROWS(requestFromJson(json{{"audio", {{"samples", "noise"}}}}), InputError);
    ASSERT_THROWS(requestFromJson(json{{"audio", {{"samples", {0.1, "x"}}}}}), InputError);
    ASSERT_THROWS(requestFromJson(json{{"audio", {{"sample_rate", "fast"}}}}), InputError);
}

void test_invalid_image_rejected() {
    json out_of_range = {{"width", 1}, {"height", 1}, {"channels", 1}, {"pixels", json::array({300})}};
    ASSERT_THROWS(imageFromJson(out_of_range), InputError);

    json fractional = {{"width", 1}, {"height", 1}, {"channels", 1}, {"pixels", json::array({1.5})}};
    ASSERT_THROWS(imageFromJson(fractional), InputError);

    json wrong_dims = {{"width", 4}, {"height", 4}, {"channels", 3}, {"pixels", {1, 2, 3}}};
    ASSERT_THROWS(imageFromJson(wrong_dims), InputError);
}

void test_oversized_integers_not_truncated() {
    // 4294967301 = 2^32 + 5
    json wrapped_pixel = {{"width", 1}, {"height", 1}, {"channels", 1},
                          {"pixels", json::array({json(static_cast<uint64_t>(4294967301ULL))})}};
    ASSERT_THROWS(imageFromJson(wrapped_pixel), InputError);

    json huge_negative = {{"width", 1}, {"height", 1}, {"channels", 1},
                          {"pixels", json::array({json(static_cast<int64_t>(-4294967041LL))})}};
    ASSERT_THROWS(imageFromJson(huge_negative), InputError);

    json wrapped_width = {{"width", static_cast<uint64_t>(4294967297ULL)}, {"height", 1},
                          {"channels", 1}, {"pixels", json::array({json(7)})}};
    ASSERT_THROWS(imageFromJson(wrapped_width), InputError);

    ASSERT_THROWS(audioFromJson(json{{"sample_rate", static_cast<uint64_t>(4294983296ULL)},
                                     {"samples", json::array({json(0.1)})}}), InputError);

    json max_pixel = {{"width", 1}, {"height", 1}, {"channels", 1},
                      {"pixels", json::array({json(static_cast<uint64_t>(255))})}};
    ASSERT_EQ(imageFromJson(max_pixel).pixels[0], 255);
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉPONSES DES MODÈLES
// ═══════════════════════════════════════════════════════════════════════════

void test_flat_predictor_response() {
    json j = {
        {"success", true},
        {"emotion", "Happiness"},
        {"confidence", 0.82},
        {"all_emotions", {{"happiness", 0.82}, {"neutral", 0.18}}}
    };

    auto result = predictorResultFromJson(j);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.emotion, std::string("Happiness"));
    ASSERT_NEAR(result.confidence, 0.82, 1e-12);
    ASSERT_NEAR(result.distribution.get("happy"), 0.82, 1e-12);

    auto prediction = result.toPrediction(Modality::FACE);
    ASSERT_EQ(prediction.label, std::string("happy"));
}

void test_nested_predictor_response() {
    json j = {
        {"success", true},
        {"prediction", {{"emotion", "sad"}, {"confidence", 0.7}}},
        {"warning", "Low-information audio (TOO_QUIET), using neutral fallback"}
    };

    auto result = predictorResultFromJson(j);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.emotion, std::string("sad"));
    ASSERT_TRUE(result.distribution.empty());
    ASSERT_TRUE(result.warning.has_value());
}

void test_predictor_failure_response() {
    auto explicit_failure = predictorResultFromJson(json{{"success", false}, {"error", "No face detected"}});
    ASSERT_FALSE(explicit_failure.success);
    ASSERT_EQ(explicit_failure.error, std::string("No face detected"));

    auto no_emotion = predictorResultFromJson(json::object());
    ASSERT_FALSE(no_emotion.success);
    ASSERT_EQ(no_emotion.error, std::string("unknown predictor error"));
}

void test_invalid_predictor_response() {
    ASSERT_THROWS(predictorResultFromJson(json("text")), InferenceFailure);
    ASSERT_THROWS(predictorResultFromJson(json{{"success", true}}), InferenceFailure);
    ASSERT_THROWS(predictorResultFromJson(json{{"emotion", 3}}), InferenceFailure);
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉSULTATS
// ═══════════════════════════════════════════════════════════════════════════

void test_successful_result_json() {
    FusionVerdict verdict;
    verdict.final_emotion = "fear";
    verdict.final_confidence = 0.42;
    verdict.agreement_tier = AgreementTier::WEAK;
    verdict.agreement_score = 0.5;
    verdict.compatibility_score = 0.5;
    verdict.explanation = "Voice detected 'fear' and face detected 'sad'";
    verdict.merged_distribution = {{"neutral", 0.22}, {"sad", 0.36}, {"fear", 0.42}};

    ModalityPrediction voice;
    voice.label = "fear";
    voice.confidence = 0.7;
    verdict.voice_prediction = voice;

    AnalysisResult result;
    result.success = true;
    result.request_id = "r-1";
    result.mode = ResolutionMode::MULTIMODAL;
    result.verdict = verdict;
    result.recommendation_emotion = "fear";
    result.valence = -0.6;
    result.arousal = 0.68;
    result.summary = "summary line";
    result.warnings.push_back("Face detection failed, using neutral fallback");

    json j = toJson(result);
    ASSERT_TRUE(j["success"].get<bool>());
    ASSERT_EQ(j["mode"].get<std::string>(), std::string("multimodal"));
    ASSERT_EQ(j["request_id"].get<std::string>(), std::string("r-1"));
    ASSERT_EQ(j["agreement"].get<std::string>(), std::string("weak"));
    ASSERT_EQ(j["final_emotion"].get<std::string>(), std::string("fear"));
    ASSERT_EQ(j["summary"].get<std::string>(), std::string("summary line"));
    ASSERT_EQ(j["display"]["emoji"].get<std::string>(), std::string("😨"));
    ASSERT_EQ(j["error_kind"].get<std::string>(), std::string("NONE"));
    ASSERT_FALSE(j.contains("error"));
    ASSERT_EQ(j["warnings"].size(), static_cast<size_t>(1));
    ASSERT_TRUE(j["face_prediction"].is_null());
    ASSERT_EQ(j["voice_prediction"]["all_emotions"]["fear"].get<double>(), 0.7);

    const auto& merged = j["merged_probabilities"];
    ASSERT_EQ(merged.size(), static_cast<size_t>(3));
    ASSERT_EQ(merged[0]["emotion"].get<std::string>(), std::string("fear"));
    ASSERT_EQ(merged[1]["emotion"].get<std::string>(), std::string("sad"));
    ASSERT_EQ(merged[2]["emotion"].get<std::string>(), std::string("neutral"));
}

void test_failure_result_json() {
    AnalysisResult result;
    result.error_kind = ErrorKind::NO_USABLE_INPUT;
    result.error = "No usable input: provide audio and/or an image";

    json j = toJson(result);
    ASSERT_FALSE(j["success"].get<bool>());
    ASSERT_EQ(j["mode"].get<std::string>(), std::string("none"));
    ASSERT_EQ(j["error_kind"].get<std::string>(), std::string("NO_USABLE_INPUT"));
    ASSERT_EQ(j["error"].get<std::string>(), result.error);
    ASSERT_FALSE(j.contains("final_emotion"));
    ASSERT_FALSE(j.contains("request_id"));
    ASSERT_TRUE(j["warnings"].empty());
}

void test_quality_verdict_json() {
    AudioQualityVerdict verdict;
    verdict.report.rms = 0.01;
    verdict.issue = AudioQualityIssue::TOO_QUIET;

    json j = toJson(verdict);
    ASSERT_FALSE(j["is_reliable"].get<bool>());
    ASSERT_EQ(j["issue"].get<std::string>(), std::string("TOO_QUIET"));
    ASSERT_NEAR(j["rms"].get<double>(), 0.01, 1e-12);
}

int main() {
    std::cout << "\n═══ JsonCodec ═══\n";

    RUN_TEST(request_decoded);
    RUN_TEST(request_defaults_and_nulls);
    RUN_TEST(request_frames_decoded);
    RUN_TEST(malformed_request_rejected);
    RUN_TEST(invalid_image_rejected);
    RUN_TEST(oversized_integers_not_truncated);
    RUN_TEST(flat_predictor_response);
    RUN_TEST(nested_predictor_response);
    RUN_TEST(predictor_failure_response);
    RUN_TEST(invalid_predictor_response);
    RUN_TEST(successful_result_json);
    RUN_TEST(failure_result_json);
    RUN_TEST(quality_verdict_json);

    return printSummary("JsonCodec");
}
