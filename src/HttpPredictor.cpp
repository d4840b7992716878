/**
 * @file HttpPredictor.cpp
 * @brief Implémentation des prédicteurs HTTP
 * @version 1.0
 * @date 2026-01-12
 */

#include "HttpPredictor.hpp"
#include "JsonCodec.hpp"
#include "Errors.hpp"
#include <curl/curl.h>
#include <iostream>

namespace mede {

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS CURL
// ═══════════════════════════════════════════════════════════════════════════

namespace {

size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

class CurlGlobalInit {
public:
    CurlGlobalInit() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInit() {
        curl_global_cleanup();
    }
};

static CurlGlobalInit curlInit;

} // namespace anonyme

json HttpJsonClient::post(const std::string& url, const json& body, long timeout_seconds) {
    std::string body_str = body.dump();
    return perform(url, &body_str, timeout_seconds);
}

json HttpJsonClient::get(const std::string& url, long timeout_seconds) {
    return perform(url, nullptr, timeout_seconds);
}

json HttpJsonClient::perform(const std::string& url, const std::string* body, long timeout_seconds) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw InferenceFailure("Échec initialisation CURL");
    }

    std::string response_str;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    if (body != nullptr) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_str);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw InferenceFailure(url + ": CURL error: " + curl_easy_strerror(res));
    }
    if (http_code < 200 || http_code >= 300) {
        throw InferenceFailure(url + ": HTTP " + std::to_string(http_code) + ": " + response_str);
    }

    try {
        return json::parse(response_str);
    } catch (const json::parse_error& e) {
        throw InferenceFailure(url + ": réponse JSON invalide: " + e.what());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// VOIX
// ═══════════════════════════════════════════════════════════════════════════

HttpVoicePredictor::HttpVoicePredictor(const PredictorEndpoint& endpoint)
    : endpoint_(endpoint)
{
}

PredictorResult HttpVoicePredictor::predict(const AudioBuffer& audio) {
    if (endpoint_.url.empty()) {
        throw ModelUnavailable("Voice predictor URL not configured");
    }
    json response = HttpJsonClient::post(endpoint_.url, audioToJson(audio), endpoint_.timeout_seconds);
    return predictorResultFromJson(response);
}

// ═══════════════════════════════════════════════════════════════════════════
// VISAGE
// ═══════════════════════════════════════════════════════════════════════════

HttpFacePredictor::HttpFacePredictor(const PredictorEndpoint& endpoint)
    : endpoint_(endpoint)
{
}

PredictorResult HttpFacePredictor::predict(const ImageFrame& image) {
    if (endpoint_.url.empty()) {
        throw ModelUnavailable("Face predictor URL not configured");
    }
    json response = HttpJsonClient::post(endpoint_.url, imageToJson(image), endpoint_.timeout_seconds);
    return predictorResultFromJson(response);
}

// ═══════════════════════════════════════════════════════════════════════════
// FUSION APPRISE
// ═══════════════════════════════════════════════════════════════════════════

HttpFusionPredictor::HttpFusionPredictor(const PredictorEndpoint& endpoint, const std::string& status_url)
    : endpoint_(endpoint)
    , status_url_(status_url)
{
    available_ = !endpoint_.url.empty() && status_url_.empty();
}

PredictorResult HttpFusionPredictor::predict(const AudioBuffer& audio, const std::vector<ImageFrame>& frames) {
    if (endpoint_.url.empty()) {
        throw ModelUnavailable("Fusion predictor URL not configured");
    }

    json body = audioToJson(audio);
    body["frames"] = json::array();
    for (const auto& frame : frames) {
        body["frames"].push_back(imageToJson(frame));
    }

    json response = HttpJsonClient::post(endpoint_.url, body, endpoint_.timeout_seconds);
    return predictorResultFromJson(response);
}

bool HttpFusionPredictor::refreshAvailability() {
    if (endpoint_.url.empty()) {
        available_ = false;
        return false;
    }
    if (status_url_.empty()) {
        available_ = true;
        return true;
    }

    bool available = false;
    try {
        json status = HttpJsonClient::get(status_url_, endpoint_.timeout_seconds);
        available = status.value("fusion_model_available", false);
    } catch (const std::exception& e) {
        std::cerr << "[HttpPredictor] Statut du modèle de fusion indisponible: " << e.what() << "\n";
    }

    // Lu par le thread consommateur pendant les ré-interrogations
    if (available_.exchange(available) != available || !polled_) {
        std::cout << "[HttpPredictor] Modèle de fusion "
                  << (available ? "disponible" : "indisponible") << "\n";
    }
    polled_ = true;
    return available;
}

} // namespace mede
