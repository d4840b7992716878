/**
 * @file HttpPredictor.hpp
 * @brief Prédicteurs distants : serveurs de modèles joints en HTTP/JSON (libcurl)
 * @version 1.0
 * @date 2026-01-12
 *
 * Contrat de réponse : {success, emotion, confidence, all_emotions, error?, warning?}
 * Erreur de transport ou statut non 2xx → InferenceFailure.
 * URL vide → ModelUnavailable.
 */

#ifndef MEDE_HTTP_PREDICTOR_HPP
#define MEDE_HTTP_PREDICTOR_HPP

#include "Predictors.hpp"
#include "EngineConfig.hpp"
#include <atomic>
#include <string>

namespace mede {

/**
 * @brief Client JSON minimal, une requête bloquante par appel
 */
class HttpJsonClient {
public:
    /**
     * @throws InferenceFailure si le transport échoue ou si le statut n'est pas 2xx
     */
    static json post(const std::string& url, const json& body, long timeout_seconds);
    static json get(const std::string& url, long timeout_seconds);

private:
    static json perform(const std::string& url, const std::string* body, long timeout_seconds);
};

class HttpVoicePredictor : public VoicePredictor {
public:
    explicit HttpVoicePredictor(const PredictorEndpoint& endpoint);

    [[nodiscard]] bool isAvailable() const override { return !endpoint_.url.empty(); }
    PredictorResult predict(const AudioBuffer& audio) override;

private:
    PredictorEndpoint endpoint_;
};

class HttpFacePredictor : public FacePredictor {
public:
    explicit HttpFacePredictor(const PredictorEndpoint& endpoint);

    [[nodiscard]] bool isAvailable() const override { return !endpoint_.url.empty(); }
    PredictorResult predict(const ImageFrame& image) override;

private:
    PredictorEndpoint endpoint_;
};

/**
 * @class HttpFusionPredictor
 * @brief Modèle de fusion appris, disponibilité interrogée sur l'URL de statut
 *
 * Sans URL de statut, le modèle est réputé disponible dès que son URL est
 * configurée.
 */
class HttpFusionPredictor : public FusionPredictor {
public:
    HttpFusionPredictor(const PredictorEndpoint& endpoint, const std::string& status_url);

    [[nodiscard]] bool isAvailable() const override { return available_.load(); }
    PredictorResult predict(const AudioBuffer& audio, const std::vector<ImageFrame>& frames) override;

    /**
     * @brief GET sur l'URL de statut, lit "fusion_model_available"
     *
     * Appelée périodiquement par la boucle principale ; le changement d'état
     * est journalisé.
     * @return Nouvelle disponibilité (false si le serveur ne répond pas)
     */
    bool refreshAvailability();

private:
    PredictorEndpoint endpoint_;
    std::string status_url_;
    std::atomic<bool> available_{false};
    bool polled_ = false;
};

} // namespace mede

#endif // MEDE_HTTP_PREDICTOR_HPP
