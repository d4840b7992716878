/**
 * @file DecisionService.hpp
 * @brief Service de décision : requêtes d'analyse et verdicts via RabbitMQ
 * @version 1.0
 * @date 2026-01-12
 *
 * Consomme la queue de requêtes, exécute l'orchestrateur et publie le
 * résultat JSON sur l'échange topic des verdicts (clé verdict.<mode>,
 * verdict.failure en cas d'échec). Si le message porte un reply_to, le
 * résultat y est aussi envoyé avec le même correlation_id.
 */

#ifndef MEDE_DECISION_SERVICE_HPP
#define MEDE_DECISION_SERVICE_HPP

#include "EngineConfig.hpp"
#include "Orchestrator.hpp"
#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace mede {

struct DecisionServiceStats {
    uint64_t processed = 0;        // Requêtes traitées (succès ou échec)
    uint64_t failed = 0;           // Résultats success = false
    uint64_t malformed = 0;        // JSON illisible ou requête invalide
    uint64_t requeued = 0;         // Rejets avec remise en queue
    uint64_t dropped = 0;          // Rejets définitifs (message déjà redélivré)
    uint64_t reply_failures = 0;   // Réponses reply_to non envoyées (verdict publié)
    std::map<std::string, uint64_t> by_mode;
};

class DecisionService {
public:
    using Publisher = std::function<void(const std::string& payload, const AnalysisResult& result)>;

    DecisionService(const RabbitMQConfig& config, Orchestrator& orchestrator);
    ~DecisionService();

    DecisionService(const DecisionService&) = delete;
    DecisionService& operator=(const DecisionService&) = delete;

    /**
     * @brief Connexion RabbitMQ et démarrage du thread de consommation
     */
    bool start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * @brief Traite un corps de message (sans RabbitMQ)
     *
     * Un JSON illisible ou une requête mal formée donne un résultat
     * INPUT_ERROR, jamais une exception.
     */
    AnalysisResult handleMessage(const std::string& body);

    /**
     * @brief Traite un message reçu : analyse, publication du verdict, statistiques
     *
     * Les statistiques ne sont comptées qu'une fois le verdict publié. Un échec
     * de `reply` est journalisé et compté dans reply_failures, le message n'est
     * pas rejeté.
     * @throws std::exception si `publish_verdict` échoue
     */
    AnalysisResult processDelivery(const std::string& body,
                                   const Publisher& publish_verdict,
                                   const Publisher& reply);

    /**
     * @brief Clé de routage du verdict : <prefix>.<mode> ou <prefix>.failure
     */
    [[nodiscard]] static std::string routingKeyFor(const AnalysisResult& result, const std::string& prefix);

    [[nodiscard]] DecisionServiceStats getStats() const;

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    RabbitMQConfig config_;
    Orchestrator& orchestrator_;

    AmqpClient::Channel::ptr_t channel_;
    std::string consumer_tag_;
    std::thread consumer_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> quiet_mode_{false};

    mutable std::mutex stats_mutex_;
    DecisionServiceStats stats_;

    bool initRabbitMQ();
    void consumeLoop();
    AnalysisResult evaluateMessage(const std::string& body, bool& malformed);
    void publishVerdict(const std::string& payload, const AnalysisResult& result,
                        const AmqpClient::BasicMessage::ptr_t& request);
    void publishReply(const std::string& payload, const AmqpClient::BasicMessage::ptr_t& request);
    void recordResult(const AnalysisResult& result, bool malformed);
};

} // namespace mede

#endif // MEDE_DECISION_SERVICE_HPP
