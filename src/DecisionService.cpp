/**
 * @file DecisionService.cpp
 * @brief Boucle de consommation RabbitMQ du service de décision
 * @version 1.0
 * @date 2026-01-12
 */

#include "DecisionService.hpp"
#include "JsonCodec.hpp"
#include "Errors.hpp"
#include <chrono>
#include <iostream>

namespace mede {

DecisionService::DecisionService(const RabbitMQConfig& config, Orchestrator& orchestrator)
    : config_(config)
    , orchestrator_(orchestrator)
{
}

DecisionService::~DecisionService() {
    stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE VIE
// ═══════════════════════════════════════════════════════════════════════════

bool DecisionService::start() {
    if (running_.load()) {
        std::cout << "[DecisionService] Déjà en cours d'exécution" << std::endl;
        return true;
    }

    if (!initRabbitMQ()) {
        std::cerr << "[DecisionService] Échec initialisation RabbitMQ" << std::endl;
        return false;
    }

    running_.store(true);
    consumer_thread_ = std::thread(&DecisionService::consumeLoop, this);

    std::cout << "[DecisionService] ✓ En écoute sur " << config_.request_queue
              << ", verdicts vers " << config_.verdict_exchange << std::endl;
    return true;
}

void DecisionService::stop() {
    if (!running_.load()) {
        return;
    }

    running_.store(false);
    if (consumer_thread_.joinable()) {
        consumer_thread_.join();
    }

    DecisionServiceStats stats = getStats();
    std::cout << "[DecisionService] Arrêté\n";
    std::cout << "[DecisionService] Statistiques finales:\n";
    std::cout << "  - Requêtes traitées: " << stats.processed << "\n";
    std::cout << "  - Échecs: " << stats.failed << "\n";
    std::cout << "  - Messages mal formés: " << stats.malformed << "\n";
    std::cout << "  - Réponses directes en échec: " << stats.reply_failures << "\n";
    for (const auto& [mode, count] : stats.by_mode) {
        std::cout << "  - Mode " << mode << ": " << count << "\n";
    }
}

bool DecisionService::initRabbitMQ() {
    try {
        AmqpClient::Channel::OpenOpts opts;
        opts.host = config_.host;
        opts.port = config_.port;
        opts.auth = AmqpClient::Channel::OpenOpts::BasicAuth{config_.user, config_.password};

        channel_ = AmqpClient::Channel::Open(opts);

        channel_->DeclareQueue(config_.request_queue, false, true, false, false);
        channel_->DeclareExchange(config_.verdict_exchange,
                                  AmqpClient::Channel::EXCHANGE_TYPE_TOPIC, false, true, false);

        consumer_tag_ = channel_->BasicConsume(config_.request_queue, "", true, false, false,
                                               static_cast<uint16_t>(config_.prefetch_count));

        std::cout << "[DecisionService] Connecté à RabbitMQ " << config_.host << ":"
                  << config_.port << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DecisionService] Erreur RabbitMQ: " << e.what() << std::endl;
        return false;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CONSOMMATION
// ═══════════════════════════════════════════════════════════════════════════

void DecisionService::consumeLoop() {
    std::cout << "[DecisionService] Boucle de consommation démarrée" << std::endl;

    while (running_.load()) {
        try {
            AmqpClient::Envelope::ptr_t envelope;
            bool received = channel_->BasicConsumeMessage(consumer_tag_, envelope, config_.consume_timeout_ms);
            if (!received || !envelope) {
                continue;
            }

            std::string body(envelope->Message()->Body().begin(),
                             envelope->Message()->Body().end());

            try {
                const auto& request = envelope->Message();
                processDelivery(body,
                    [this, &request](const std::string& payload, const AnalysisResult& result) {
                        publishVerdict(payload, result, request);
                    },
                    [this, &request](const std::string& payload, const AnalysisResult&) {
                        publishReply(payload, request);
                    });
                channel_->BasicAck(envelope);
            } catch (const std::exception& e) {
                std::cerr << "[DecisionService] Erreur lors du traitement du message: " << e.what() << "\n";
                // Une seule nouvelle tentative par message
                bool requeue = !envelope->Redelivered();
                channel_->BasicReject(envelope, requeue);

                std::lock_guard<std::mutex> lock(stats_mutex_);
                if (requeue) {
                    stats_.requeued++;
                } else {
                    stats_.dropped++;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[DecisionService] Erreur consommation: " << e.what() << "\n";
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}

AnalysisResult DecisionService::handleMessage(const std::string& body) {
    bool malformed = false;
    AnalysisResult result = evaluateMessage(body, malformed);
    recordResult(result, malformed);
    return result;
}

AnalysisResult DecisionService::processDelivery(const std::string& body,
                                                const Publisher& publish_verdict,
                                                const Publisher& reply) {
    bool malformed = false;
    AnalysisResult result = evaluateMessage(body, malformed);
    std::string payload = toJson(result).dump();

    // Un échec ici rejette le message : rien n'est encore compté
    publish_verdict(payload, result);
    recordResult(result, malformed);

    try {
        reply(payload, result);
    } catch (const std::exception& e) {
        std::cerr << "[DecisionService] Échec de la réponse directe: " << e.what() << "\n";
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.reply_failures++;
    }
    return result;
}

AnalysisResult DecisionService::evaluateMessage(const std::string& body, bool& malformed) {
    AnalysisRequest request;
    try {
        request = requestFromJson(json::parse(body));
    } catch (const json::parse_error& e) {
        std::cerr << "[DecisionService] Erreur de parsing JSON: " << e.what() << "\n";
        AnalysisResult result;
        result.error_kind = ErrorKind::INPUT_ERROR;
        result.error = std::string("Malformed JSON: ") + e.what();
        malformed = true;
        return result;
    } catch (const InputError& e) {
        std::cerr << "[DecisionService] Requête invalide: " << e.what() << "\n";
        AnalysisResult result;
        result.error_kind = ErrorKind::INPUT_ERROR;
        result.error = std::string("Invalid request: ") + e.what();
        malformed = true;
        return result;
    }

    if (!quiet_mode_) {
        std::cout << "[DecisionService] Requête " << (request.request_id.empty() ? "-" : request.request_id)
                  << " (" << body.size() << " bytes)\n";
    }

    return orchestrator_.analyze(request);
}

void DecisionService::publishVerdict(const std::string& payload, const AnalysisResult& result,
                                     const AmqpClient::BasicMessage::ptr_t& request) {
    std::string routing_key = routingKeyFor(result, config_.verdict_routing_prefix);

    AmqpClient::BasicMessage::ptr_t message = AmqpClient::BasicMessage::Create(payload);
    message->ContentType("application/json");
    if (request->CorrelationIdIsSet()) {
        message->CorrelationId(request->CorrelationId());
    }

    channel_->BasicPublish(config_.verdict_exchange, routing_key, message, false, false);

    if (!quiet_mode_) {
        std::cout << "[DecisionService] Verdict publié (" << routing_key << ")\n";
    }
}

void DecisionService::publishReply(const std::string& payload, const AmqpClient::BasicMessage::ptr_t& request) {
    if (!request->ReplyToIsSet() || request->ReplyTo().empty()) {
        return;
    }

    AmqpClient::BasicMessage::ptr_t reply = AmqpClient::BasicMessage::Create(payload);
    reply->ContentType("application/json");
    if (request->CorrelationIdIsSet()) {
        reply->CorrelationId(request->CorrelationId());
    }
    channel_->BasicPublish("", request->ReplyTo(), reply, false, false);
}

std::string DecisionService::routingKeyFor(const AnalysisResult& result, const std::string& prefix) {
    if (!result.success) {
        return prefix + ".failure";
    }
    return prefix + "." + modeToString(result.mode);
}

// ═══════════════════════════════════════════════════════════════════════════
// STATISTIQUES
// ═══════════════════════════════════════════════════════════════════════════

void DecisionService::recordResult(const AnalysisResult& result, bool malformed) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.processed++;
    if (!result.success) {
        stats_.failed++;
    }
    if (malformed) {
        stats_.malformed++;
    }
    stats_.by_mode[result.success ? modeToString(result.mode) : "failure"]++;
}

DecisionServiceStats DecisionService::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace mede
