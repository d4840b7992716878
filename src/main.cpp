/**
 * @file main.cpp
 * @brief Point d'entrée du service MEDE (Multimodal Emotion Decision Engine)
 * @version 1.0
 * @date 2026-01-12
 *
 * Le service reçoit des requêtes d'analyse (audio, image, trames vidéo) via
 * RabbitMQ, interroge les serveurs de modèles en HTTP et publie un verdict
 * émotionnel unique pour la recommandation musicale.
 */

#include "EngineConfig.hpp"
#include "Errors.hpp"
#include "Orchestrator.hpp"
#include "HttpPredictor.hpp"
#include "DecisionService.hpp"
#include "JsonCodec.hpp"
#include "EmotionCatalog.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace mede;

// Signal handler pour arrêt propre
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    std::cout << "\n[Main] Signal " << signal << " reçu, arrêt en cours...\n";
    g_running.store(false);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -h, --help            Affiche cette aide\n"
              << "  -c, --config <file>   Fichier de configuration JSON\n"
              << "  --host <host>         Hôte RabbitMQ (défaut: localhost)\n"
              << "  --port <port>         Port RabbitMQ (défaut: 5672)\n"
              << "  --user <user>         Utilisateur RabbitMQ (défaut: guest)\n"
              << "  --pass <password>     Mot de passe RabbitMQ\n"
              << "  --demo                Mode démonstration (sans RabbitMQ ni serveur de modèles)\n"
              << "  --quiet               Logs réduits aux erreurs\n"
              << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// DÉMONSTRATION
// ═══════════════════════════════════════════════════════════════════════════

namespace {

AudioBuffer makeTone(double frequency, double amplitude, double seconds) {
    AudioBuffer audio;
    size_t n = static_cast<size_t>(seconds * audio.sample_rate);
    audio.samples.resize(n);
    for (size_t i = 0; i < n; ++i) {
        audio.samples[i] = static_cast<float>(
            amplitude * std::sin(2.0 * M_PI * frequency * i / audio.sample_rate));
    }
    return audio;
}

AudioBuffer makeSilence(double seconds) {
    AudioBuffer audio;
    audio.samples.assign(static_cast<size_t>(seconds * audio.sample_rate), 0.0f);
    return audio;
}

ImageFrame makeTexturedFrame(int width, int height) {
    ImageFrame frame;
    frame.width = width;
    frame.height = height;
    frame.channels = 3;
    frame.pixels.resize(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t idx = (static_cast<size_t>(y) * width + x) * 3;
            frame.pixels[idx] = static_cast<uint8_t>((x * 7) % 256);
            frame.pixels[idx + 1] = static_cast<uint8_t>((y * 5) % 256);
            frame.pixels[idx + 2] = static_cast<uint8_t>(((x + y) * 3) % 256);
        }
    }
    return frame;
}

struct DemoScenario {
    std::string title;
    AnalysisRequest request;
    FunctionVoicePredictor::PredictFn voice;
    FunctionFacePredictor::PredictFn face;
    FunctionFusionPredictor::PredictFn fusion;   // Vide = pas de modèle de fusion
};

void runScenario(const EngineConfig& config, const DemoScenario& scenario, bool quiet) {
    std::cout << "\n═══ " << scenario.title << " ═══\n";

    FunctionVoicePredictor voice(scenario.voice);
    FunctionFacePredictor face(scenario.face);
    FunctionFusionPredictor fusion(scenario.fusion, static_cast<bool>(scenario.fusion));

    Orchestrator orchestrator(config, &voice, &face, &fusion);
    orchestrator.setQuietMode(quiet);

    AnalysisResult result = orchestrator.analyze(scenario.request);
    if (result.success) {
        const auto& info = emotionInfo(result.recommendation_emotion);
        std::cout << info.emoji << "  " << result.summary << "\n";
    }
    std::cout << toJson(result).dump(2) << "\n";
}

void runDemo(const EngineConfig& config, bool quiet) {
    std::cout << "\n[Demo] Mode démonstration - prédicteurs simulés en processus\n";

    const AudioBuffer speech = makeTone(440.0, 0.5, 1.0);
    const ImageFrame face_frame = makeTexturedFrame(64, 64);

    auto withBoth = [&](const std::string& id) {
        AnalysisRequest request;
        request.request_id = id;
        request.audio = speech;
        request.image = face_frame;
        return request;
    };

    std::vector<DemoScenario> scenarios;

    scenarios.push_back({
        "Scénario A: peur (voix) + tristesse (visage) → accord faible",
        withBoth("demo-a"),
        [](const AudioBuffer&) {
            return PredictorResult::ok("fear", 0.7, {{"fear", 0.7}, {"sad", 0.2}, {"neutral", 0.1}});
        },
        [](const ImageFrame&) {
            return PredictorResult::ok("sad", 0.6, {{"sad", 0.6}, {"neutral", 0.4}});
        },
        nullptr
    });

    scenarios.push_back({
        "Scénario B: joie (voix) + tristesse (visage) → conflit, confiance suffisante",
        withBoth("demo-b"),
        [](const AudioBuffer&) {
            return PredictorResult::ok("happy", 0.9, {{"happy", 0.9}, {"neutral", 0.1}});
        },
        [](const ImageFrame&) {
            return PredictorResult::ok("sad", 0.8, {{"sad", 0.8}, {"neutral", 0.2}});
        },
        nullptr
    });

    scenarios.push_back({
        "Scénario C: conflit à faible confiance → recommandation neutre",
        withBoth("demo-c"),
        [](const AudioBuffer&) {
            return PredictorResult::ok("happy", 0.6, {{"happy", 0.6}, {"neutral", 0.4}});
        },
        [](const ImageFrame&) {
            return PredictorResult::ok("sad", 0.8, {{"sad", 0.8}, {"neutral", 0.2}});
        },
        nullptr
    });

    scenarios.push_back({
        "Scénario D: échec de la détection faciale → repli neutre",
        withBoth("demo-d"),
        [](const AudioBuffer&) {
            return PredictorResult::ok("angry", 0.8, {{"angry", 0.8}, {"disgust", 0.2}});
        },
        [](const ImageFrame&) -> PredictorResult {
            throw InferenceFailure("no face detected");
        },
        nullptr
    });

    scenarios.push_back({
        "Scénario E: modèle de fusion appris disponible",
        withBoth("demo-e"),
        [](const AudioBuffer&) { return PredictorResult::ok("happy", 0.9); },
        [](const ImageFrame&) { return PredictorResult::ok("happy", 0.9); },
        [](const AudioBuffer&, const std::vector<ImageFrame>&) {
            return PredictorResult::ok("surprise", 0.66, {{"surprise", 0.66}, {"happy", 0.2}, {"fear", 0.14}});
        }
    });

    {
        AnalysisRequest request;
        request.request_id = "demo-f";
        request.audio = makeSilence(1.0);
        scenarios.push_back({
            "Scénario F: silence → repli de qualité audio",
            request,
            [](const AudioBuffer&) { return PredictorResult::ok("angry", 0.99); },
            [](const ImageFrame&) { return PredictorResult::ok("neutral", 0.5); },
            nullptr
        });
    }

    {
        AnalysisRequest request;
        request.request_id = "demo-g";
        scenarios.push_back({
            "Scénario G: aucune entrée → échec explicite",
            request,
            [](const AudioBuffer&) { return PredictorResult::ok("neutral", 0.5); },
            [](const ImageFrame&) { return PredictorResult::ok("neutral", 0.5); },
            nullptr
        });
    }

    for (const auto& scenario : scenarios) {
        runScenario(config, scenario, quiet);
    }

    std::cout << "\n[Demo] " << scenarios.size() << " scénarios exécutés\n";
}

} // namespace anonyme

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    std::string config_file = "config/mede_config.json";
    bool demo_mode = false;
    bool quiet = false;

    // Surcharges RabbitMQ de la ligne de commande, appliquées après le fichier
    std::optional<std::string> host, user, password;
    std::optional<int> port;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    config_file = argv[++i];
                }
            } else if (arg == "--host") {
                if (i + 1 < argc) {
                    host = argv[++i];
                }
            } else if (arg == "--port") {
                if (i + 1 < argc) {
                    port = std::stoi(argv[++i]);
                }
            } else if (arg == "--user") {
                if (i + 1 < argc) {
                    user = argv[++i];
                }
            } else if (arg == "--pass") {
                if (i + 1 < argc) {
                    password = argv[++i];
                }
            } else if (arg == "--demo") {
                demo_mode = true;
            } else if (arg == "--quiet") {
                quiet = true;
            } else {
                std::cerr << "[Main] Option inconnue: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        EngineConfig config;
        config.loadFromFile(config_file);

        if (host) config.rabbitmq.host = *host;
        if (port) config.rabbitmq.port = *port;
        if (user) config.rabbitmq.user = *user;
        if (password) config.rabbitmq.password = *password;

        if (!quiet) {
            std::cout << "[Main] Configuration effective:\n" << config.toJson().dump(2) << "\n";
        }

        if (demo_mode) {
            runDemo(config, quiet);
            return 0;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        HttpVoicePredictor voice(config.predictors.voice);
        HttpFacePredictor face(config.predictors.face);
        HttpFusionPredictor fusion(config.predictors.fusion, config.predictors.fusion_status_url);
        fusion.refreshAvailability();

        Orchestrator orchestrator(config, &voice, &face, &fusion);
        orchestrator.setQuietMode(quiet);

        DecisionService service(config.rabbitmq, orchestrator);
        service.setQuietMode(quiet);

        std::cout << "[Main] Démarrage du service de décision (RabbitMQ)..." << std::endl;
        if (!service.start()) {
            std::cerr << "[Main] Échec du démarrage du service" << std::endl;
            return 1;
        }

        std::cout << "[Main] MEDE prêt. Appuyez sur Ctrl+C pour arrêter." << std::endl;

        const auto poll_interval = std::chrono::seconds(config.predictors.fusion_status_poll_seconds);
        auto last_poll = std::chrono::steady_clock::now();

        while (g_running.load() && service.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            auto now = std::chrono::steady_clock::now();
            if (poll_interval.count() > 0 && now - last_poll >= poll_interval) {
                fusion.refreshAvailability();
                last_poll = now;
            }
        }

        service.stop();
        std::cout << "[Main] MEDE terminé proprement.\n";
        return 0;

    } catch (const ConfigError& e) {
        std::cerr << "[Main] Configuration invalide: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Erreur fatale: " << e.what() << "\n";
        return 1;
    }
}
