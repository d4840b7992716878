/**
 * @file Predictors.hpp
 * @brief Contrats des prédicteurs externes (voix, visage, fusion apprise)
 * @version 1.0
 * @date 2026-01-12
 *
 * Les réseaux eux-mêmes sont des boîtes noires. L'orchestrateur ne connaît
 * que ces interfaces, injectées à la construction.
 *
 * Un prédicteur signale un échec soit en levant (ModelUnavailable,
 * InferenceFailure), soit en retournant PredictorResult{success = false}.
 */

#ifndef MEDE_PREDICTORS_HPP
#define MEDE_PREDICTORS_HPP

#include "Types.hpp"
#include "Errors.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mede {

/**
 * @brief Résultat brut d'un prédicteur
 */
struct PredictorResult {
    bool success = false;
    std::string emotion;
    double confidence = 0.0;
    EmotionDistribution distribution;
    std::optional<std::string> warning;
    std::string error;

    static PredictorResult ok(const std::string& emotion, double confidence,
                              EmotionDistribution distribution = {}) {
        PredictorResult r;
        r.success = true;
        r.emotion = emotion;
        r.confidence = confidence;
        r.distribution = std::move(distribution);
        return r;
    }

    static PredictorResult failure(const std::string& error) {
        PredictorResult r;
        r.error = error;
        return r;
    }

    /**
     * @brief Conversion en prédiction de modalité (libellé normalisé)
     */
    [[nodiscard]] ModalityPrediction toPrediction(Modality modality) const {
        ModalityPrediction p;
        p.label = canonicalKey(emotion);
        p.confidence = confidence;
        p.distribution = distribution;
        p.modality = modality;
        p.warning = warning;
        return p;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// INTERFACES
// ═══════════════════════════════════════════════════════════════════════════

class VoicePredictor {
public:
    virtual ~VoicePredictor() = default;

    [[nodiscard]] virtual bool isAvailable() const { return true; }
    virtual PredictorResult predict(const AudioBuffer& audio) = 0;
};

class FacePredictor {
public:
    virtual ~FacePredictor() = default;

    [[nodiscard]] virtual bool isAvailable() const { return true; }
    virtual PredictorResult predict(const ImageFrame& image) = 0;
};

/**
 * @brief Modèle appris voix + vidéo (optionnel)
 */
class FusionPredictor {
public:
    virtual ~FusionPredictor() = default;

    [[nodiscard]] virtual bool isAvailable() const = 0;
    virtual PredictorResult predict(const AudioBuffer& audio, const std::vector<ImageFrame>& frames) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// PRÉDICTEURS EN PROCESSUS (démo, tests)
// ═══════════════════════════════════════════════════════════════════════════

class FunctionVoicePredictor : public VoicePredictor {
public:
    using PredictFn = std::function<PredictorResult(const AudioBuffer&)>;

    explicit FunctionVoicePredictor(PredictFn fn, bool available = true)
        : fn_(std::move(fn)), available_(available) {}

    [[nodiscard]] bool isAvailable() const override { return available_; }

    PredictorResult predict(const AudioBuffer& audio) override {
        ++calls_;
        if (!available_) {
            throw ModelUnavailable("Modèle vocal non chargé");
        }
        return fn_(audio);
    }

    [[nodiscard]] size_t callCount() const { return calls_; }

private:
    PredictFn fn_;
    bool available_;
    size_t calls_ = 0;
};

class FunctionFacePredictor : public FacePredictor {
public:
    using PredictFn = std::function<PredictorResult(const ImageFrame&)>;

    explicit FunctionFacePredictor(PredictFn fn, bool available = true)
        : fn_(std::move(fn)), available_(available) {}

    [[nodiscard]] bool isAvailable() const override { return available_; }

    PredictorResult predict(const ImageFrame& image) override {
        ++calls_;
        if (!available_) {
            throw ModelUnavailable("Modèle facial non chargé");
        }
        return fn_(image);
    }

    [[nodiscard]] size_t callCount() const { return calls_; }

private:
    PredictFn fn_;
    bool available_;
    size_t calls_ = 0;
};

class FunctionFusionPredictor : public FusionPredictor {
public:
    using PredictFn = std::function<PredictorResult(const AudioBuffer&, const std::vector<ImageFrame>&)>;

    explicit FunctionFusionPredictor(PredictFn fn, bool available = true)
        : fn_(std::move(fn)), available_(available) {}

    [[nodiscard]] bool isAvailable() const override { return available_; }
    void setAvailable(bool available) { available_ = available; }

    PredictorResult predict(const AudioBuffer& audio, const std::vector<ImageFrame>& frames) override {
        ++calls_;
        last_frame_count_ = frames.size();
        return fn_(audio, frames);
    }

    [[nodiscard]] size_t callCount() const { return calls_; }
    [[nodiscard]] size_t lastFrameCount() const { return last_frame_count_; }

private:
    PredictFn fn_;
    bool available_;
    size_t calls_ = 0;
    size_t last_frame_count_ = 0;
};

} // namespace mede

#endif // MEDE_PREDICTORS_HPP
