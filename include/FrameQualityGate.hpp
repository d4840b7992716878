/**
 * @file FrameQualityGate.hpp
 * @brief Détection d'image factice avant la prédiction faciale
 * @version 1.0
 * @date 2026-01-12
 */

#ifndef MEDE_FRAME_QUALITY_GATE_HPP
#define MEDE_FRAME_QUALITY_GATE_HPP

#include "Types.hpp"
#include "EngineConfig.hpp"
#include <optional>
#include <string>

namespace mede {

class FrameQualityGate {
public:
    explicit FrameQualityGate(const FrameGateConfig& config = FrameGateConfig{});

    /**
     * @brief Vérifie une image
     * @return Avertissement de repli si l'image est inutilisable, std::nullopt sinon
     */
    [[nodiscard]] std::optional<std::string> check(const ImageFrame& frame) const;

    /**
     * @brief Écart-type des niveaux de gris (0.299R + 0.587G + 0.114B, ordre BGR)
     */
    [[nodiscard]] static double grayscaleStdDev(const ImageFrame& frame);

private:
    FrameGateConfig config_;
};

} // namespace mede

#endif // MEDE_FRAME_QUALITY_GATE_HPP
