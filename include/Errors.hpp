/**
 * @file Errors.hpp
 * @brief Taxonomie des erreurs du MEDE
 * @version 1.0
 * @date 2026-01-12
 *
 * - InputError       : audio vide, taux d'échantillonnage invalide, rien à fusionner
 * - ModelUnavailable : prédicteur configuré mais jamais chargé
 * - InferenceFailure : l'appel au prédicteur a échoué
 * - ConfigError      : fichier de configuration invalide
 *
 * L'audio peu informatif et le conflit entre modalités ne sont PAS des
 * erreurs : ce sont des résultats valides (repli de qualité, tier CONFLICT).
 */

#ifndef MEDE_ERRORS_HPP
#define MEDE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mede {

/**
 * @brief Catégorie d'erreur reportée dans un AnalysisResult
 */
enum class ErrorKind {
    NONE,
    INPUT_ERROR,
    MODEL_UNAVAILABLE,
    INFERENCE_FAILURE,
    NO_USABLE_INPUT
};

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return "NONE";
        case ErrorKind::INPUT_ERROR:       return "INPUT_ERROR";
        case ErrorKind::MODEL_UNAVAILABLE: return "MODEL_UNAVAILABLE";
        case ErrorKind::INFERENCE_FAILURE: return "INFERENCE_FAILURE";
        case ErrorKind::NO_USABLE_INPUT:   return "NO_USABLE_INPUT";
        default:                           return "UNKNOWN";
    }
}

class MedeError : public std::runtime_error {
public:
    MedeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InputError : public MedeError {
public:
    explicit InputError(const std::string& message)
        : MedeError(ErrorKind::INPUT_ERROR, message) {}
};

class ModelUnavailable : public MedeError {
public:
    explicit ModelUnavailable(const std::string& message)
        : MedeError(ErrorKind::MODEL_UNAVAILABLE, message) {}
};

class InferenceFailure : public MedeError {
public:
    explicit InferenceFailure(const std::string& message)
        : MedeError(ErrorKind::INFERENCE_FAILURE, message) {}
};

class ConfigError : public MedeError {
public:
    explicit ConfigError(const std::string& message)
        : MedeError(ErrorKind::INPUT_ERROR, message) {}
};

} // namespace mede

#endif // MEDE_ERRORS_HPP
