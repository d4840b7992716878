/**
 * @file CompatibilityMatrix.cpp
 * @brief Implémentation de la matrice de compatibilité
 * @version 1.0
 * @date 2026-01-12
 */

#include "CompatibilityMatrix.hpp"
#include "Errors.hpp"

namespace mede {

const std::vector<PairScore>& CompatibilityMatrix::defaultPairs() {
    using E = EmotionLabel;
    static const std::vector<PairScore> pairs = {
        {E::ANGRY,   E::DISGUST,  0.6},
        {E::ANGRY,   E::FEAR,     0.3},
        {E::ANGRY,   E::HAPPY,    0.0},
        {E::ANGRY,   E::NEUTRAL,  0.2},
        {E::ANGRY,   E::SAD,      0.4},
        {E::ANGRY,   E::SURPRISE, 0.3},

        {E::DISGUST, E::FEAR,     0.4},
        {E::DISGUST, E::HAPPY,    0.0},
        {E::DISGUST, E::NEUTRAL,  0.2},
        {E::DISGUST, E::SAD,      0.3},
        {E::DISGUST, E::SURPRISE, 0.2},

        {E::FEAR,    E::HAPPY,    0.0},
        {E::FEAR,    E::NEUTRAL,  0.2},
        {E::FEAR,    E::SAD,      0.5},
        {E::FEAR,    E::SURPRISE, 0.7},

        {E::HAPPY,   E::NEUTRAL,  0.4},
        {E::HAPPY,   E::SAD,      0.0},
        {E::HAPPY,   E::SURPRISE, 0.5},

        {E::NEUTRAL, E::SAD,      0.3},
        {E::NEUTRAL, E::SURPRISE, 0.3},

        {E::SAD,     E::SURPRISE, 0.2}
    };
    return pairs;
}

CompatibilityMatrix::CompatibilityMatrix()
    : CompatibilityMatrix(defaultPairs()) {}

CompatibilityMatrix::CompatibilityMatrix(const std::vector<PairScore>& pairs) {
    for (size_t i = 0; i < NUM_EMOTIONS; ++i) {
        table_[i][i] = 1.0;
    }

    for (const auto& pair : pairs) {
        if (pair.a == pair.b) {
            throw ConfigError("Compatibilité réflexive fixée à 1.0, paire refusée: " +
                              emotionToString(pair.a));
        }
        if (pair.score < 0.0 || pair.score > 1.0) {
            throw ConfigError("Score de compatibilité hors [0, 1] pour " +
                              emotionToString(pair.a) + "/" + emotionToString(pair.b));
        }
        auto i = static_cast<size_t>(pair.a);
        auto j = static_cast<size_t>(pair.b);
        table_[i][j] = pair.score;
        table_[j][i] = pair.score;
    }
}

double CompatibilityMatrix::get(const std::string& a, const std::string& b) const {
    auto ea = parseEmotion(a);
    auto eb = parseEmotion(b);
    if (!ea || !eb) {
        return 0.0;
    }
    return get(*ea, *eb);
}

bool CompatibilityMatrix::isSymmetric() const {
    for (size_t i = 0; i < NUM_EMOTIONS; ++i) {
        for (size_t j = i + 1; j < NUM_EMOTIONS; ++j) {
            if (table_[i][j] != table_[j][i]) {
                return false;
            }
        }
    }
    return true;
}

bool CompatibilityMatrix::hasUnitDiagonal() const {
    for (size_t i = 0; i < NUM_EMOTIONS; ++i) {
        if (table_[i][i] != 1.0) {
            return false;
        }
    }
    return true;
}

const CompatibilityMatrix& CompatibilityMatrix::defaultMatrix() {
    static const CompatibilityMatrix instance;
    return instance;
}

} // namespace mede
