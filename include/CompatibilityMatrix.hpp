/**
 * @file CompatibilityMatrix.hpp
 * @brief Matrice de compatibilité symétrique entre les 7 émotions
 * @version 1.0
 * @date 2026-01-12
 *
 * La table est construite à partir des seules paires (a, b) avec a < b :
 * chaque valeur est écrite aux deux positions et la diagonale vaut 1.0.
 * Symétrie et réflexivité tiennent donc par construction.
 */

#ifndef MEDE_COMPATIBILITY_MATRIX_HPP
#define MEDE_COMPATIBILITY_MATRIX_HPP

#include "Types.hpp"
#include <array>
#include <string>
#include <vector>

namespace mede {

/**
 * @brief Score de proximité affective entre deux émotions distinctes
 */
struct PairScore {
    EmotionLabel a;
    EmotionLabel b;
    double score;
};

/**
 * @class CompatibilityMatrix
 * @brief Table 7×7 immuable, partagée en lecture par toutes les requêtes
 */
class CompatibilityMatrix {
public:
    using Table = std::array<std::array<double, NUM_EMOTIONS>, NUM_EMOTIONS>;

    /**
     * @brief Construit la table par défaut
     */
    CompatibilityMatrix();

    /**
     * @brief Construit une table à partir d'une liste de paires
     * @param pairs Paires (a, b, score), a != b, score dans [0, 1]
     * @throws ConfigError si une paire est réflexive ou hors bornes
     *
     * Les paires non fournies valent 0.0.
     */
    explicit CompatibilityMatrix(const std::vector<PairScore>& pairs);

    /**
     * @brief Compatibilité entre deux émotions canoniques
     */
    [[nodiscard]] double get(EmotionLabel a, EmotionLabel b) const {
        return table_[static_cast<size_t>(a)][static_cast<size_t>(b)];
    }

    /**
     * @brief Compatibilité entre deux libellés libres
     *
     * Les libellés sont normalisés. Retourne 0.0 (sans lever) si l'un des
     * deux est hors des 7 émotions canoniques.
     */
    [[nodiscard]] double get(const std::string& a, const std::string& b) const;

    [[nodiscard]] bool isSymmetric() const;
    [[nodiscard]] bool hasUnitDiagonal() const;
    [[nodiscard]] const Table& table() const { return table_; }

    /**
     * @brief Paires par défaut (proximité perceptive/affective)
     */
    static const std::vector<PairScore>& defaultPairs();

    /**
     * @brief Instance par défaut, construite une seule fois
     */
    static const CompatibilityMatrix& defaultMatrix();

private:
    Table table_{};
};

} // namespace mede

#endif // MEDE_COMPATIBILITY_MATRIX_HPP
