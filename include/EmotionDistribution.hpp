/**
 * @file EmotionDistribution.hpp
 * @brief Distribution de probabilités émotion → [0, 1]
 * @version 1.0
 * @date 2026-01-12
 *
 * Les clés sont normalisées à l'insertion (minuscules, espaces retirés,
 * alias faciaux ramenés au nom canonique). Une clé inconnue est conservée
 * comme clé opaque. La somme n'est pas forcément exactement 1.
 */

#ifndef MEDE_EMOTION_DISTRIBUTION_HPP
#define MEDE_EMOTION_DISTRIBUTION_HPP

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mede {

class EmotionDistribution {
public:
    using Entries = std::map<std::string, double>;
    using Entry = std::pair<std::string, double>;

    EmotionDistribution() = default;
    EmotionDistribution(std::initializer_list<Entry> init);

    static EmotionDistribution fromMap(const std::unordered_map<std::string, double>& raw);

    /**
     * @brief Probabilité d'une émotion, 0 si absente
     */
    [[nodiscard]] double get(const std::string& emotion) const;

    void set(const std::string& emotion, double probability);

    /**
     * @brief Ajoute à la probabilité existante (crée l'entrée si besoin)
     */
    void add(const std::string& emotion, double probability);

    [[nodiscard]] bool contains(const std::string& emotion) const;
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] double total() const;
    [[nodiscard]] const Entries& entries() const { return entries_; }

    /**
     * @brief Clés dans l'ordre canonique, puis les clés inconnues par ordre alphabétique
     */
    [[nodiscard]] std::vector<std::string> orderedKeys() const;

    /**
     * @brief Émotion de probabilité maximale
     *
     * Départage déterministe : la première émotion maximale dans l'ordre
     * canonique (angry, disgust, fear, happy, neutral, sad, surprise) gagne.
     * @return std::nullopt si la distribution est vide
     */
    [[nodiscard]] std::optional<Entry> argmax() const;

    /**
     * @brief Entrées triées par probabilité décroissante (égalités en ordre canonique)
     */
    [[nodiscard]] std::vector<Entry> sortedByProbability() const;

    bool operator==(const EmotionDistribution& other) const { return entries_ == other.entries_; }

private:
    Entries entries_;
};

} // namespace mede

#endif // MEDE_EMOTION_DISTRIBUTION_HPP
