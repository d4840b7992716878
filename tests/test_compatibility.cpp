/**
 * @file test_compatibility.cpp
 * @brief Tests de la matrice de compatibilité et de la distribution émotionnelle
 */

#include "TestHarness.hpp"
#include "CompatibilityMatrix.hpp"
#include "EmotionDistribution.hpp"
#include "Errors.hpp"

using namespace mede;

// ═══════════════════════════════════════════════════════════════════════════
// MATRICE
// ═══════════════════════════════════════════════════════════════════════════

void test_diagonal_is_one() {
    const auto& m = CompatibilityMatrix::defaultMatrix();
    for (const auto& name : EMOTION_NAMES) {
        ASSERT_EQ(m.get(name, name), 1.0);
    }
    ASSERT_TRUE(m.hasUnitDiagonal());
}

void test_matrix_is_symmetric() {
    const auto& m = CompatibilityMatrix::defaultMatrix();
    for (const auto& a : EMOTION_NAMES) {
        for (const auto& b : EMOTION_NAMES) {
            ASSERT_EQ(m.get(a, b), m.get(b, a));
        }
    }
    ASSERT_TRUE(m.isSymmetric());
}

void test_reference_values() {
    const auto& m = CompatibilityMatrix::defaultMatrix();
    ASSERT_NEAR(m.get("fear", "surprise"), 0.7, 1e-12);
    ASSERT_NEAR(m.get("happy", "sad"), 0.0, 1e-12);
    ASSERT_NEAR(m.get("angry", "disgust"), 0.6, 1e-12);
    ASSERT_NEAR(m.get("fear", "sad"), 0.5, 1e-12);
    ASSERT_NEAR(m.get("happy", "neutral"), 0.4, 1e-12);
    ASSERT_NEAR(m.get("sad", "surprise"), 0.2, 1e-12);
}

void test_labels_are_normalized() {
    const auto& m = CompatibilityMatrix::defaultMatrix();
    ASSERT_NEAR(m.get("  Fear ", "SURPRISE"), 0.7, 1e-12);
    ASSERT_EQ(m.get("Happiness", "happy"), 1.0);
    ASSERT_NEAR(m.get("anger", "disgust"), 0.6, 1e-12);
}

void test_unknown_label_scores_zero() {
    const auto& m = CompatibilityMatrix::defaultMatrix();
    ASSERT_EQ(m.get("bored", "happy"), 0.0);
    ASSERT_EQ(m.get("happy", ""), 0.0);
    ASSERT_EQ(m.get("calm", "calm"), 0.0);
}

void test_all_values_in_unit_range() {
    const auto& table = CompatibilityMatrix::defaultMatrix().table();
    for (const auto& row : table) {
        for (double v : row) {
            ASSERT_GE(v, 0.0);
            ASSERT_LE(v, 1.0);
        }
    }
}

void test_custom_pairs_fill_both_halves() {
    CompatibilityMatrix m({{EmotionLabel::SURPRISE, EmotionLabel::HAPPY, 0.9}});
    ASSERT_NEAR(m.get(EmotionLabel::HAPPY, EmotionLabel::SURPRISE), 0.9, 1e-12);
    ASSERT_NEAR(m.get(EmotionLabel::SURPRISE, EmotionLabel::HAPPY), 0.9, 1e-12);
    ASSERT_EQ(m.get(EmotionLabel::ANGRY, EmotionLabel::FEAR), 0.0);
    ASSERT_TRUE(m.isSymmetric());
    ASSERT_TRUE(m.hasUnitDiagonal());
}

void test_custom_pairs_rejected() {
    ASSERT_THROWS(CompatibilityMatrix({{EmotionLabel::SAD, EmotionLabel::SAD, 0.5}}), ConfigError);
    ASSERT_THROWS(CompatibilityMatrix({{EmotionLabel::SAD, EmotionLabel::FEAR, 1.5}}), ConfigError);
    ASSERT_THROWS(CompatibilityMatrix({{EmotionLabel::SAD, EmotionLabel::FEAR, -0.1}}), ConfigError);
}

// ═══════════════════════════════════════════════════════════════════════════
// DISTRIBUTION
// ═══════════════════════════════════════════════════════════════════════════

void test_distribution_normalizes_keys() {
    EmotionDistribution d{{" Happy", 0.5}, {"SADNESS", 0.3}};
    ASSERT_NEAR(d.get("happy"), 0.5, 1e-12);
    ASSERT_NEAR(d.get("sad"), 0.3, 1e-12);
    ASSERT_TRUE(d.contains("Sad "));
    ASSERT_EQ(d.get("fear"), 0.0);
    ASSERT_EQ(d.size(), static_cast<size_t>(2));
}

void test_from_map_merges_aliases() {
    auto d = EmotionDistribution::fromMap({{"happy", 0.2}, {"happiness", 0.3}});
    ASSERT_EQ(d.size(), static_cast<size_t>(1));
    ASSERT_NEAR(d.get("happy"), 0.5, 1e-12);
}

void test_argmax_tie_uses_canonical_order() {
    EmotionDistribution d{{"sad", 0.3}, {"angry", 0.3}, {"neutral", 0.3}};
    auto best = d.argmax();
    ASSERT_TRUE(best.has_value());
    ASSERT_EQ(best->first, std::string("angry"));

    EmotionDistribution unknown_first{{"zen", 0.4}, {"surprise", 0.4}};
    ASSERT_EQ(unknown_first.argmax()->first, std::string("surprise"));
}

void test_argmax_empty() {
    EmotionDistribution d;
    ASSERT_FALSE(d.argmax().has_value());
}

void test_sorted_by_probability() {
    EmotionDistribution d{{"neutral", 0.22}, {"fear", 0.42}, {"sad", 0.36}};
    auto sorted = d.sortedByProbability();
    ASSERT_EQ(sorted.size(), static_cast<size_t>(3));
    ASSERT_EQ(sorted[0].first, std::string("fear"));
    ASSERT_EQ(sorted[1].first, std::string("sad"));
    ASSERT_EQ(sorted[2].first, std::string("neutral"));
    ASSERT_NEAR(d.total(), 1.0, 1e-12);
}

int main() {
    std::cout << "\n═══ CompatibilityMatrix / EmotionDistribution ═══\n";

    RUN_TEST(diagonal_is_one);
    RUN_TEST(matrix_is_symmetric);
    RUN_TEST(reference_values);
    RUN_TEST(labels_are_normalized);
    RUN_TEST(unknown_label_scores_zero);
    RUN_TEST(all_values_in_unit_range);
    RUN_TEST(custom_pairs_fill_both_halves);
    RUN_TEST(custom_pairs_rejected);
    RUN_TEST(distribution_normalizes_keys);
    RUN_TEST(from_map_merges_aliases);
    RUN_TEST(argmax_tie_uses_canonical_order);
    RUN_TEST(argmax_empty);
    RUN_TEST(sorted_by_probability);

    return printSummary("CompatibilityMatrix");
}
