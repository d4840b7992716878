/**
 * @file TestHarness.hpp
 * @brief Framework de test minimal et générateurs de signaux partagés
 */

#ifndef MEDE_TEST_HARNESS_HPP
#define MEDE_TEST_HARNESS_HPP

#include "Types.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

// ═══════════════════════════════════════════════════════════════════════════
// FRAMEWORK DE TEST MINIMAL
// ═══════════════════════════════════════════════════════════════════════════

static int g_testsRun = 0;
static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define RUN_TEST(name) runTest(#name, test_##name)

inline void runTest(const char* name, void (*func)()) {
    std::cout << "  - " << name << "... ";
    g_testsRun++;
    try {
        func();
        std::cout << "OK\n";
        g_testsPassed++;
    } catch (const std::exception& e) {
        std::cout << "ECHEC: " << e.what() << "\n";
        g_testsFailed++;
    }
}

inline int printSummary(const char* suite) {
    std::cout << "\n═══ " << suite << ": " << g_testsPassed << "/" << g_testsRun
              << " tests réussis";
    if (g_testsFailed > 0) {
        std::cout << ", " << g_testsFailed << " échecs";
    }
    std::cout << " ═══\n";
    return g_testsFailed > 0 ? 1 : 0;
}

#define ASSERT_TRUE(expr) \
    if (!(expr)) throw std::runtime_error("ASSERT_TRUE failed: " #expr)

#define ASSERT_FALSE(expr) \
    if (expr) throw std::runtime_error("ASSERT_FALSE failed: " #expr)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw std::runtime_error("ASSERT_EQ failed: " #a " != " #b)

#define ASSERT_GT(a, b) \
    if (!((a) > (b))) throw std::runtime_error("ASSERT_GT failed: " #a " <= " #b)

#define ASSERT_GE(a, b) \
    if (!((a) >= (b))) throw std::runtime_error("ASSERT_GE failed: " #a " < " #b)

#define ASSERT_LT(a, b) \
    if (!((a) < (b))) throw std::runtime_error("ASSERT_LT failed: " #a " >= " #b)

#define ASSERT_LE(a, b) \
    if (!((a) <= (b))) throw std::runtime_error("ASSERT_LE failed: " #a " > " #b)

#define ASSERT_NEAR(a, b, eps) \
    if (std::abs((a) - (b)) > (eps)) throw std::runtime_error("ASSERT_NEAR failed: " #a " ~ " #b)

#define ASSERT_THROWS(stmt, ExceptionType)                                        \
    do {                                                                          \
        bool thrown_ = false;                                                     \
        try { stmt; } catch (const ExceptionType&) { thrown_ = true; }            \
        if (!thrown_) throw std::runtime_error("ASSERT_THROWS failed: " #stmt);   \
    } while (0)

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS
// ═══════════════════════════════════════════════════════════════════════════

inline mede::AudioBuffer makeTone(double frequency, double amplitude, double seconds,
                                  int sample_rate = mede::DEFAULT_SAMPLE_RATE) {
    mede::AudioBuffer audio;
    audio.sample_rate = sample_rate;
    size_t n = static_cast<size_t>(seconds * sample_rate);
    audio.samples.resize(n);
    for (size_t i = 0; i < n; ++i) {
        audio.samples[i] = static_cast<float>(
            amplitude * std::sin(2.0 * M_PI * frequency * i / sample_rate));
    }
    return audio;
}

inline mede::AudioBuffer makeConstant(float value, size_t count) {
    mede::AudioBuffer audio;
    audio.samples.assign(count, value);
    return audio;
}

/**
 * @brief Image BGR texturée (écart-type largement au-dessus du seuil)
 */
inline mede::ImageFrame makeTexturedFrame(int width, int height) {
    mede::ImageFrame frame;
    frame.width = width;
    frame.height = height;
    frame.channels = 3;
    frame.pixels.resize(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t idx = (static_cast<size_t>(y) * width + x) * 3;
            uint8_t v = ((x / 2 + y / 2) % 2 == 0) ? 20 : 220;
            frame.pixels[idx] = v;
            frame.pixels[idx + 1] = v;
            frame.pixels[idx + 2] = v;
        }
    }
    return frame;
}

inline mede::ImageFrame makeUniformFrame(int width, int height, uint8_t value) {
    mede::ImageFrame frame;
    frame.width = width;
    frame.height = height;
    frame.channels = 3;
    frame.pixels.assign(static_cast<size_t>(width) * height * 3, value);
    return frame;
}

#endif // MEDE_TEST_HARNESS_HPP
