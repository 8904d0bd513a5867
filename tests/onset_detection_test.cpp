#include <iostream>
#include <cassert>
#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>
#include "../include/analysis/onset_frame_processor.h"
#include "../include/util/logging.h"

using namespace OnsetAnalyzer::Analysis;
using namespace OnsetAnalyzer::Audio;
using namespace OnsetAnalyzer::Util;

static Chunk makeChunk(float value) {
    Chunk chunk;
    chunk.fill(value);
    return chunk;
}

// Feeds `count` chunks of `value`, appends one result per chunk
static void feed(OnsetFrameProcessor& processor, float value, int count,
                 std::vector<bool>& results) {
    Chunk chunk = makeChunk(value);
    for (int i = 0; i < count; ++i) {
        results.push_back(processor.process(chunk));
    }
}

static int countOnsets(const std::vector<bool>& results) {
    int count = 0;
    for (bool r : results) {
        if (r) count++;
    }
    return count;
}

static bool near(float a, float b, float tolerance) {
    return std::fabs(a - b) <= tolerance;
}

// Energy of a full window of 5s: 4 * 512 * 25
static const float kStepPeak = 51200.0f;

// ============================================================================
// Frame Pair
// ============================================================================

void test_frame_staggering() {
    std::cout << "Testing frame pair staggering..." << std::endl;

    OnsetFrameProcessor processor;
    assert(processor.getMode() == OnsetDetectionMode::Energy);

    for (int i = 0; i < 10; ++i) {
        processor.process(makeChunk(static_cast<float>(i)));
    }

    // current holds 6..9, previous holds what current evicted: 2..5
    assert(processor.currentFrame().buffer()[0] == 6.0f);
    assert(processor.currentFrame().buffer()[kFrameSize - 1] == 9.0f);
    assert(processor.previousFrame().buffer()[0] == 2.0f);
    assert(processor.previousFrame().buffer()[kFrameSize - 1] == 5.0f);

    // Debug rendering starts at the oldest chunk of each frame
    assert(processor.currentFrame().describe() == "[6,6,6,6...]");
    assert(processor.previousFrame().describe() == "[2,2,2,2...]");

    std::cout << "  ✓ Frame staggering test passed" << std::endl;
}

// ============================================================================
// Warm-up
// ============================================================================

void test_warm_up() {
    std::cout << "Testing warm-up..." << std::endl;

    OnsetFrameProcessor processor;
    assert(processor.state() == ProcessorState::WarmingUp);
    assert(processor.historySize() == 0);
    assert(processor.lastOdf() == 0.0f);

    // Step right at the start: the ODF peaks on call 4 and would be picked
    // on call 5, but there is no threshold yet
    Chunk loud = makeChunk(5.0f);
    for (std::size_t call = 1; call <= 15; ++call) {
        bool onset = processor.process(loud);
        assert(!onset);

        if (call < kThresholdLookback) {
            assert(processor.state() == ProcessorState::WarmingUp);
            assert(!processor.isReady());
            assert(processor.threshold() == 0.0f);
            assert(processor.historySize() == call);
        } else {
            assert(processor.state() == ProcessorState::Ready);
            assert(processor.historySize() == kThresholdLookback);
        }
    }

    assert(processor.chunksProcessed() == 15);
    assert(processor.onsetCount() == 0);
    assert(processor.highestPeak() == 0.0f);

    std::cout << "  ✓ Warm-up test passed" << std::endl;
}

// ============================================================================
// Silence
// ============================================================================

void test_silence() {
    std::cout << "Testing silence..." << std::endl;

    OnsetFrameProcessor processor;
    std::vector<bool> results;
    feed(processor, 0.0f, 20, results);

    assert(countOnsets(results) == 0);
    assert(processor.isReady());
    assert(processor.threshold() == 0.0f);
    assert(processor.highestPeak() == 0.0f);
    assert(processor.lastOdf() == 0.0f);

    std::cout << "  ✓ Silence test passed" << std::endl;
}

// ============================================================================
// Step 0 → 5
// ============================================================================

void test_step_onset() {
    std::cout << "Testing step onset..." << std::endl;

    OnsetFrameProcessor processor;
    std::vector<bool> results;
    std::vector<float> odfs;

    Chunk silence = makeChunk(0.0f);
    Chunk loud = makeChunk(5.0f);

    for (int i = 0; i < 30; ++i) {
        results.push_back(processor.process(i < 20 ? silence : loud));
        odfs.push_back(processor.lastOdf());

        if (i == 24) {
            // Threshold on the detection call:
            // median = 0, mean = 16640, highest peak still 0
            assert(near(processor.threshold(), 0.7f * 16640.0f, 0.05f));
        }
    }

    // ODF ramps up while the step fills the current frame, then back down
    // as the step reaches the previous frame
    assert(odfs[19] == 0.0f);
    assert(odfs[20] == 12800.0f);
    assert(odfs[21] == 25600.0f);
    assert(odfs[22] == 38400.0f);
    assert(odfs[23] == kStepPeak);
    assert(odfs[24] == 38400.0f);
    assert(odfs[27] == 0.0f);
    assert(odfs[29] == 0.0f);

    assert(countOnsets(results) == 1);
    assert(results[24]);
    assert(processor.onsetCount() == 1);
    assert(processor.highestPeak() == kStepPeak);

    std::cout << "  ✓ Step onset test passed" << std::endl;
}

// ============================================================================
// Latency
// ============================================================================

void test_one_chunk_latency() {
    std::cout << "Testing one-chunk detection latency..." << std::endl;

    OnsetFrameProcessor processor;
    std::vector<float> odfs;

    Chunk silence = makeChunk(0.0f);
    Chunk loud = makeChunk(5.0f);

    int onsetCall = -1;
    for (int i = 0; i < 30; ++i) {
        bool onset = processor.process(i < 20 ? silence : loud);
        odfs.push_back(processor.lastOdf());

        if (onset) {
            onsetCall = i;
            // The confirmed peak is the value from the previous call...
            assert(processor.history(1) == odfs[i - 1]);
            assert(processor.highestPeak() == odfs[i - 1]);
            // ...not the one just computed
            assert(processor.lastOdf() < processor.highestPeak());
        }
    }

    assert(onsetCall == 24);
    assert(odfs[onsetCall - 1] == kStepPeak);

    std::cout << "  ✓ Latency test passed" << std::endl;
}

// ============================================================================
// Plateau: an isolated loud chunk gives a flat ODF, no strict maximum
// ============================================================================

void test_plateau_is_not_a_peak() {
    std::cout << "Testing ODF plateau..." << std::endl;

    OnsetFrameProcessor processor;
    std::vector<bool> results;
    feed(processor, 0.0f, 20, results);
    feed(processor, 5.0f, 1, results);

    std::vector<float> odfs;
    for (int i = 0; i < 12; ++i) {
        results.push_back(processor.process(makeChunk(0.0f)));
        odfs.push_back(processor.lastOdf());
    }

    // The chunk sits in current for 4 writes, then in previous for 4
    for (int i = 0; i < 7; ++i) {
        assert(odfs[i] == 12800.0f);
    }
    assert(odfs[7] == 0.0f);

    assert(countOnsets(results) == 0);
    assert(processor.highestPeak() == 0.0f);

    std::cout << "  ✓ Plateau test passed" << std::endl;
}

// ============================================================================
// Burst: attack and release edges both produce onsets
// ============================================================================

void test_burst_attack_and_release() {
    std::cout << "Testing burst attack/release..." << std::endl;

    OnsetFrameProcessor processor;
    std::vector<bool> results;
    feed(processor, 0.0f, 20, results);
    feed(processor, 5.0f, 4, results);
    feed(processor, 0.0f, 12, results);

    // ODF from call 20: 12800 25600 38400 51200 25600 0 25600 51200 38400 ...
    assert(countOnsets(results) == 2);
    assert(results[24]);
    assert(results[28]);
    assert(processor.highestPeak() == kStepPeak);

    std::cout << "  ✓ Burst test passed" << std::endl;
}

// ============================================================================
// Threshold parameters
// ============================================================================

void test_threshold_params() {
    std::cout << "Testing threshold parameters..." << std::endl;

    ThresholdParams defaults;
    assert(defaults.lambda == 1.0f);
    assert(defaults.alpha == 0.7f);
    assert(defaults.highestPeakWeight == 0.05f);
    assert(defaults.isValid());

    ThresholdParams negative;
    negative.alpha = -1.0f;
    assert(!negative.isValid());

    ThresholdParams nan;
    nan.lambda = std::numeric_limits<float>::quiet_NaN();
    assert(!nan.isValid());

    // A heavy mean weight lifts the threshold above the step peak:
    // 10 * 16640 > 51200
    ThresholdParams strict;
    strict.alpha = 10.0f;
    OnsetFrameProcessor processor(strict);
    std::vector<bool> results;
    feed(processor, 0.0f, 20, results);
    feed(processor, 5.0f, 10, results);
    assert(countOnsets(results) == 0);
    assert(processor.params().alpha == 10.0f);

    // All weights zero: any strict local maximum above 0 is an onset
    ThresholdParams zero;
    zero.lambda = 0.0f;
    zero.alpha = 0.0f;
    zero.highestPeakWeight = 0.0f;
    OnsetFrameProcessor eager(zero);
    results.clear();
    feed(eager, 0.0f, 20, results);
    feed(eager, 5.0f, 10, results);
    assert(countOnsets(results) == 1);
    assert(eager.threshold() == 0.0f);

    std::cout << "  ✓ Threshold parameter test passed" << std::endl;
}

// ============================================================================
// Determinism + reset
// ============================================================================

void test_determinism() {
    std::cout << "Testing determinism..." << std::endl;

    std::mt19937 rng(42);
    std::uniform_real_distribution<float> noise(-0.1f, 0.1f);
    std::uniform_int_distribution<int> hit(0, 7);

    std::vector<Chunk> chunks;
    for (int i = 0; i < 300; ++i) {
        Chunk chunk;
        float gain = hit(rng) == 0 ? 8.0f : 1.0f;
        for (auto& s : chunk) {
            s = noise(rng) * gain;
        }
        chunks.push_back(chunk);
    }

    auto run = [&chunks](OnsetFrameProcessor& processor) {
        std::vector<bool> results;
        for (const auto& chunk : chunks) {
            results.push_back(processor.process(chunk));
        }
        return results;
    };

    OnsetFrameProcessor first;
    OnsetFrameProcessor second;
    std::vector<bool> a = run(first);
    std::vector<bool> b = run(second);
    assert(a == b);
    assert(first.highestPeak() == second.highestPeak());
    assert(first.threshold() == second.threshold());

    // reset() gives the same sequence again
    first.reset();
    assert(first.state() == ProcessorState::WarmingUp);
    assert(first.historySize() == 0);
    assert(first.chunksProcessed() == 0);
    assert(first.onsetCount() == 0);
    assert(first.highestPeak() == 0.0f);
    assert(first.threshold() == 0.0f);
    assert(first.currentFrame().energy() == 0.0f);
    assert(first.previousFrame().energy() == 0.0f);

    std::vector<bool> c = run(first);
    assert(a == c);

    std::cout << "  ✓ Determinism test passed (" << countOnsets(a) << " onsets)" << std::endl;
}

// ============================================================================
// Invalid input
// ============================================================================

void test_non_finite_input() {
    std::cout << "Testing non-finite input..." << std::endl;

    std::vector<std::string> warnings;
    Logger::setSink([&warnings](LogLevel level, const std::string& message) {
        if (level == LogLevel::Warning) warnings.push_back(message);
    });

    OnsetFrameProcessor processor;
    std::vector<bool> results;
    for (int i = 0; i < 20; ++i) {
        Chunk chunk = makeChunk(0.0f);
        if (i == 5) {
            chunk[0] = std::numeric_limits<float>::quiet_NaN();
            chunk[1] = std::numeric_limits<float>::infinity();
            chunk[2] = -std::numeric_limits<float>::infinity();
        }
        if (i == 12) {
            chunk[7] = std::numeric_limits<float>::quiet_NaN();
        }
        results.push_back(processor.process(chunk));
        assert(std::isfinite(processor.lastOdf()));
    }

    Logger::setSink(Logger::Sink());

    // Behaves exactly like silence
    assert(countOnsets(results) == 0);
    assert(processor.lastOdf() == 0.0f);
    assert(processor.threshold() == 0.0f);
    assert(processor.nonFiniteSamples() == 4);
    // Warned once, not per chunk
    assert(warnings.size() == 1);

    // Energies that overflow float still give a finite ODF
    OnsetFrameProcessor huge;
    Chunk big = makeChunk(std::numeric_limits<float>::max());
    for (int i = 0; i < 12; ++i) {
        huge.process(big);
        assert(!std::isnan(huge.lastOdf()));
        assert(std::isfinite(huge.lastOdf()));
    }

    std::cout << "  ✓ Non-finite input test passed" << std::endl;
}

// ============================================================================
// Detection mode
// ============================================================================

void test_detection_mode() {
    std::cout << "Testing detection mode..." << std::endl;

    std::vector<std::string> errors;
    Logger::setSink([&errors](LogLevel level, const std::string& message) {
        if (level == LogLevel::Error) errors.push_back(message);
    });

    OnsetFrameProcessor processor;
    assert(!processor.setMode(OnsetDetectionMode::SpectralDifference));
    assert(processor.getMode() == OnsetDetectionMode::Energy);
    assert(errors.size() == 1);

    assert(processor.setMode(OnsetDetectionMode::Energy));
    assert(processor.getMode() == OnsetDetectionMode::Energy);
    assert(errors.size() == 1);

    Logger::setSink(Logger::Sink());

    assert(std::string(toString(OnsetDetectionMode::Energy)) == "energy");
    assert(std::string(toString(ProcessorState::Ready)) == "ready");

    std::cout << "  ✓ Detection mode test passed" << std::endl;
}

// ============================================================================
// History access
// ============================================================================

void test_history_access() {
    std::cout << "Testing history access..." << std::endl;

    OnsetFrameProcessor processor;
    assert(processor.history(0) == 0.0f);
    assert(processor.history(100) == 0.0f);

    processor.process(makeChunk(1.0f));  // ODF 512
    processor.process(makeChunk(1.0f));  // ODF 1024
    assert(processor.historySize() == 2);
    assert(processor.history(0) == 1024.0f);
    assert(processor.history(1) == 512.0f);
    assert(processor.history(2) == 0.0f);

    std::cout << "  ✓ History access test passed" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════╗\n";
    std::cout << "║     ONSET ANALYZER - PROCESSOR TESTS      ║\n";
    std::cout << "╚═══════════════════════════════════════════╝\n";
    std::cout << "\n";

    // Keep debug output out of the test log
    Logger::setLogLevel(LogLevel::Warning);

    try {
        test_frame_staggering();
        test_warm_up();
        test_silence();
        test_step_onset();
        test_one_chunk_latency();
        test_plateau_is_not_a_peak();
        test_burst_attack_and_release();
        test_threshold_params();
        test_determinism();
        test_non_finite_input();
        test_detection_mode();
        test_history_access();

        std::cout << "\n";
        std::cout << "═══════════════════════════════════════════\n";
        std::cout << "  ✓ ALL TESTS PASSED!\n";
        std::cout << "═══════════════════════════════════════════\n";
        std::cout << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
