#pragma once

/**
 * Onset Frame Processor
 *
 * Energy-based onset detection over a stream of fixed-size chunks:
 *
 *   chunk → current Frame → (evicted chunk) → previous Frame
 *   ODF   = |energy(current) - energy(previous)|
 *   σn    = λ · median(O[n..n-M)) + α · mean(O[n..n-M)) + w · highestPeak
 *   onset = O[n-1] is a strict local maximum AND O[n-1] > σn
 *
 * Detection lags the live chunk by exactly one call because the peak test
 * inspects the previous ODF value.
 *
 * Single-threaded. process() does not allocate; drive it from one thread
 * in strict arrival order.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include "analysis/frame.h"
#include "audio/audio_types.h"

namespace OnsetAnalyzer {
namespace Analysis {

using namespace OnsetAnalyzer::Audio;

// Number of recent ODF values the threshold is computed over (M)
constexpr std::size_t kThresholdLookback = 10;

// Values the peak picker inspects: curr, prev, prevPrev
constexpr std::size_t kPeakPickSpan = 3;

constexpr std::size_t kHistoryCapacity =
    kThresholdLookback > kPeakPickSpan ? kThresholdLookback : kPeakPickSpan;

enum class OnsetDetectionMode {
    Energy,
    SpectralDifference  // Declared, not implemented
};

enum class ProcessorState {
    WarmingUp,  // Fewer than kHistoryCapacity ODF values seen
    Ready
};

/**
 * Adaptive threshold weights
 */
struct ThresholdParams {
    float lambda = 1.0f;              // Median weight
    float alpha = 0.7f;               // Mean weight
    float highestPeakWeight = 0.05f;  // Decayed peak memory

    bool isValid() const;
};

const char* toString(OnsetDetectionMode mode);
const char* toString(ProcessorState state);

class OnsetFrameProcessor {
public:
    explicit OnsetFrameProcessor(const ThresholdParams& params = ThresholdParams());
    ~OnsetFrameProcessor() = default;

    // Process one chunk. Returns true if the previous chunk's ODF value
    // was a confirmed onset.
    bool process(const Chunk& chunk);

    // Only OnsetDetectionMode::Energy is supported; anything else is
    // rejected and the current mode kept.
    bool setMode(OnsetDetectionMode mode);
    OnsetDetectionMode getMode() const { return m_mode; }

    // Back to the freshly constructed state (params and mode are kept)
    void reset();

    ProcessorState state() const { return m_state; }
    bool isReady() const { return m_state == ProcessorState::Ready; }

    const ThresholdParams& params() const { return m_params; }

    // 0 while warming up
    float threshold() const { return m_threshold; }
    float highestPeak() const { return m_highestPeak; }

    // ODF value computed by the last process() call
    float lastOdf() const { return m_historySize > 0 ? m_history[0] : 0.0f; }

    // ODF history, 0 = newest. Returns 0 for indices not (yet) held.
    float history(std::size_t index) const;
    std::size_t historySize() const { return m_historySize; }

    int64_t chunksProcessed() const { return m_chunksProcessed; }
    int64_t onsetCount() const { return m_onsetCount; }
    int64_t nonFiniteSamples() const { return m_nonFiniteSamples; }

    const Frame& currentFrame() const { return m_current; }
    const Frame& previousFrame() const { return m_previous; }

private:
    ThresholdParams m_params;
    OnsetDetectionMode m_mode;
    ProcessorState m_state;

    // m_previous lags m_current by one chunk write
    Frame m_previous;
    Frame m_current;

    std::array<float, kHistoryCapacity> m_history;
    std::size_t m_historySize;

    float m_threshold;
    float m_highestPeak;

    int64_t m_chunksProcessed;
    int64_t m_onsetCount;
    int64_t m_nonFiniteSamples;

    void shift(const Chunk& chunk);
    float computeEnergyOdf() const;
    void updateHistory(float odf);
    float calculateThreshold();
    bool checkForPreviousOnset();
};

} // namespace Analysis
} // namespace OnsetAnalyzer
