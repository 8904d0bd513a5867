#include "analysis/onset_frame_processor.h"
#include "analysis/statistics.h"
#include "util/logging.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace OnsetAnalyzer {
namespace Analysis {

// ============================================================================
// ThresholdParams
// ============================================================================

bool ThresholdParams::isValid() const {
    return std::isfinite(lambda) && std::isfinite(alpha) &&
           std::isfinite(highestPeakWeight) &&
           lambda >= 0.0f && alpha >= 0.0f && highestPeakWeight >= 0.0f;
}

const char* toString(OnsetDetectionMode mode) {
    switch (mode) {
        case OnsetDetectionMode::Energy:             return "energy";
        case OnsetDetectionMode::SpectralDifference: return "spectral-difference";
        default:                                     return "unknown";
    }
}

const char* toString(ProcessorState state) {
    switch (state) {
        case ProcessorState::WarmingUp: return "warming-up";
        case ProcessorState::Ready:     return "ready";
        default:                        return "unknown";
    }
}

// ============================================================================
// OnsetFrameProcessor
// ============================================================================

OnsetFrameProcessor::OnsetFrameProcessor(const ThresholdParams& params)
    : m_params(params),
      m_mode(OnsetDetectionMode::Energy) {
    reset();
}

void OnsetFrameProcessor::reset() {
    m_state = ProcessorState::WarmingUp;
    m_previous.clear();
    m_current.clear();
    m_history.fill(0.0f);
    m_historySize = 0;
    m_threshold = 0.0f;
    m_highestPeak = 0.0f;
    m_chunksProcessed = 0;
    m_onsetCount = 0;
    m_nonFiniteSamples = 0;
}

bool OnsetFrameProcessor::setMode(OnsetDetectionMode mode) {
    if (mode != OnsetDetectionMode::Energy) {
        LOG_ERROR(std::string("Onset detection mode not implemented: ") + toString(mode));
        return false;
    }
    m_mode = mode;
    return true;
}

float OnsetFrameProcessor::history(std::size_t index) const {
    return index < m_historySize ? m_history[index] : 0.0f;
}

bool OnsetFrameProcessor::process(const Chunk& chunk) {
    shift(chunk);
    m_chunksProcessed++;

    updateHistory(computeEnergyOdf());

    if (m_state == ProcessorState::WarmingUp) {
        if (m_historySize < kHistoryCapacity) {
            return false;
        }
        m_state = ProcessorState::Ready;
        LOG_DEBUG("Onset processor ready after " +
                  std::to_string(m_chunksProcessed) + " chunks");
    }

    calculateThreshold();
    return checkForPreviousOnset();
}

void OnsetFrameProcessor::shift(const Chunk& chunk) {
    Chunk clean = chunk;
    int64_t replaced = 0;
    for (auto& s : clean) {
        if (!std::isfinite(s)) {
            s = 0.0f;
            replaced++;
        }
    }

    if (replaced > 0) {
        if (m_nonFiniteSamples == 0) {
            LOG_WARN("Non-finite input samples replaced by 0 (chunk " +
                     std::to_string(m_chunksProcessed) + ")");
        }
        m_nonFiniteSamples += replaced;
    }

    Chunk carryOver = m_current.write(clean);
    m_previous.write(carryOver);
}

float OnsetFrameProcessor::computeEnergyOdf() const {
    float odf = std::fabs(m_current.energy() - m_previous.energy());
    // Overflowing energies must not leak NaN/Inf into the median sort
    if (!std::isfinite(odf)) {
        odf = std::numeric_limits<float>::max();
    }
    return odf;
}

void OnsetFrameProcessor::updateHistory(float odf) {
    std::copy_backward(m_history.begin(), m_history.end() - 1, m_history.end());
    m_history[0] = odf;
    if (m_historySize < kHistoryCapacity) {
        m_historySize++;
    }
}

float OnsetFrameProcessor::calculateThreshold() {
    std::array<float, kThresholdLookback> recent;
    std::copy(m_history.begin(), m_history.begin() + kThresholdLookback, recent.begin());

    float weightedHighestPeak = m_highestPeak * m_params.highestPeakWeight;
    m_threshold = m_params.lambda * median(recent)
                + m_params.alpha * mean(recent)
                + weightedHighestPeak;
    return m_threshold;
}

bool OnsetFrameProcessor::checkForPreviousOnset() {
    float curr = m_history[0];
    float prev = m_history[1];
    float prevPrev = m_history[2];

    bool isPeak = prev > curr && prev > prevPrev;
    if (!isPeak || prev <= m_threshold) {
        return false;
    }

    if (prev > m_highestPeak) {
        m_highestPeak = prev;
    }
    m_onsetCount++;
    return true;
}

} // namespace Analysis
} // namespace OnsetAnalyzer
