/**
 * OnsetMonitorApp — Initialisierung, Main-Loop, Shutdown
 */

#include "app/onset_monitor_app.h"
#include "util/logging.h"

#include <chrono>
#include <cstdio>
#include <memory>
#include <thread>

using namespace OnsetAnalyzer::Audio;
using namespace OnsetAnalyzer::Util;

namespace OnsetAnalyzer {

OnsetMonitorApp::OnsetMonitorApp()
    : m_sampleRate(44100) {
}

// ============================================================================
// initialize()
// ============================================================================

bool OnsetMonitorApp::initialize(const Config::OnsetConfig& config) {
    m_config = config;
    Logger::setLogLevel(m_config.logLevel);

    LOG_INFO("Onset Monitor wird initialisiert...");
    LOG_INFO("Threshold: lambda=" + std::to_string(m_config.threshold.lambda) +
             " alpha=" + std::to_string(m_config.threshold.alpha) +
             " peakWeight=" + std::to_string(m_config.threshold.highestPeakWeight) +
             " M=" + std::to_string(Analysis::kThresholdLookback));

    if (!m_config.threshold.isValid()) {
        LOG_ERROR("Ungültige Threshold-Parameter");
        return false;
    }

    // Accumulator bekommt bereits gemischtes Mono-Audio
    int capacityChunks = 2 * MAX_FRAME_SIZE / static_cast<int>(kChunkSize);
    m_accumulator = std::make_unique<ChunkAccumulator>(capacityChunks);
    m_processor = std::make_unique<Analysis::OnsetFrameProcessor>(m_config.threshold);

    m_jackClient = std::make_shared<JackClient>(m_config.jackClientName,
                                                m_config.numInputChannels);
    if (!m_jackClient->initialize()) {
        LOG_ERROR("JACK Client konnte nicht initialisiert werden");
        return false;
    }

    m_sampleRate = m_jackClient->getSampleRate().value;
    int bufferSize = m_jackClient->getBufferSize();
    if (bufferSize > MAX_FRAME_SIZE) {
        LOG_WARN("JACK Buffer Size " + std::to_string(bufferSize) +
                 " > " + std::to_string(MAX_FRAME_SIZE) + ", Blöcke werden gekürzt");
    }

    LOG_INFO("Chunk=" + std::to_string(kChunkSize) +
             " Window=" + std::to_string(kWindowChunks) + " Chunks" +
             " SampleRate=" + std::to_string(m_sampleRate) +
             " (~" + std::to_string(static_cast<int>(1000.0 * kChunkSize / m_sampleRate)) +
             "ms/Chunk)");

    m_jackClient->setProcessCallback(
        [this](const std::vector<const CSAMPLE*>& buffers, int frameCount) {
            processAudio(buffers, frameCount);
        });

    if (!m_jackClient->activate()) {
        return false;
    }

    // Auto-Connect (nach activate!)
    for (size_t i = 0; i < m_config.connectPorts.size(); ++i) {
        const std::string& source = m_config.connectPorts[i];
        if (source.empty()) continue;
        if (!m_jackClient->connectInputPort(static_cast<int>(i), source)) {
            LOG_WARN("Eingang " + std::to_string(i + 1) + " bleibt unverbunden");
        }
    }

    if (m_config.connectPorts.empty() ||
        m_config.connectPorts[0].empty()) {
        auto ports = m_jackClient->getAvailablePorts();
        if (!ports.empty()) {
            LOG_INFO("Verfügbare Quellen (JACK_CONNECT_PORT_1=...):");
            for (const auto& port : ports) {
                LOG_INFO("  " + port);
            }
        }
    }

    return true;
}

// ============================================================================
// run()
// ============================================================================

bool OnsetMonitorApp::run() {
    LOG_INFO("Onset Monitor läuft (Ctrl+C zum Beenden)");
    LOG_INFO("Warte auf Audio...");

    std::thread onsetThread([this]() {
        processOnsetThread();
    });

    // Main-Thread: Events loggen
    while (g_running) {
        drainOnsetEvents();
        if (!m_jackClient->isConnected()) {
            LOG_ERROR("JACK Verbindung verloren");
            g_running = false;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    onsetThread.join();
    drainOnsetEvents();

    return true;
}

void OnsetMonitorApp::drainOnsetEvents() {
    auto& ring = m_eventRing;
    while (true) {
        int r = ring.rpos.load(std::memory_order_relaxed);
        if (r == ring.wpos.load(std::memory_order_acquire)) break;

        OnsetEvent event = ring.events[r];
        ring.rpos.store((r + 1) & EVENT_RING_MASK, std::memory_order_release);

        double seconds = FramePos::fromChunkIndex(event.chunkIndex).toSeconds(m_sampleRate);
        char line[160];
        std::snprintf(line, sizeof(line),
                      "ONSET | t=%.3fs chunk=%lld odf=%.2f thr=%.2f peak=%.2f",
                      seconds, static_cast<long long>(event.chunkIndex),
                      event.odf, event.threshold, event.highestPeak);
        LOG_INFO(line);
    }
}

// ============================================================================
// shutdown()
// ============================================================================

void OnsetMonitorApp::shutdown() {
    LOG_INFO("Onset Monitor wird beendet...");

    if (m_jackClient) {
        m_jackClient->deactivate();
    }

    LOG_INFO("Empfangene Samples: " + std::to_string(m_framesReceived.load()));

    if (m_processor) {
        LOG_INFO("Chunks: " + std::to_string(m_processor->chunksProcessed()) +
                 ", Onsets: " + std::to_string(m_processor->onsetCount()) +
                 ", höchster Peak: " + std::to_string(m_processor->highestPeak()));
        if (m_processor->nonFiniteSamples() > 0) {
            LOG_WARN("Ungültige Samples ersetzt: " +
                     std::to_string(m_processor->nonFiniteSamples()));
        }
    }

    int64_t dropped = m_droppedBlocks.load();
    int64_t truncated = m_truncatedBlocks.load();
    int64_t droppedEvents = m_droppedEvents.load();
    if (dropped > 0 || truncated > 0 || droppedEvents > 0) {
        LOG_WARN("Verworfene Blöcke: " + std::to_string(dropped) +
                 ", gekürzte Blöcke: " + std::to_string(truncated) +
                 ", verworfene Events: " + std::to_string(droppedEvents));
    }

    LOG_INFO("Onset Monitor beendet");
}

} // namespace OnsetAnalyzer
