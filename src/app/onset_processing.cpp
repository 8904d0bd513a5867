/**
 * OnsetMonitorApp — Audio + Onset Verarbeitung
 *
 * processAudio():       JACK RT-Callback → Mono-Downmix → Ringbuffer
 * processOnsetThread(): Ringbuffer → Chunks → OnsetFrameProcessor → Event-Ring
 */

#include "app/onset_monitor_app.h"
#include "util/logging.h"

#include <chrono>
#include <cstdio>
#include <thread>

using namespace OnsetAnalyzer::Audio;
using namespace OnsetAnalyzer::Util;

namespace OnsetAnalyzer {

// ============================================================================
// processAudio() — JACK RT Callback
// ============================================================================
// Läuft im JACK-Realtime-Thread. Kein malloc, kein mutex, kein I/O.
// Bei Ringbuffer-Overflow wird der Block verworfen (besser als XRun).

void OnsetMonitorApp::processAudio(const std::vector<const CSAMPLE*>& inputBuffers,
                                   int frameCount) {
    if (inputBuffers.empty() || frameCount <= 0) return;

    auto& ring = m_audioRing;
    int w = ring.wpos.load(std::memory_order_relaxed);
    int next = (w + 1) & AUDIO_RING_MASK;
    if (next == ring.rpos.load(std::memory_order_acquire)) {
        m_droppedBlocks.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    int frames = frameCount;
    if (frames > MAX_FRAME_SIZE) {
        frames = MAX_FRAME_SIZE;
        m_truncatedBlocks.fetch_add(1, std::memory_order_relaxed);
    }

    auto& slot = ring.slots[w];
    const float scale = 1.0f / static_cast<float>(inputBuffers.size());
    for (int i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (const CSAMPLE* buffer : inputBuffers) {
            sum += buffer[i];
        }
        slot.data[i] = sum * scale;
    }
    slot.frameCount = frames;
    ring.wpos.store(next, std::memory_order_release);

    m_framesReceived.fetch_add(frameCount, std::memory_order_relaxed);
}

// ============================================================================
// processOnsetThread() — Chunks bilden + Onset Detection
// ============================================================================
// Einziger Besitzer von m_accumulator und m_processor.

void OnsetMonitorApp::processOnsetThread() {
    const auto interval = std::chrono::microseconds(500);  // 2kHz polling
    auto& ring = m_audioRing;
    Chunk chunk;

    while (g_running) {
        bool didWork = false;

        while (true) {
            int r = ring.rpos.load(std::memory_order_relaxed);
            if (r == ring.wpos.load(std::memory_order_acquire)) break;

            const auto& slot = ring.slots[r];
            m_accumulator->write(slot.data, slot.frameCount);
            ring.rpos.store((r + 1) & AUDIO_RING_MASK, std::memory_order_release);
            didWork = true;

            while (m_accumulator->pop(chunk)) {
                bool onset = m_processor->process(chunk);

                if (m_config.debugConsole && Logger::isEnabled(LogLevel::Debug)) {
                    char line[128];
                    std::snprintf(line, sizeof(line),
                                  "ODF | chunk=%lld odf=%.2f thr=%.2f state=%s frame=",
                                  static_cast<long long>(m_processor->chunksProcessed() - 1),
                                  m_processor->lastOdf(), m_processor->threshold(),
                                  Analysis::toString(m_processor->state()));
                    LOG_DEBUG(line + m_processor->currentFrame().describe());
                }

                if (!onset) continue;

                // Der Peak liegt einen Chunk zurück (history[1])
                OnsetEvent event;
                event.chunkIndex = m_processor->chunksProcessed() - 2;
                event.odf = m_processor->history(1);
                event.threshold = m_processor->threshold();
                event.highestPeak = m_processor->highestPeak();

                auto& events = m_eventRing;
                int ew = events.wpos.load(std::memory_order_relaxed);
                int enext = (ew + 1) & EVENT_RING_MASK;
                if (enext == events.rpos.load(std::memory_order_acquire)) {
                    m_droppedEvents.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                events.events[ew] = event;
                events.wpos.store(enext, std::memory_order_release);
            }
        }

        if (!didWork) {
            std::this_thread::sleep_for(interval);
        }
    }
}

} // namespace OnsetAnalyzer
