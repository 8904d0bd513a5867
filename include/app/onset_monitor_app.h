#pragma once

/**
 * OnsetMonitorApp — Host für den Onset Frame Processor
 *
 *   JACK Audio → Mono-Downmix → SPSC Ringbuffer → Onset-Thread
 *   Onset-Thread: ChunkAccumulator → OnsetFrameProcessor → Event-Ring
 *   Main-Thread:  Event-Ring → Log
 *
 * Der Processor gehört exklusiv dem Onset-Thread und sieht die Chunks
 * in Ankunftsreihenfolge.
 */

#include "audio/jack_client.h"
#include "audio/chunk_accumulator.h"
#include "analysis/onset_frame_processor.h"
#include "config/onset_config.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace OnsetAnalyzer {

// Globaler Shutdown-Flag (gesetzt von Signal-Handler)
extern std::atomic<bool> g_running;

class OnsetMonitorApp {
public:
    OnsetMonitorApp();

    bool initialize(const Config::OnsetConfig& config);
    bool run();
    void shutdown();

private:
    // Lock-free Audio Ringbuffer: JACK-Callback → Onset-Thread
    static constexpr int AUDIO_RING_SIZE = 64;
    static constexpr int AUDIO_RING_MASK = AUDIO_RING_SIZE - 1;
    static constexpr int MAX_FRAME_SIZE = 2048;

    struct AudioSlot {
        float data[MAX_FRAME_SIZE];
        int frameCount = 0;
    };

    struct AudioRing {
        AudioSlot slots[AUDIO_RING_SIZE];
        alignas(64) std::atomic<int> wpos{0};
        alignas(64) std::atomic<int> rpos{0};
    };

    // Bestätigter Onset: Onset-Thread → Main-Thread
    struct OnsetEvent {
        int64_t chunkIndex = 0;   // Chunk, dessen ODF-Wert der Peak war
        float odf = 0.0f;
        float threshold = 0.0f;
        float highestPeak = 0.0f;
    };

    static constexpr int EVENT_RING_SIZE = 32;
    static constexpr int EVENT_RING_MASK = EVENT_RING_SIZE - 1;

    struct EventRing {
        OnsetEvent events[EVENT_RING_SIZE];
        alignas(64) std::atomic<int> wpos{0};
        alignas(64) std::atomic<int> rpos{0};
    };

    /// JACK Audio Callback — Downmix + Ringbuffer-Copy, kein Processing
    void processAudio(const std::vector<const Audio::CSAMPLE*>& inputBuffers,
                      int frameCount);

    /// Onset-Thread: Chunks bilden und Processor füttern
    void processOnsetThread();

    /// Onset-Events aus dem Event-Ring loggen (Main-Thread)
    void drainOnsetEvents();

    Config::OnsetConfig m_config;

    std::shared_ptr<Audio::JackClient> m_jackClient;
    int m_sampleRate;

    // Ringbuffer (SPSC)
    AudioRing m_audioRing;
    EventRing m_eventRing;

    // Nur im Onset-Thread benutzt
    std::unique_ptr<Audio::ChunkAccumulator> m_accumulator;
    std::unique_ptr<Analysis::OnsetFrameProcessor> m_processor;

    // Status
    std::atomic<int64_t> m_framesReceived{0};
    std::atomic<int64_t> m_droppedBlocks{0};
    std::atomic<int64_t> m_truncatedBlocks{0};
    std::atomic<int64_t> m_droppedEvents{0};
};

} // namespace OnsetAnalyzer
