#pragma once

#include <vector>
#include <cstdint>
#include "audio_types.h"

namespace OnsetAnalyzer {
namespace Audio {

/**
 * Circular mono sample buffer that turns host blocks of arbitrary length
 * into fixed-size chunks for the onset processor.
 *
 * Storage is allocated once in the constructor. When more samples arrive
 * than fit, the oldest ones are overwritten and counted as dropped.
 */
class ChunkAccumulator {
public:
    explicit ChunkAccumulator(int capacityChunks = 8);
    ~ChunkAccumulator() = default;

    // Non-copyable
    ChunkAccumulator(const ChunkAccumulator&) = delete;
    ChunkAccumulator& operator=(const ChunkAccumulator&) = delete;

    // Append mono samples
    void write(const CSAMPLE* samples, int sampleCount);

    // Pop the next complete chunk. Returns false if fewer than kChunkSize
    // samples are buffered.
    bool pop(Chunk& out);

    // Clear the buffer
    void clear();

    // Mono samples waiting to be popped
    int available() const { return m_count; }

    // Complete chunks waiting to be popped
    int chunksAvailable() const { return m_count / static_cast<int>(kChunkSize); }

    // Properties
    int getCapacity() const { return m_capacity; }
    int64_t getChunksEmitted() const { return m_chunksEmitted; }
    int64_t getDroppedSamples() const { return m_droppedSamples; }

private:
    std::vector<CSAMPLE> m_buffer;
    int m_capacity;
    int m_readPos;
    int m_writePos;
    int m_count;
    int64_t m_chunksEmitted;
    int64_t m_droppedSamples;

    void push(CSAMPLE sample);

    // Helper for circular access
    int advance(int pos, int count) const {
        return (pos + count) % m_capacity;
    }
};

} // namespace Audio
} // namespace OnsetAnalyzer
