#include "audio/chunk_accumulator.h"
#include <algorithm>

namespace OnsetAnalyzer {
namespace Audio {

ChunkAccumulator::ChunkAccumulator(int capacityChunks)
    : m_capacity(std::max(1, capacityChunks) * static_cast<int>(kChunkSize)),
      m_readPos(0),
      m_writePos(0),
      m_count(0),
      m_chunksEmitted(0),
      m_droppedSamples(0) {
    m_buffer.resize(m_capacity, 0.0f);
}

void ChunkAccumulator::push(CSAMPLE sample) {
    m_buffer[m_writePos] = sample;
    m_writePos = advance(m_writePos, 1);
    m_count++;
    if (m_count > m_capacity) {
        m_count = m_capacity;
        m_readPos = advance(m_readPos, 1);
        m_droppedSamples++;
    }
}

void ChunkAccumulator::write(const CSAMPLE* samples, int sampleCount) {
    for (int i = 0; i < sampleCount; ++i) {
        push(samples[i]);
    }
}

bool ChunkAccumulator::pop(Chunk& out) {
    if (m_count < static_cast<int>(kChunkSize)) {
        return false;
    }

    for (std::size_t i = 0; i < kChunkSize; ++i) {
        out[i] = m_buffer[m_readPos];
        m_readPos = advance(m_readPos, 1);
    }
    m_count -= static_cast<int>(kChunkSize);
    m_chunksEmitted++;
    return true;
}

void ChunkAccumulator::clear() {
    std::fill(m_buffer.begin(), m_buffer.end(), 0.0f);
    m_readPos = 0;
    m_writePos = 0;
    m_count = 0;
    m_chunksEmitted = 0;
    m_droppedSamples = 0;
}

} // namespace Audio
} // namespace OnsetAnalyzer
