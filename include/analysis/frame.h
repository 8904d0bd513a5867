#pragma once

#include <array>
#include <string>
#include "audio/audio_types.h"

namespace OnsetAnalyzer {
namespace Analysis {

using namespace OnsetAnalyzer::Audio;

/**
 * Sliding window of kWindowChunks chunks, oldest first.
 *
 * Chunks live in a fixed ring so write() never allocates or moves sample
 * data around; buffer() linearises the ring on demand.
 */
class Frame {
public:
    Frame();
    ~Frame() = default;

    // Push the newest chunk, returns the evicted oldest chunk
    Chunk write(const Chunk& chunk);

    // All held samples, oldest to newest
    FrameBuffer buffer() const;

    // Sum of squares over buffer(), no windowing
    float energy() const;

    // Debug rendering of the first four samples: "[a,b,c,d...]"
    std::string describe() const;

    // Zero-fill all chunks
    void clear();

private:
    std::array<Chunk, kWindowChunks> m_chunks;
    std::size_t m_oldest;  // Ring index of the oldest chunk

    const Chunk& chunkAt(std::size_t age) const {
        return m_chunks[(m_oldest + age) % kWindowChunks];
    }
};

} // namespace Analysis
} // namespace OnsetAnalyzer
