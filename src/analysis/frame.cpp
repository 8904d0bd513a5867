#include "analysis/frame.h"
#include <algorithm>
#include <sstream>

namespace OnsetAnalyzer {
namespace Analysis {

static_assert(kChunkSize >= 4, "describe() prints four samples");

Frame::Frame()
    : m_oldest(0) {
    clear();
}

Chunk Frame::write(const Chunk& chunk) {
    Chunk evicted = m_chunks[m_oldest];
    m_chunks[m_oldest] = chunk;
    m_oldest = (m_oldest + 1) % kWindowChunks;
    return evicted;
}

FrameBuffer Frame::buffer() const {
    FrameBuffer out;
    for (std::size_t i = 0; i < kWindowChunks; ++i) {
        const Chunk& chunk = chunkAt(i);
        std::copy(chunk.begin(), chunk.end(), out.begin() + i * kChunkSize);
    }
    return out;
}

float Frame::energy() const {
    // Same summation order as buffer()
    float sum = 0.0f;
    for (std::size_t i = 0; i < kWindowChunks; ++i) {
        for (CSAMPLE s : chunkAt(i)) {
            sum += s * s;
        }
    }
    return sum;
}

std::string Frame::describe() const {
    const Chunk& first = chunkAt(0);
    std::ostringstream ss;
    ss << "[" << first[0] << "," << first[1] << "," << first[2] << ","
       << first[3] << "...]";
    return ss.str();
}

void Frame::clear() {
    for (auto& chunk : m_chunks) {
        chunk.fill(0.0f);
    }
    m_oldest = 0;
}

} // namespace Analysis
} // namespace OnsetAnalyzer
