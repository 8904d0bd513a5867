#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace OnsetAnalyzer {
namespace Audio {

// Audio sample type (float, same as JACK)
using CSAMPLE = float;

// Samples per chunk handed to the onset processor
constexpr std::size_t kChunkSize = 512;

// Chunks per sliding analysis frame (2048 samples)
constexpr std::size_t kWindowChunks = 4;

constexpr std::size_t kFrameSize = kChunkSize * kWindowChunks;

using Chunk = std::array<CSAMPLE, kChunkSize>;
using FrameBuffer = std::array<CSAMPLE, kFrameSize>;

// Frame position in samples
struct FramePos {
    int64_t frame;

    explicit FramePos(int64_t f = 0) : frame(f) {}

    double toSeconds(int sampleRate) const {
        return static_cast<double>(frame) / sampleRate;
    }

    static FramePos fromChunkIndex(int64_t chunkIndex) {
        return FramePos(chunkIndex * static_cast<int64_t>(kChunkSize));
    }
};

// Sample rate wrapper
struct SampleRate {
    int value;

    explicit SampleRate(int v = 44100) : value(v) {}
};

} // namespace Audio
} // namespace OnsetAnalyzer
