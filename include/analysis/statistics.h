#ifndef ONSET_ANALYZER_STATISTICS_H
#define ONSET_ANALYZER_STATISTICS_H

#include <array>
#include <algorithm>
#include <cstddef>

namespace OnsetAnalyzer {
namespace Analysis {

/**
 * Summary statistics over a fixed-size sample set.
 *
 * Inputs must be finite: median() sorts with operator<, which is not a
 * total order once NaN is involved.
 */

template <std::size_t N>
float mean(const std::array<float, N>& values) {
    static_assert(N > 0, "mean() of an empty set is undefined");
    float sum = 0.0f;
    for (float v : values) {
        sum += v;
    }
    return sum / static_cast<float>(N);
}

/**
 * Median of a sorted copy.
 *
 * Even-length sets use the mean of the sorted range [mid - 1, mid), which is
 * the lower middle element, not the average of both middle elements.
 * The threshold weights are tuned against this definition.
 */
template <std::size_t N>
float median(const std::array<float, N>& values) {
    static_assert(N > 0, "median() of an empty set is undefined");
    std::array<float, N> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    const std::size_t middle = N / 2;
    if (N % 2 == 0) {
        // [middle - 1, middle) holds a single element
        return sorted[middle - 1];
    }
    return sorted[middle];
}

} // namespace Analysis
} // namespace OnsetAnalyzer

#endif // ONSET_ANALYZER_STATISTICS_H
