#pragma once

#include <vector>
#include <cstddef>

namespace sotto {

// Downsampling by plain decimation: keeps one sample out of every
// round(source_rate / target_rate). No low-pass filtering is applied.
namespace resampler {

// Number of input samples consumed per output sample. 1 means passthrough.
int decimation_factor(int source_rate, int target_rate);

// Output length for `input_length` samples: ceil(input_length / factor)
size_t output_length(size_t input_length, int source_rate, int target_rate);

std::vector<float> resample(const float* input, size_t count,
                            int source_rate, int target_rate);

inline std::vector<float> resample(const std::vector<float>& input,
                                   int source_rate, int target_rate) {
    return resample(input.data(), input.size(), source_rate, target_rate);
}

// Appends the decimated samples to `out`. Returns the number appended.
size_t resample_into(const float* input, size_t count,
                     int source_rate, int target_rate,
                     std::vector<float>& out);

} // namespace resampler

} // namespace sotto
