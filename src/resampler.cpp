#include "resampler.hpp"
#include <cmath>

namespace sotto {
namespace resampler {

int decimation_factor(int source_rate, int target_rate) {
    if (source_rate <= 0 || target_rate <= 0 || source_rate <= target_rate) return 1;
    int factor = static_cast<int>(std::lround(static_cast<double>(source_rate) / target_rate));
    return factor < 1 ? 1 : factor;
}

size_t output_length(size_t input_length, int source_rate, int target_rate) {
    const size_t factor = static_cast<size_t>(decimation_factor(source_rate, target_rate));
    return (input_length + factor - 1) / factor;
}

std::vector<float> resample(const float* input, size_t count,
                            int source_rate, int target_rate) {
    std::vector<float> out;
    out.reserve(output_length(count, source_rate, target_rate));
    resample_into(input, count, source_rate, target_rate, out);
    return out;
}

size_t resample_into(const float* input, size_t count,
                     int source_rate, int target_rate,
                     std::vector<float>& out) {
    const size_t factor = static_cast<size_t>(decimation_factor(source_rate, target_rate));
    if (factor == 1) {
        out.insert(out.end(), input, input + count);
        return count;
    }

    size_t appended = 0;
    for (size_t i = 0; i < count; i += factor) {
        out.push_back(input[i]);
        ++appended;
    }
    return appended;
}

} // namespace resampler
} // namespace sotto
