#include "Waveform.hpp"

#include <algorithm>
#include <cmath>

namespace vd {

uint8_t quantize_peak(float peak) {
    if (!(peak > 0.0f)) return 0;   // also catches NaN
    float clamped = std::min(peak, 1.0f);
    int v = static_cast<int>(std::floor(clamped * static_cast<float>(kWaveformMax)));
    return static_cast<uint8_t>(std::clamp(v, 0, static_cast<int>(kWaveformMax)));
}

std::vector<uint8_t> compute_waveform(const std::vector<float>& samples, size_t buckets) {
    std::vector<uint8_t> out(buckets, 0);
    if (buckets == 0 || samples.empty()) return out;

    const size_t n = samples.size();
    for (size_t i = 0; i < buckets; ++i) {
        size_t begin = i * n / buckets;
        size_t end   = (i + 1) * n / buckets;

        float peak = 0.0f;
        for (size_t j = begin; j < end; ++j) {
            peak = std::max(peak, std::fabs(samples[j]));
        }
        out[i] = quantize_peak(peak);
    }
    return out;
}

} // namespace vd
