#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vd {

/// Number of loudness buckets the backend expects for a voice note.
constexpr size_t  kWaveformBuckets = 63;

/// Largest bucket value (5-bit range).
constexpr uint8_t kWaveformMax = 31;

/// Summarize mono float samples as a fixed-length loudness waveform.
///
/// The sample span is cut into `buckets` equal slices
/// ([i*n/buckets, (i+1)*n/buckets)).  Each slice's peak absolute amplitude is
/// clamped to full scale (1.0) and quantized linearly as floor(peak * 31).
/// Empty slices (fewer samples than buckets) are 0.
std::vector<uint8_t> compute_waveform(const std::vector<float>& samples,
                                      size_t buckets = kWaveformBuckets);

/// Quantize one peak amplitude to [0, kWaveformMax].
uint8_t quantize_peak(float peak);

} // namespace vd
