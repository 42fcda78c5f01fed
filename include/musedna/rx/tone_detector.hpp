#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "musedna/config.hpp"
#include "musedna/workspace.hpp"

namespace musedna::rx {

// Fixed-grid tone detector.
//  - The signal is cut into floor(total / W) back-to-back windows of
//    W = samples_per_tone() samples; a trailing partial window is dropped.
//  - Only [W*start, W*end) of each window (the middle half by default) goes
//    to the FFT so onset and tail of neighbouring tones do not leak in.
//  - The strongest bin in the positive half of the spectrum is converted to
//    Hz and snapped to the nearest tone. No harmonic rejection is attempted.
// There is no synchronization: window k is assumed to hold symbol k.
class ToneDetector {
public:
    explicit ToneDetector(const CodecConfig &cfg = {});

    // Detected symbol stream, one entry per full window.
    [[nodiscard]] std::vector<uint8_t> detect(std::span<const float> samples);

    // Frequency (Hz) of the strongest positive-frequency bin of `segment`.
    // Returns a negative value for an empty segment.
    [[nodiscard]] double peak_frequency(std::span<const float> segment);

    [[nodiscard]] std::size_t window_samples() const { return window_; }
    [[nodiscard]] std::size_t analysis_offset() const { return offset_; }
    [[nodiscard]] std::size_t analysis_length() const { return length_; }

private:
    CodecConfig cfg_;
    std::size_t window_ = 0;
    std::size_t offset_ = 0;
    std::size_t length_ = 0;
    Workspace ws_;
};

} // namespace musedna::rx
