#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <liquid/liquid.h>

namespace musedna {

// Arbitrary-rate real resampler around liquid-dsp's multi-stage msresamp.
// The filter delay is removed, so sample k of the output lines up with
// time k / to_hz of the input, and the output holds round(n * to / from)
// samples.
class Resampler {
public:
    Resampler(uint32_t from_hz, uint32_t to_hz, float stopband_db = 60.0f);
    ~Resampler();
    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    std::vector<float> process(std::span<const float> in);

    double rate() const { return rate_; }

private:
    double rate_;
    msresamp_rrrf q{nullptr};
};

// One-shot helper. Returns the input unchanged when the rates match.
std::vector<float> resample(std::span<const float> in, uint32_t from_hz, uint32_t to_hz);

} // namespace musedna
