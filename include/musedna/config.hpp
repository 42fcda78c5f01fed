#pragma once
#include <cstddef>
#include <cstdint>

#include "musedna/constants.hpp"

namespace musedna {

struct CodecConfig {
    // Output/expected sample rate of the audio artifact.
    uint32_t sample_rate_hz{SAMPLE_RATE_HZ};
    // Duration of one symbol tone in seconds. Also the detector's grid step.
    double tone_duration_s{NOTE_DURATION_S};
    // Peak amplitude as a fraction of int16 full scale, in (0, 1].
    double volume{NOTE_VOLUME};
    // Portion of each tone window handed to the FFT, as fractions of the
    // window. The defaults keep the middle 50%.
    double analysis_start_fraction{0.25};
    double analysis_end_fraction{0.75};

    // Samples per tone window: int(rate * duration).
    size_t samples_per_tone() const;

    // Throws std::invalid_argument on a config the pipelines cannot run.
    void validate() const;
};

} // namespace musedna
