#include "musedna/config.hpp"

#include <stdexcept>

namespace musedna {

size_t CodecConfig::samples_per_tone() const {
    return static_cast<size_t>(static_cast<double>(sample_rate_hz) * tone_duration_s);
}

void CodecConfig::validate() const {
    if (sample_rate_hz == 0)
        throw std::invalid_argument("Sample rate must be positive");
    if (tone_duration_s <= 0.0)
        throw std::invalid_argument("Tone duration must be positive");
    if (samples_per_tone() < 2)
        throw std::invalid_argument("Tone duration too short for the sample rate");
    if (volume <= 0.0 || volume > 1.0)
        throw std::invalid_argument("Volume must be in (0, 1]");
    if (analysis_start_fraction < 0.0 || analysis_end_fraction > 1.0 ||
        analysis_start_fraction >= analysis_end_fraction)
        throw std::invalid_argument("Analysis window must satisfy 0 <= start < end <= 1");
}

} // namespace musedna
