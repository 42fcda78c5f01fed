#include "musedna/resampler.hpp"

#include <cmath>
#include <stdexcept>

namespace musedna {

Resampler::Resampler(uint32_t from_hz, uint32_t to_hz, float stopband_db)
    : rate_(from_hz ? static_cast<double>(to_hz) / static_cast<double>(from_hz) : 0.0) {
    if (from_hz == 0 || to_hz == 0)
        throw std::invalid_argument("Resampler rates must be positive");
    q = msresamp_rrrf_create(static_cast<float>(rate_), stopband_db);
    if (!q)
        throw std::runtime_error("liquid-dsp failed to create a resampler");
}

Resampler::~Resampler() {
    if (q)
        msresamp_rrrf_destroy(q);
}

std::vector<float> Resampler::process(std::span<const float> in) {
    msresamp_rrrf_reset(q);
    const auto target = static_cast<std::size_t>(std::llround(static_cast<double>(in.size()) * rate_));

    // Output-side delay of the filter chain; flush it out with trailing zeros.
    const double delay = msresamp_rrrf_get_delay(q);
    const auto skip = static_cast<std::size_t>(std::llround(delay));
    const auto flush = static_cast<std::size_t>(std::ceil(delay / rate_)) + 16;

    std::vector<float> x(in.begin(), in.end());
    x.resize(in.size() + flush, 0.0f);
    std::vector<float> y(static_cast<std::size_t>(std::ceil(static_cast<double>(x.size()) * rate_)) + 64);

    unsigned int ny = 0;
    msresamp_rrrf_execute(q, x.data(), static_cast<unsigned int>(x.size()), y.data(), &ny);
    y.resize(ny);

    std::vector<float> out;
    out.reserve(target);
    if (skip < y.size())
        out.assign(y.begin() + static_cast<std::ptrdiff_t>(skip), y.end());
    out.resize(target, 0.0f);
    return out;
}

std::vector<float> resample(std::span<const float> in, uint32_t from_hz, uint32_t to_hz) {
    if (from_hz == to_hz)
        return std::vector<float>(in.begin(), in.end());
    Resampler r(from_hz, to_hz);
    return r.process(in);
}

} // namespace musedna
