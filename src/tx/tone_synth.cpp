#include "musedna/tx/tone_synth.hpp"
#include "musedna/utils/tone_map.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>

namespace musedna::tx {

std::vector<int16_t> synthesize_tone(double frequency_hz,
                                     double duration_s,
                                     uint32_t sample_rate_hz,
                                     double volume) {
    const size_t L = static_cast<size_t>(static_cast<double>(sample_rate_hz) * duration_s);
    std::vector<int16_t> out(L, 0);
    if (L == 0) return out;

    std::vector<double> data(L);
    double peak = 0.0;
    for (size_t i = 0; i < L; ++i) {
        const double t = duration_s * static_cast<double>(i) / static_cast<double>(L);
        double x = std::sin(2.0 * std::numbers::pi * frequency_hz * t);
        x += 0.5 * std::sin(2.0 * std::numbers::pi * 2.0 * frequency_hz * t);
        const double u = (L > 1) ? static_cast<double>(i) / static_cast<double>(L - 1) : 0.0;
        x *= std::exp(-5.0 * u);
        data[i] = x;
        peak = std::max(peak, std::fabs(x));
    }
    if (peak == 0.0) return out;

    const double amplitude = static_cast<double>(std::numeric_limits<int16_t>::max()) * volume;
    for (size_t i = 0; i < L; ++i)
        out[i] = static_cast<int16_t>(amplitude * data[i] / peak);
    return out;
}

std::vector<int16_t> render_symbols(std::span<const uint8_t> symbols, const CodecConfig& cfg) {
    const size_t L = cfg.samples_per_tone();
    // Every symbol value renders to the same samples, so each is built once.
    std::array<std::vector<int16_t>, GF_ORDER> cache;

    std::vector<int16_t> out;
    out.reserve(symbols.size() * L);
    for (uint8_t s : symbols) {
        const double f = utils::symbol_to_frequency(s);
        auto& tone = cache[s];
        if (tone.empty())
            tone = synthesize_tone(f, cfg.tone_duration_s, cfg.sample_rate_hz, cfg.volume);
        out.insert(out.end(), tone.begin(), tone.end());
    }
    return out;
}

} // namespace musedna::tx
