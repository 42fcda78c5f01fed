#pragma once
#include <cstdint>
#include <span>
#include <vector>

#include "musedna/config.hpp"

namespace musedna::tx {

// Render one note: a fundamental plus a half-amplitude second harmonic,
//   x(t) = sin(2*pi*f*t) + 0.5*sin(2*pi*2f*t)
// shaped by exp(-5*u) with u running 0 -> 1 over the note, then scaled so
// the peak sample equals volume * 32767. Conversion to int16 truncates
// toward zero. Output length is int(sample_rate_hz * duration_s).
std::vector<int16_t> synthesize_tone(double frequency_hz,
                                     double duration_s,
                                     uint32_t sample_rate_hz,
                                     double volume);

// One tone per symbol, concatenated in order with no overlap or fade.
// Throws std::out_of_range for a symbol outside GF(32).
std::vector<int16_t> render_symbols(std::span<const uint8_t> symbols, const CodecConfig& cfg);

} // namespace musedna::tx
