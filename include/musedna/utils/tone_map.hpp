#pragma once
#include <array>
#include <cmath>
#include <cstdint>

#include "musedna/constants.hpp"

namespace musedna::utils {

// Bidirectional maps between DNA bases, GF(32) symbols and tone frequencies.
//   A -> 0, T -> 1, G -> 2, C -> 3
// Symbols 4..31 never come from a base; they only appear as parity, as
// header nibbles or after a detection error.

// Throws std::invalid_argument for anything but 'A', 'T', 'G' or 'C'.
uint8_t base_to_symbol(char base);

// Returns '?' for symbols that have no base.
char symbol_to_base(uint8_t symbol);

// One frequency per field element, strictly increasing: a chromatic scale
// starting at MIDI note BASE_MIDI_NOTE (C4).
const std::array<double, GF_ORDER>& tone_table();

// Throws std::out_of_range for symbol >= 32.
double symbol_to_frequency(uint8_t symbol);

// Nearest table entry by absolute difference. Always returns a symbol.
uint8_t frequency_to_symbol(double frequency_hz);

// Smallest gap between adjacent tones (between the two lowest ones).
double min_tone_spacing();

inline double midi_to_hz(double midi_note) {
    return 440.0 * std::exp2((midi_note - 69.0) / 12.0);
}

} // namespace musedna::utils
