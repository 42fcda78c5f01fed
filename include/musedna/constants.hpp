#pragma once
#include <cstddef>
#include <cstdint>

namespace musedna {

// Audio rendering. One tone per symbol, mono PCM16.
inline constexpr uint32_t SAMPLE_RATE_HZ  = 44100;
inline constexpr double   NOTE_DURATION_S = 0.2;
inline constexpr double   NOTE_VOLUME     = 0.5;

// GF(2^5) with primitive polynomial x^5 + x^2 + 1 and alpha = 2.
inline constexpr uint32_t GF_BITS           = 5;
inline constexpr uint32_t GF_ORDER          = 1u << GF_BITS;
inline constexpr uint32_t GF_PRIMITIVE_POLY = 0x25;

// RS(31,23): 8 parity symbols, generator roots alpha^1 .. alpha^8.
inline constexpr size_t   RS_N          = 31;
inline constexpr size_t   RS_K          = 23;
inline constexpr size_t   RS_PARITY     = RS_N - RS_K;
inline constexpr size_t   RS_T          = RS_PARITY / 2;
inline constexpr uint32_t RS_FIRST_ROOT = 1;

// Length header: four unprotected 4-bit symbols, MSB nibble first.
inline constexpr size_t   HEADER_SYMBOLS      = 4;
inline constexpr uint32_t MAX_SEQUENCE_LENGTH = 0xFFFF;

// Tone table starts at C4 and climbs chromatically, one semitone per symbol.
inline constexpr int BASE_MIDI_NOTE = 60;

} // namespace musedna
