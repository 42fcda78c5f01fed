#pragma once
#include <array>
#include <cstdint>
#include <span>

#include "musedna/constants.hpp"

namespace musedna::utils {

// The stream starts with the original sequence length, 16 bits sent as four
// 4-bit symbols, most significant nibble first. It carries no redundancy:
// a corrupted header symbol silently changes the truncation point.
using LengthHeader = std::array<uint8_t, HEADER_SYMBOLS>;

LengthHeader encode_header(uint16_t length);

// (s0 << 12) + (s1 << 8) + (s2 << 4) + s3. Symbols are not masked, so a
// detection error that lands above 15 inflates the result past 65535.
// Throws std::invalid_argument unless exactly four symbols are given.
uint32_t decode_header(std::span<const uint8_t> symbols);

} // namespace musedna::utils
