#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "musedna/constants.hpp"

namespace musedna::utils {

// Systematic RS(31,23) over GF(2^5). The generator polynomial is
//   g(x) = (x - a^1)(x - a^2) ... (x - a^8)
// and a codeword is laid out highest-degree coefficient first:
//   c[0..22]  = message symbols
//   c[23..30] = remainder of m(x) * x^8 mod g(x)
// The minimum distance is 9, so up to 4 symbol errors per block are
// corrected. Blocks are independent; no state is kept between calls.

using RsMessage  = std::array<uint8_t, RS_K>;
using RsCodeword = std::array<uint8_t, RS_N>;

struct RsDecodeResult {
    RsMessage message{};
    // Number of symbol positions that were corrected (0..RS_T).
    int corrected{0};
};

// Generator polynomial, lowest-degree coefficient first (size RS_PARITY + 1).
const std::vector<uint8_t>& rs_generator();

// Encode exactly RS_K symbols (each < 32). Throws std::invalid_argument on a
// wrong block size or an out-of-field symbol.
RsCodeword rs_encode_block(std::span<const uint8_t> message);

// Syndromes S_j = r(a^j), j = RS_FIRST_ROOT .. RS_FIRST_ROOT + 7.
// All zero iff the received word is a codeword.
std::array<uint8_t, RS_PARITY> rs_syndromes(std::span<const uint8_t> received);

// Decode exactly RS_N symbols. Runs Berlekamp-Massey for the error locator,
// a Chien search for the positions and Forney's formula for the magnitudes.
// Returns std::nullopt when the block is uncorrectable: locator degree above
// RS_T, a locator whose root count does not match its degree, or a
// correction that does not produce a codeword.
std::optional<RsDecodeResult> rs_decode_block(std::span<const uint8_t> received);

} // namespace musedna::utils
