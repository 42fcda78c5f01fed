#include "musedna/utils/header.hpp"

#include <stdexcept>

namespace musedna::utils {

LengthHeader encode_header(uint16_t length) {
    return {
        static_cast<uint8_t>((length >> 12) & 0xF),
        static_cast<uint8_t>((length >> 8) & 0xF),
        static_cast<uint8_t>((length >> 4) & 0xF),
        static_cast<uint8_t>(length & 0xF),
    };
}

uint32_t decode_header(std::span<const uint8_t> symbols) {
    if (symbols.size() != HEADER_SYMBOLS)
        throw std::invalid_argument("Length header needs exactly 4 symbols");
    return (uint32_t(symbols[0]) << 12) + (uint32_t(symbols[1]) << 8) +
           (uint32_t(symbols[2]) << 4) + uint32_t(symbols[3]);
}

} // namespace musedna::utils
