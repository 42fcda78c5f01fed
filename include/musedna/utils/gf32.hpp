#pragma once
#include <array>
#include <cstdint>

#include "musedna/constants.hpp"

namespace musedna::utils {

// GF(2^5) arithmetic. Elements are the integers 0..31 in polynomial basis;
// addition is XOR and multiplication goes through exp/log tables generated
// by the primitive polynomial x^5 + x^2 + 1 (alpha = 2).

struct Gf32Tables {
    // alpha^i for i in [0, 62). The second period avoids a modulo in gf_mul.
    std::array<uint8_t, 2 * (GF_ORDER - 1)> exp{};
    // log_alpha(x) for x in [1, 31]. log[0] is meaningless and left at 0.
    std::array<uint8_t, GF_ORDER> log{};
};

Gf32Tables make_gf32_tables();

// Process-wide immutable tables, built on first use.
const Gf32Tables& gf32_tables();

inline uint8_t gf_add(uint8_t a, uint8_t b) { return static_cast<uint8_t>(a ^ b); }

uint8_t gf_mul(uint8_t a, uint8_t b);

// Throws std::domain_error when b == 0.
uint8_t gf_div(uint8_t a, uint8_t b);

// Throws std::domain_error when a == 0.
uint8_t gf_inv(uint8_t a);

// a^n for any integer n (negative n requires a != 0).
uint8_t gf_pow(uint8_t a, int n);

// alpha^i, i reduced modulo 31 (negative exponents allowed).
uint8_t gf_alpha_pow(int i);

} // namespace musedna::utils
