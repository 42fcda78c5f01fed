#include "musedna/utils/gf32.hpp"

#include <stdexcept>

namespace musedna::utils {

static constexpr int GF_MUL_ORDER = static_cast<int>(GF_ORDER - 1); // 31

Gf32Tables make_gf32_tables() {
    Gf32Tables T;
    uint32_t x = 1;
    for (int i = 0; i < GF_MUL_ORDER; ++i) {
        T.exp[i] = static_cast<uint8_t>(x);
        T.log[x] = static_cast<uint8_t>(i);
        x <<= 1;
        if (x & GF_ORDER)
            x ^= GF_PRIMITIVE_POLY;
    }
    for (int i = GF_MUL_ORDER; i < 2 * GF_MUL_ORDER; ++i)
        T.exp[i] = T.exp[i - GF_MUL_ORDER];
    return T;
}

const Gf32Tables& gf32_tables() {
    static const Gf32Tables T = make_gf32_tables();
    return T;
}

uint8_t gf_mul(uint8_t a, uint8_t b) {
    if (a == 0 || b == 0) return 0;
    const auto& T = gf32_tables();
    return T.exp[T.log[a] + T.log[b]];
}

uint8_t gf_div(uint8_t a, uint8_t b) {
    if (b == 0) throw std::domain_error("GF(32) division by zero");
    if (a == 0) return 0;
    const auto& T = gf32_tables();
    return T.exp[T.log[a] + GF_MUL_ORDER - T.log[b]];
}

uint8_t gf_inv(uint8_t a) {
    if (a == 0) throw std::domain_error("GF(32) zero has no inverse");
    const auto& T = gf32_tables();
    return T.exp[(GF_MUL_ORDER - T.log[a]) % GF_MUL_ORDER];
}

uint8_t gf_pow(uint8_t a, int n) {
    if (a == 0) {
        if (n < 0) throw std::domain_error("GF(32) zero raised to a negative power");
        return n == 0 ? 1 : 0;
    }
    const auto& T = gf32_tables();
    int e = (static_cast<int>(T.log[a]) * (n % GF_MUL_ORDER)) % GF_MUL_ORDER;
    if (e < 0) e += GF_MUL_ORDER;
    return T.exp[e];
}

uint8_t gf_alpha_pow(int i) {
    int e = i % GF_MUL_ORDER;
    if (e < 0) e += GF_MUL_ORDER;
    return gf32_tables().exp[e];
}

} // namespace musedna::utils
