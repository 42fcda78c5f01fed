#include "musedna/utils/reed_solomon.hpp"
#include "musedna/utils/gf32.hpp"

#include <algorithm>
#include <stdexcept>

namespace musedna::utils {

namespace {

using Poly = std::vector<uint8_t>; // lowest degree first

Poly make_generator() {
    Poly g{1};
    for (size_t i = 0; i < RS_PARITY; ++i) {
        const uint8_t root = gf_alpha_pow(static_cast<int>(RS_FIRST_ROOT + i));
        Poly next(g.size() + 1, 0);
        // next = g * (x + root)
        for (size_t j = 0; j < g.size(); ++j) {
            next[j + 1] ^= g[j];
            next[j] ^= gf_mul(g[j], root);
        }
        g = std::move(next);
    }
    return g;
}

uint8_t poly_eval(const Poly& p, uint8_t x) {
    uint8_t y = 0;
    for (size_t i = p.size(); i-- > 0;)
        y = static_cast<uint8_t>(gf_mul(y, x) ^ p[i]);
    return y;
}

size_t poly_degree(const Poly& p) {
    size_t d = 0;
    for (size_t i = 0; i < p.size(); ++i)
        if (p[i]) d = i;
    return d;
}

void check_symbols(std::span<const uint8_t> s) {
    for (uint8_t v : s)
        if (v >= GF_ORDER)
            throw std::invalid_argument("Symbol outside GF(32)");
}

// Berlekamp-Massey over the syndrome sequence. Returns the connection
// polynomial Lambda(x) and writes the LFSR length to L.
Poly berlekamp_massey(const std::array<uint8_t, RS_PARITY>& S, size_t& L) {
    Poly C(RS_PARITY + 1, 0), B(RS_PARITY + 1, 0);
    C[0] = 1;
    B[0] = 1;
    L = 0;
    size_t m = 1;
    uint8_t b = 1;
    for (size_t n = 0; n < RS_PARITY; ++n) {
        uint8_t d = S[n];
        for (size_t i = 1; i <= L; ++i)
            d ^= gf_mul(C[i], S[n - i]);
        if (d == 0) {
            ++m;
            continue;
        }
        const uint8_t coef = gf_div(d, b);
        Poly T = C;
        for (size_t i = 0; i + m < C.size(); ++i)
            C[i + m] ^= gf_mul(coef, B[i]);
        if (2 * L <= n) {
            L = n + 1 - L;
            B = std::move(T);
            b = d;
            m = 1;
        } else {
            ++m;
        }
    }
    return C;
}

} // namespace

const std::vector<uint8_t>& rs_generator() {
    static const Poly g = make_generator();
    return g;
}

RsCodeword rs_encode_block(std::span<const uint8_t> message) {
    if (message.size() != RS_K)
        throw std::invalid_argument("RS encode expects exactly 23 message symbols");
    check_symbols(message);

    const Poly& g = rs_generator();
    // LFSR division: par[0] holds the x^7 coefficient of the running remainder.
    std::array<uint8_t, RS_PARITY> par{};
    for (uint8_t m : message) {
        const uint8_t fb = static_cast<uint8_t>(m ^ par[0]);
        for (size_t j = 0; j + 1 < RS_PARITY; ++j)
            par[j] = static_cast<uint8_t>(par[j + 1] ^ gf_mul(fb, g[RS_PARITY - 1 - j]));
        par[RS_PARITY - 1] = gf_mul(fb, g[0]);
    }

    RsCodeword cw{};
    std::copy(message.begin(), message.end(), cw.begin());
    std::copy(par.begin(), par.end(), cw.begin() + RS_K);
    return cw;
}

std::array<uint8_t, RS_PARITY> rs_syndromes(std::span<const uint8_t> received) {
    if (received.size() != RS_N)
        throw std::invalid_argument("RS syndromes expect exactly 31 symbols");
    std::array<uint8_t, RS_PARITY> S{};
    for (size_t j = 0; j < RS_PARITY; ++j) {
        const uint8_t x = gf_alpha_pow(static_cast<int>(RS_FIRST_ROOT + j));
        uint8_t s = 0;
        for (uint8_t r : received)
            s = static_cast<uint8_t>(gf_mul(s, x) ^ r);
        S[j] = s;
    }
    return S;
}

std::optional<RsDecodeResult> rs_decode_block(std::span<const uint8_t> received) {
    if (received.size() != RS_N)
        throw std::invalid_argument("RS decode expects exactly 31 symbols");
    check_symbols(received);

    RsDecodeResult out;
    const auto S = rs_syndromes(received);
    if (std::all_of(S.begin(), S.end(), [](uint8_t s) { return s == 0; })) {
        std::copy(received.begin(), received.begin() + RS_K, out.message.begin());
        return out;
    }

    size_t L = 0;
    Poly lambda = berlekamp_massey(S, L);
    if (L > RS_T || poly_degree(lambda) != L)
        return std::nullopt;

    // Chien search. Position i in the block carries power p = N-1-i; an error
    // there makes a^-p a root of Lambda.
    std::vector<size_t> positions;
    for (size_t i = 0; i < RS_N; ++i) {
        const int p = static_cast<int>(RS_N - 1 - i);
        if (poly_eval(lambda, gf_alpha_pow(-p)) == 0)
            positions.push_back(i);
    }
    if (positions.size() != L)
        return std::nullopt;

    // Omega(x) = S(x) * Lambda(x) mod x^8
    Poly omega(RS_PARITY, 0);
    for (size_t i = 0; i < RS_PARITY; ++i)
        for (size_t j = 0; j <= i && j < lambda.size(); ++j)
            omega[i] ^= gf_mul(S[i - j], lambda[j]);

    // Formal derivative: only odd-degree terms survive in characteristic 2.
    Poly dlambda(lambda.size() > 1 ? lambda.size() - 1 : 1, 0);
    for (size_t i = 1; i < lambda.size(); i += 2)
        dlambda[i - 1] = lambda[i];

    std::array<uint8_t, RS_N> corrected{};
    std::copy(received.begin(), received.end(), corrected.begin());
    for (size_t i : positions) {
        const int p = static_cast<int>(RS_N - 1 - i);
        const uint8_t x_inv = gf_alpha_pow(-p);
        const uint8_t den = poly_eval(dlambda, x_inv);
        if (den == 0)
            return std::nullopt;
        uint8_t mag = gf_div(poly_eval(omega, x_inv), den);
        mag = gf_mul(mag, gf_alpha_pow(p * (1 - static_cast<int>(RS_FIRST_ROOT))));
        corrected[i] ^= mag;
    }

    const auto check = rs_syndromes(corrected);
    if (!std::all_of(check.begin(), check.end(), [](uint8_t s) { return s == 0; }))
        return std::nullopt;

    std::copy(corrected.begin(), corrected.begin() + RS_K, out.message.begin());
    out.corrected = static_cast<int>(positions.size());
    return out;
}

} // namespace musedna::utils
