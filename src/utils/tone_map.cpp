#include "musedna/utils/tone_map.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace musedna::utils {

namespace {

std::array<double, GF_ORDER> make_tone_table() {
    std::array<double, GF_ORDER> t{};
    for (uint32_t s = 0; s < GF_ORDER; ++s)
        t[s] = midi_to_hz(static_cast<double>(BASE_MIDI_NOTE + static_cast<int>(s)));
    return t;
}

} // namespace

uint8_t base_to_symbol(char base) {
    switch (base) {
        case 'A': return 0;
        case 'T': return 1;
        case 'G': return 2;
        case 'C': return 3;
    }
    throw std::invalid_argument(std::string("Not a DNA base: '") + base + "'");
}

char symbol_to_base(uint8_t symbol) {
    static constexpr char bases[4] = {'A', 'T', 'G', 'C'};
    return symbol < 4 ? bases[symbol] : '?';
}

const std::array<double, GF_ORDER>& tone_table() {
    static const std::array<double, GF_ORDER> table = make_tone_table();
    return table;
}

double symbol_to_frequency(uint8_t symbol) {
    if (symbol >= GF_ORDER)
        throw std::out_of_range("Symbol outside GF(32): " + std::to_string(symbol));
    return tone_table()[symbol];
}

uint8_t frequency_to_symbol(double frequency_hz) {
    const auto& table = tone_table();
    uint8_t best = 0;
    double best_diff = std::numeric_limits<double>::infinity();
    for (uint32_t s = 0; s < GF_ORDER; ++s) {
        const double diff = std::fabs(table[s] - frequency_hz);
        if (diff < best_diff) {
            best_diff = diff;
            best = static_cast<uint8_t>(s);
        }
    }
    return best;
}

double min_tone_spacing() {
    const auto& table = tone_table();
    double spacing = std::numeric_limits<double>::infinity();
    for (size_t s = 1; s < table.size(); ++s)
        spacing = std::min(spacing, table[s] - table[s - 1]);
    return spacing;
}

} // namespace musedna::utils
