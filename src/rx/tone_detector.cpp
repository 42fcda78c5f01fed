#include "musedna/rx/tone_detector.hpp"
#include "musedna/utils/tone_map.hpp"
#include "musedna/debug.hpp"

#include <cmath>
#include <complex>
#include <cstdio>

namespace musedna::rx {

ToneDetector::ToneDetector(const CodecConfig &cfg) : cfg_(cfg) {
    cfg_.validate();
    window_ = cfg_.samples_per_tone();
    offset_ = static_cast<std::size_t>(static_cast<double>(window_) * cfg_.analysis_start_fraction);
    const auto end = static_cast<std::size_t>(static_cast<double>(window_) * cfg_.analysis_end_fraction);
    length_ = end > offset_ ? end - offset_ : 0;
}

double ToneDetector::peak_frequency(std::span<const float> segment) {
    const std::size_t n = segment.size();
    if (n == 0) {
        return -1.0;
    }
    ws_.init(n);
    for (std::size_t i = 0; i < n; ++i) {
        ws_.rxbuf[i] = std::complex<float>(segment[i], 0.0f);
    }
    ws_.fft(ws_.rxbuf.data(), ws_.fftbuf.data());

    // Arg-max over bins [0, n/2); the first maximum wins on ties.
    std::size_t max_bin = 0;
    float max_mag = -1.0f;
    for (std::size_t k = 0; k < n / 2; ++k) {
        ws_.magnitude[k] = std::abs(ws_.fftbuf[k]);
        if (ws_.magnitude[k] > max_mag) {
            max_mag = ws_.magnitude[k];
            max_bin = k;
        }
    }
    return static_cast<double>(max_bin) * static_cast<double>(cfg_.sample_rate_hz) / static_cast<double>(n);
}

std::vector<uint8_t> ToneDetector::detect(std::span<const float> samples) {
    const bool dbg = debug::enabled();
    const std::size_t windows = samples.size() / window_;

    std::vector<uint8_t> symbols;
    symbols.reserve(windows);
    for (std::size_t w = 0; w < windows; ++w) {
        if (length_ == 0) {
            continue;
        }
        const auto segment = samples.subspan(w * window_ + offset_, length_);
        const double f = peak_frequency(segment);
        const uint8_t sym = utils::frequency_to_symbol(f);
        if (dbg && w < 16) {
            std::fprintf(stderr, "DEBUG: window %zu peak %.2f Hz -> symbol %u\n", w, f, sym);
        }
        symbols.push_back(sym);
    }
    if (dbg) {
        std::fprintf(stderr, "DEBUG: %zu samples -> %zu windows of %zu, %zu symbols\n",
                     samples.size(), windows, window_, symbols.size());
    }
    return symbols;
}

} // namespace musedna::rx
