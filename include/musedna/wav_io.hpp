#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace musedna {

struct WavData {
    uint32_t sample_rate_hz{0};
    // Channel count found in the file; samples are already mixed to mono.
    uint16_t channels{0};
    // Mono samples scaled to [-1, 1).
    std::vector<float> samples;
};

class WavIo {
public:
    // Write a canonical RIFF/WAVE file: 44-byte header, PCM, mono, signed
    // 16-bit little endian. Parent directories are created as needed.
    // Throws std::runtime_error on open/write failures.
    static void write_pcm16(const std::filesystem::path &path,
                            std::span<const int16_t> samples,
                            uint32_t sample_rate_hz);

    // Load a RIFF/WAVE file.
    // Accepted formats:
    //  - PCM (format 1), 16 bits per sample
    //  - IEEE float (format 3), 32 bits per sample
    // Any channel count is accepted; channels are averaged to mono.
    // Unknown chunks (LIST, fact, ...) are skipped.
    // Throws std::runtime_error on open/read/format errors.
    static WavData load(const std::filesystem::path &path);
};

} // namespace musedna
