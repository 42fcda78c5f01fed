#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "musedna/config.hpp"

namespace musedna::tx {

enum class EncodeStatus : uint8_t {
    Ok,
    InputError, // nothing left after sanitizing, or longer than the header can express
    WriteError, // the audio artifact could not be written
};

struct EncodeResult {
    bool success{false};
    EncodeStatus status{EncodeStatus::InputError};
    std::string failure_reason;

    // Number of bases after sanitizing; this is what the header carries.
    size_t sequence_length{0};
    // Zero symbols appended to reach a multiple of RS_K.
    size_t padding{0};
    size_t block_count{0};

    // Header (4) followed by block_count codewords of RS_N symbols.
    std::vector<uint8_t> symbols;
    // One tone per symbol. Left empty by Encoder::encode_symbols().
    std::vector<int16_t> samples;
};

// Frame layout on air:
//   [len nibble 3][len nibble 2][len nibble 1][len nibble 0]
//   [codeword 0: 23 message + 8 parity] ... [codeword B-1]
// Each symbol is then rendered as a fixed-length tone.
class Encoder {
public:
    explicit Encoder(const CodecConfig &cfg = {});

    // Sanitize, pad, RS-encode and prepend the header. No audio.
    [[nodiscard]] EncodeResult encode_symbols(std::string_view raw) const;

    // encode_symbols() plus tone rendering.
    [[nodiscard]] EncodeResult encode(std::string_view raw) const;

    // encode() and write the samples as a PCM16 WAV. Nothing is written when
    // the input is rejected; a partially written file is removed.
    [[nodiscard]] EncodeResult encode_to_file(std::string_view raw, const std::filesystem::path &path) const;

    [[nodiscard]] const CodecConfig &config() const { return cfg_; }

private:
    CodecConfig cfg_;
};

} // namespace musedna::tx
