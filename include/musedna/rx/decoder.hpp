#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "musedna/config.hpp"
#include "musedna/rx/tone_detector.hpp"

namespace musedna::rx {

enum class DecodeStage : uint8_t {
    Loading,
    Segmenting,
    HeaderParsing,
    BlockDecoding,
    Reassembly,
    Done,
    Failed,
};

enum class DecodeStatus : uint8_t {
    Ok,
    AudioLoadError,  // unreadable or corrupt WAV
    HeaderError,     // fewer than 4 detected symbols
    DecodingFailure, // a block had more errors than RS_T
};

struct DecodeResult {
    bool success{false};
    DecodeStatus status{DecodeStatus::Ok};
    // Done on success, Failed otherwise.
    DecodeStage stage{DecodeStage::Loading};
    // Stage that produced the failure (meaningful when success == false).
    DecodeStage failed_stage{DecodeStage::Loading};
    std::string failure_reason;

    // Recovered bases; empty on any failure.
    std::string sequence;
    // Sum of corrected symbols over all blocks; 0 for a clean channel.
    std::size_t corrected_symbols{0};
    // 1-based index of the block that could not be corrected, 0 if none.
    std::size_t failed_block{0};
    // Length announced by the header (may exceed the data for a bad header).
    uint32_t declared_length{0};
    std::size_t block_count{0};
    // Symbol stream seen by the detector (header included).
    std::vector<uint8_t> detected_symbols;

    // "Verified (n errors corrected)" on success, failure_reason otherwise.
    [[nodiscard]] std::string status_message() const;
};

// Decode pipeline:
//   Loading -> Segmenting -> HeaderParsing -> BlockDecoding -> Reassembly
// A block that cannot be corrected aborts the whole decode; no partial
// sequence is returned.
class Decoder {
public:
    explicit Decoder(const CodecConfig &cfg = {});

    // Load a WAV file and decode it. Audio at another rate is resampled to
    // the configured one first. Never throws for I/O or format problems; they
    // are reported as DecodeStatus::AudioLoadError.
    [[nodiscard]] DecodeResult decode_file(const std::filesystem::path &path);

    // Decode mono samples in [-1, 1) at the configured sample rate.
    [[nodiscard]] DecodeResult decode_samples(std::span<const float> samples);
    // Same for raw PCM16 (e.g. straight from tx::Encoder).
    [[nodiscard]] DecodeResult decode_samples(std::span<const int16_t> samples);

    // Decode an already detected symbol stream: header + codewords.
    [[nodiscard]] DecodeResult decode_symbols(std::span<const uint8_t> symbols) const;

    [[nodiscard]] const CodecConfig &config() const { return cfg_; }

private:
    CodecConfig cfg_;
    ToneDetector detector_;
};

const char *to_string(DecodeStatus status);
const char *to_string(DecodeStage stage);

} // namespace musedna::rx
