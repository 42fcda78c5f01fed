#include "musedna/rx/decoder.hpp"
#include "musedna/utils/header.hpp"
#include "musedna/utils/reed_solomon.hpp"
#include "musedna/utils/tone_map.hpp"
#include "musedna/wav_io.hpp"
#include "musedna/resampler.hpp"
#include "musedna/debug.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <stdexcept>

namespace musedna::rx {

namespace {

DecodeResult fail(DecodeResult result, DecodeStatus status, DecodeStage at, std::string reason, int step) {
    debug::set_fail(step);
    result.success = false;
    result.status = status;
    result.stage = DecodeStage::Failed;
    result.failed_stage = at;
    result.failure_reason = std::move(reason);
    result.sequence.clear();
    return result;
}

} // namespace

std::string DecodeResult::status_message() const {
    if (success) {
        return "Verified (" + std::to_string(corrected_symbols) + " errors corrected)";
    }
    return failure_reason;
}

Decoder::Decoder(const CodecConfig &cfg) : cfg_(cfg), detector_(cfg) {}

DecodeResult Decoder::decode_file(const std::filesystem::path &path) {
    debug::clear_fail();
    DecodeResult result;
    result.stage = DecodeStage::Loading;

    WavData wav;
    try {
        wav = WavIo::load(path);
        if (wav.sample_rate_hz != cfg_.sample_rate_hz) {
            if (debug::enabled()) {
                std::fprintf(stderr, "DEBUG: resampling %u Hz -> %u Hz\n",
                             wav.sample_rate_hz, cfg_.sample_rate_hz);
            }
            wav.samples = resample(wav.samples, wav.sample_rate_hz, cfg_.sample_rate_hz);
            wav.sample_rate_hz = cfg_.sample_rate_hz;
        }
    } catch (const std::exception &e) {
        return fail(std::move(result), DecodeStatus::AudioLoadError, DecodeStage::Loading,
                    std::string("Error loading audio file: ") + e.what(), debug::FAIL_AUDIO_LOAD);
    }
    if (debug::enabled()) {
        std::fprintf(stderr, "DEBUG: loaded %zu samples (%u ch) from %s\n",
                     wav.samples.size(), static_cast<unsigned>(wav.channels), path.string().c_str());
    }
    return decode_samples(std::span<const float>(wav.samples));
}

DecodeResult Decoder::decode_samples(std::span<const int16_t> samples) {
    std::vector<float> scaled(samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
        scaled[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return decode_samples(std::span<const float>(scaled));
}

DecodeResult Decoder::decode_samples(std::span<const float> samples) {
    // Segmenting + per-window detection.
    const auto symbols = detector_.detect(samples);
    return decode_symbols(symbols);
}

DecodeResult Decoder::decode_symbols(std::span<const uint8_t> symbols) const {
    const bool dbg = debug::enabled();
    debug::clear_fail();
    DecodeResult result;
    result.detected_symbols.assign(symbols.begin(), symbols.end());

    // 1) Header.
    result.stage = DecodeStage::HeaderParsing;
    if (symbols.size() < HEADER_SYMBOLS) {
        return fail(std::move(result), DecodeStatus::HeaderError, DecodeStage::HeaderParsing,
                    "Error: Audio too short to contain a valid header.", debug::FAIL_HEADER);
    }
    result.declared_length = utils::decode_header(symbols.first(HEADER_SYMBOLS));
    const auto body = symbols.subspan(HEADER_SYMBOLS);
    result.block_count = (body.size() + RS_N - 1) / RS_N;
    if (dbg) {
        std::fprintf(stderr, "DEBUG: %zu symbols detected, header length %u, %zu blocks\n",
                     symbols.size(), result.declared_length, result.block_count);
    }

    // 2) Blocks. A short trailing block is zero-padded before decoding.
    result.stage = DecodeStage::BlockDecoding;
    std::vector<uint8_t> message;
    message.reserve(result.block_count * RS_K);
    for (std::size_t blk = 0; blk < result.block_count; ++blk) {
        std::array<uint8_t, RS_N> block{};
        const std::size_t take = std::min(RS_N, body.size() - blk * RS_N);
        std::copy_n(body.begin() + static_cast<std::ptrdiff_t>(blk * RS_N), take, block.begin());

        const auto dec = utils::rs_decode_block(block);
        if (!dec) {
            result.failed_block = blk + 1;
            if (dbg) {
                std::fprintf(stderr, "DEBUG: block %zu uncorrectable\n", blk + 1);
            }
            return fail(std::move(result), DecodeStatus::DecodingFailure, DecodeStage::BlockDecoding,
                        "Error: Too many errors to correct in block " + std::to_string(blk + 1) + ".",
                        debug::FAIL_BLOCK_DECODE);
        }
        if (dbg && dec->corrected > 0) {
            std::fprintf(stderr, "DEBUG: block %zu corrected %d symbols\n", blk + 1, dec->corrected);
        }
        result.corrected_symbols += static_cast<std::size_t>(dec->corrected);
        message.insert(message.end(), dec->message.begin(), dec->message.end());
    }

    // 3) Reassembly: the header length is the only authority on where the
    // padding starts.
    result.stage = DecodeStage::Reassembly;
    const std::size_t keep = std::min<std::size_t>(result.declared_length, message.size());
    result.sequence.reserve(keep);
    for (std::size_t i = 0; i < keep; ++i) {
        result.sequence.push_back(utils::symbol_to_base(message[i]));
    }

    result.success = true;
    result.status = DecodeStatus::Ok;
    result.stage = DecodeStage::Done;
    return result;
}

const char *to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok: return "Ok";
        case DecodeStatus::AudioLoadError: return "AudioLoadError";
        case DecodeStatus::HeaderError: return "HeaderError";
        case DecodeStatus::DecodingFailure: return "DecodingFailure";
    }
    return "?";
}

const char *to_string(DecodeStage stage) {
    switch (stage) {
        case DecodeStage::Loading: return "Loading";
        case DecodeStage::Segmenting: return "Segmenting";
        case DecodeStage::HeaderParsing: return "HeaderParsing";
        case DecodeStage::BlockDecoding: return "BlockDecoding";
        case DecodeStage::Reassembly: return "Reassembly";
        case DecodeStage::Done: return "Done";
        case DecodeStage::Failed: return "Failed";
    }
    return "?";
}

} // namespace musedna::rx
