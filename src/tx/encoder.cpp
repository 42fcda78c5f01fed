#include "musedna/tx/encoder.hpp"
#include "musedna/tx/tone_synth.hpp"
#include "musedna/utils/header.hpp"
#include "musedna/utils/reed_solomon.hpp"
#include "musedna/utils/sequence.hpp"
#include "musedna/utils/tone_map.hpp"
#include "musedna/wav_io.hpp"
#include "musedna/debug.hpp"

#include <cstdio>
#include <span>
#include <stdexcept>

namespace musedna::tx {

Encoder::Encoder(const CodecConfig &cfg) : cfg_(cfg) {
    cfg_.validate();
}

EncodeResult Encoder::encode_symbols(std::string_view raw) const {
    EncodeResult result;
    const bool dbg = debug::enabled();
    debug::clear_fail();

    // 1) Normalize: uppercase, ATGC only.
    const std::string seq = utils::sanitize_sequence(raw);
    result.sequence_length = seq.size();
    if (seq.empty()) {
        debug::set_fail(debug::FAIL_INPUT);
        result.failure_reason = "Error: No valid DNA bases found.";
        return result;
    }
    if (seq.size() > MAX_SEQUENCE_LENGTH) {
        debug::set_fail(debug::FAIL_INPUT);
        result.failure_reason = "Error: Sequence of " + std::to_string(seq.size()) +
                                " bases exceeds the 65535-base header limit.";
        return result;
    }

    // 2) Bases -> symbols, zero-padded to whole message blocks.
    std::vector<uint8_t> message;
    result.padding = (RS_K - (seq.size() % RS_K)) % RS_K;
    message.reserve(seq.size() + result.padding);
    for (char b : seq)
        message.push_back(utils::base_to_symbol(b));
    message.resize(seq.size() + result.padding, 0);
    result.block_count = message.size() / RS_K;

    if (dbg)
        std::fprintf(stderr, "DEBUG: encoding %zu bases (+%zu padding) into %zu blocks of %zu symbols\n",
                     seq.size(), result.padding, result.block_count, RS_N);

    // 3) + 4) Header, then one codeword per message block.
    const auto header = utils::encode_header(static_cast<uint16_t>(seq.size()));
    result.symbols.reserve(HEADER_SYMBOLS + result.block_count * RS_N);
    result.symbols.insert(result.symbols.end(), header.begin(), header.end());
    const std::span<const uint8_t> msg(message);
    for (size_t blk = 0; blk < result.block_count; ++blk) {
        const auto cw = utils::rs_encode_block(msg.subspan(blk * RS_K, RS_K));
        result.symbols.insert(result.symbols.end(), cw.begin(), cw.end());
    }

    result.success = true;
    result.status = EncodeStatus::Ok;
    return result;
}

EncodeResult Encoder::encode(std::string_view raw) const {
    EncodeResult result = encode_symbols(raw);
    if (!result.success)
        return result;
    // 5) One tone per symbol.
    result.samples = render_symbols(result.symbols, cfg_);
    return result;
}

EncodeResult Encoder::encode_to_file(std::string_view raw, const std::filesystem::path &path) const {
    EncodeResult result = encode(raw);
    if (!result.success)
        return result;

    try {
        WavIo::write_pcm16(path, result.samples, cfg_.sample_rate_hz);
    } catch (const std::runtime_error &e) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        debug::set_fail(debug::FAIL_WRITE);
        result.success = false;
        result.status = EncodeStatus::WriteError;
        result.failure_reason = std::string("Error: ") + e.what();
        return result;
    }
    if (debug::enabled())
        std::fprintf(stderr, "DEBUG: wrote %zu samples (%zu tones) to %s\n",
                     result.samples.size(), result.symbols.size(), path.string().c_str());
    return result;
}

} // namespace musedna::tx
