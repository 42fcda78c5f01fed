#include "musedna/codec.hpp"
#include "musedna/debug.hpp"

#include <cstdio>

namespace musedna {

bool encode(const std::string &raw_sequence, const std::filesystem::path &output_path,
            const CodecConfig &cfg) {
    tx::Encoder encoder(cfg);
    const auto result = encoder.encode_to_file(raw_sequence, output_path);
    if (!result.success) {
        std::fprintf(stderr, "%s\n", result.failure_reason.c_str());
        return false;
    }
    if (debug::enabled()) {
        std::fprintf(stderr, "DEBUG: %zu bases -> %zu blocks, %zu tones\n",
                     result.sequence_length, result.block_count, result.symbols.size());
    }
    return true;
}

std::pair<std::string, std::string> decode(const std::filesystem::path &audio_path,
                                           const CodecConfig &cfg) {
    rx::Decoder decoder(cfg);
    auto result = decoder.decode_file(audio_path);
    return {std::move(result.sequence), result.status_message()};
}

} // namespace musedna
