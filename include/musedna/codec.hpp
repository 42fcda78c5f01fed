#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "musedna/config.hpp"
#include "musedna/rx/decoder.hpp"
#include "musedna/tx/encoder.hpp"

namespace musedna {

// Entry points for front-ends (CLI, bindings, analysis tooling). They never
// touch field arithmetic, tone tables or segmentation directly.

// Encode a raw sequence into a WAV file. Returns false, and writes nothing,
// when the input holds no valid base or the file cannot be written; the
// reason is printed to stderr.
bool encode(const std::string &raw_sequence, const std::filesystem::path &output_path,
            const CodecConfig &cfg = {});

// Decode a WAV file. Returns {sequence, status}; on failure the sequence is
// empty and the status starts with "Error".
std::pair<std::string, std::string> decode(const std::filesystem::path &audio_path,
                                           const CodecConfig &cfg = {});

} // namespace musedna
