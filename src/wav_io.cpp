#include "musedna/wav_io.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

namespace musedna {

namespace {

constexpr uint16_t WAV_FORMAT_PCM = 1;
constexpr uint16_t WAV_FORMAT_IEEE_FLOAT = 3;
constexpr uint16_t WAV_FORMAT_EXTENSIBLE = 0xFFFE;

void put_u16(std::ofstream &out, uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
    out.write(b, 2);
}

void put_u32(std::ofstream &out, uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                       static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
    out.write(b, 4);
}

uint16_t get_u16(const unsigned char *p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32(const unsigned char *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

void read_exact(std::ifstream &in, unsigned char *dst, std::size_t n, const std::filesystem::path &path) {
    in.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(n));
    if (static_cast<std::size_t>(in.gcount()) != n) {
        throw std::runtime_error("Truncated WAV file: " + path.string());
    }
}

} // namespace

void WavIo::write_pcm16(const std::filesystem::path &path,
                        std::span<const int16_t> samples,
                        uint32_t sample_rate_hz) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create output directory: " + path.parent_path().string());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open WAV file for writing: " + path.string());
    }

    const uint16_t channels = 1;
    const uint16_t bits = 16;
    const uint16_t block_align = channels * bits / 8;
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * block_align);

    out.write("RIFF", 4);
    put_u32(out, 36 + data_bytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, WAV_FORMAT_PCM);
    put_u16(out, channels);
    put_u32(out, sample_rate_hz);
    put_u32(out, sample_rate_hz * block_align);
    put_u16(out, block_align);
    put_u16(out, bits);
    out.write("data", 4);
    put_u32(out, data_bytes);
    for (int16_t s : samples) {
        put_u16(out, static_cast<uint16_t>(s));
    }

    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write WAV data: " + path.string());
    }
}

WavData WavIo::load(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open WAV file: " + path.string());
    }

    in.seekg(0, std::ios::end);
    const auto end_pos = in.tellg();
    in.seekg(0, std::ios::beg);
    if (end_pos < 0 || !in) {
        throw std::runtime_error("Failed to size WAV file: " + path.string());
    }
    const uint64_t file_bytes = static_cast<uint64_t>(end_pos);

    std::array<unsigned char, 12> riff{};
    read_exact(in, riff.data(), riff.size(), path);
    if (std::memcmp(riff.data(), "RIFF", 4) != 0 || std::memcmp(riff.data() + 8, "WAVE", 4) != 0) {
        throw std::runtime_error("Not a RIFF/WAVE file: " + path.string());
    }

    bool have_fmt = false;
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;

    // Walk chunks until "data"; "fmt " must come first.
    while (true) {
        std::array<unsigned char, 8> hdr{};
        in.read(reinterpret_cast<char *>(hdr.data()), hdr.size());
        if (in.gcount() != static_cast<std::streamsize>(hdr.size())) {
            throw std::runtime_error("WAV file has no data chunk: " + path.string());
        }
        const uint32_t size = get_u32(hdr.data() + 4);
        // Chunk bodies are padded to an even length. A chunk may never
        // claim more than what is left of the file.
        const uint64_t padded = uint64_t(size) + (size & 1u);
        const uint64_t remaining = file_bytes - static_cast<uint64_t>(in.tellg());

        if (std::memcmp(hdr.data(), "fmt ", 4) == 0) {
            if (size < 16) {
                throw std::runtime_error("WAV fmt chunk too small: " + path.string());
            }
            if (padded > remaining) {
                throw std::runtime_error("WAV fmt chunk exceeds file size: " + path.string());
            }
            std::vector<unsigned char> fmt(static_cast<std::size_t>(padded));
            read_exact(in, fmt.data(), fmt.size(), path);
            format = get_u16(&fmt[0]);
            channels = get_u16(&fmt[2]);
            sample_rate = get_u32(&fmt[4]);
            bits = get_u16(&fmt[14]);
            if (format == WAV_FORMAT_EXTENSIBLE && size >= 26) {
                // The real format code is the first two bytes of the sub-format GUID.
                format = get_u16(&fmt[24]);
            }
            have_fmt = true;
            continue;
        }

        if (std::memcmp(hdr.data(), "data", 4) == 0) {
            if (!have_fmt) {
                throw std::runtime_error("WAV data chunk before fmt chunk: " + path.string());
            }
            if (channels == 0) {
                throw std::runtime_error("WAV file declares zero channels: " + path.string());
            }
            const bool pcm16 = format == WAV_FORMAT_PCM && bits == 16;
            const bool float32 = format == WAV_FORMAT_IEEE_FLOAT && bits == 32;
            if (!pcm16 && !float32) {
                throw std::runtime_error("Unsupported WAV encoding (format " + std::to_string(format) +
                                         ", " + std::to_string(bits) + " bits): " + path.string());
            }

            if (size > remaining) {
                throw std::runtime_error("WAV data chunk exceeds file size: " + path.string());
            }
            const std::size_t frame_bytes = static_cast<std::size_t>(channels) * (bits / 8);
            const std::size_t frames = size / frame_bytes;
            std::vector<unsigned char> raw(frames * frame_bytes);
            read_exact(in, raw.data(), raw.size(), path);

            WavData out;
            out.sample_rate_hz = sample_rate;
            out.channels = channels;
            out.samples.resize(frames);
            for (std::size_t f = 0; f < frames; ++f) {
                const unsigned char *p = &raw[f * frame_bytes];
                float acc = 0.0f;
                for (uint16_t c = 0; c < channels; ++c) {
                    if (pcm16) {
                        acc += static_cast<float>(static_cast<int16_t>(get_u16(p + 2 * c))) / 32768.0f;
                    } else {
                        const uint32_t bitsv = get_u32(p + 4 * c);
                        float v;
                        std::memcpy(&v, &bitsv, sizeof(v));
                        acc += v;
                    }
                }
                out.samples[f] = acc / static_cast<float>(channels);
            }
            return out;
        }

        // Unknown chunk: skip it, honouring the RIFF pad byte.
        if (padded > remaining) {
            throw std::runtime_error("Truncated WAV chunk: " + path.string());
        }
        in.seekg(static_cast<std::streamoff>(padded), std::ios::cur);
        if (!in) {
            throw std::runtime_error("Truncated WAV chunk: " + path.string());
        }
    }
}

} // namespace musedna
