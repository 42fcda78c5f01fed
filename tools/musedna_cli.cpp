#include "musedna/codec.hpp"
#include "musedna/utils/sequence.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

// Command-line front-end for the DNA <-> audio codec. It only talks to the
// encoder/decoder entry points and prints their status.
// Exit codes:
//   0 -> success
//   1 -> codec failure (rejected input, uncorrectable audio)
//   2 -> CLI/argument error or I/O error

namespace {

enum class Command { None, Encode, Decode, Random };

struct ParsedArgs {
    Command command = Command::None;
    std::string input;
    std::filesystem::path output;
    std::size_t random_length = 100;
    uint32_t seed = 0;
    bool seed_given = false;
    bool full = false;
};

constexpr std::size_t PREVIEW_BASES = 200;

void print_usage(const char *prog) {
    std::cout << "Usage:\n"
              << "  " << prog << " encode <sequence|file.txt|file.fasta> [-o out.wav]\n"
              << "  " << prog << " decode <file.wav> [--full]\n"
              << "  " << prog << " random <length> [-o out.wav] [--seed <int>]\n"
              << "Options:\n"
              << "  -o, --output <path>   Output WAV (default output/encoded_song.wav,\n"
              << "                        output/random_song.wav for random)\n"
              << "  --seed <int>          Seed for random sequences (default: random)\n"
              << "  --full                Print the whole decoded sequence\n"
              << "Environment:\n"
              << "  MUSEDNA_DEBUG         Trace encode/decode steps to stderr\n";
}

ParsedArgs parse_args(int argc, char **argv) {
    ParsedArgs args;
    if (argc < 2) {
        throw std::runtime_error("Missing command");
    }
    const std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        std::exit(0);
    } else if (cmd == "encode") {
        args.command = Command::Encode;
        args.output = "output/encoded_song.wav";
    } else if (cmd == "decode") {
        args.command = Command::Decode;
    } else if (cmd == "random") {
        args.command = Command::Random;
        args.output = "output/random_song.wav";
    } else {
        throw std::runtime_error("Unknown command: " + cmd);
    }

    for (int i = 2; i < argc; ++i) {
        std::string cur = argv[i];
        if ((cur == "-o" || cur == "--output") && i + 1 < argc) {
            args.output = argv[++i];
        } else if (cur == "--seed" && i + 1 < argc) {
            args.seed = static_cast<uint32_t>(std::stoul(argv[++i], nullptr, 0));
            args.seed_given = true;
        } else if (cur == "--full") {
            args.full = true;
        } else if (cur == "--help" || cur == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (cur.rfind("-", 0) == 0) {
            throw std::runtime_error("Unrecognized option: " + cur);
        } else if (args.input.empty()) {
            args.input = cur;
        } else {
            throw std::runtime_error("Unexpected argument: " + cur);
        }
    }

    if (args.input.empty()) {
        throw std::runtime_error(args.command == Command::Random ? "Missing length" : "Missing input");
    }
    if (args.command == Command::Random) {
        const std::string &len = args.input;
        if (len.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("Invalid length provided: " + len);
        }
        args.random_length = static_cast<std::size_t>(std::stoull(len));
    }
    return args;
}

int run_encode(const std::string &sequence, const std::filesystem::path &output) {
    std::cout << "Encoding DNA sequence into '" << output.string() << "'...\n";
    if (!musedna::encode(sequence, output)) {
        return 1;
    }
    std::cout << "Successfully encoded DNA into '" << output.string() << "'\n";
    return 0;
}

int run_decode(const std::filesystem::path &input, bool full) {
    if (!std::filesystem::exists(input)) {
        std::cerr << "File not found: " << input.string() << "\n";
        return 2;
    }
    std::cout << "Decoding DNA from '" << input.string() << "'...\n";
    const auto [sequence, status] = musedna::decode(input);
    if (!sequence.empty()) {
        std::cout << "\n--- Decoded DNA Sequence ---\n";
        if (full || sequence.size() <= PREVIEW_BASES) {
            std::cout << sequence << "\n";
        } else {
            std::cout << sequence.substr(0, PREVIEW_BASES) << "...\n";
        }
        std::cout << "--------------------------\n";
    }
    if (status.rfind("Error", 0) == 0) {
        std::cerr << status << "\n";
        return 1;
    }
    std::cout << status << "\n";
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    try {
        const auto args = parse_args(argc, argv);
        switch (args.command) {
            case Command::Encode: {
                const std::string sequence = musedna::utils::load_sequence_source(args.input);
                if (sequence.empty()) {
                    std::cerr << "Error: Input DNA sequence is empty.\n";
                    return 1;
                }
                return run_encode(sequence, args.output);
            }
            case Command::Decode:
                return run_decode(args.input, args.full);
            case Command::Random: {
                const uint32_t seed = args.seed_given ? args.seed : std::random_device{}();
                const std::string sequence = musedna::utils::random_sequence(args.random_length, seed);
                std::cout << "Generated random DNA of length " << args.random_length << ": "
                          << sequence.substr(0, 50) << "...\n";
                return run_encode(sequence, args.output);
            }
            case Command::None:
                break;
        }
        print_usage(argv[0]);
        return 2;
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }
}
