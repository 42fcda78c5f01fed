#include "musedna/utils/sequence.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace musedna::utils {

std::string sanitize_sequence(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        const char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (u == 'A' || u == 'T' || u == 'G' || u == 'C')
            out.push_back(u);
    }
    return out;
}

std::string parse_fasta(std::istream& in) {
    std::string seq;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line[0] == '>')
            continue;
        auto first = std::find_if_not(line.begin(), line.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto last = std::find_if_not(line.rbegin(), line.rend(),
                                     [](unsigned char c) { return std::isspace(c); }).base();
        if (first < last)
            seq.append(first, last);
    }
    return seq;
}

std::string load_sequence_source(const std::string& arg) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path path(arg);
    if (!fs::is_regular_file(path, ec))
        return arg;

    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Failed to open sequence file: " + path.string());

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".fasta" || ext == ".fa")
        return parse_fasta(file);

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad())
        throw std::runtime_error("Failed to read sequence file: " + path.string());
    return ss.str();
}

std::string random_sequence(size_t length, uint32_t seed) {
    static constexpr char bases[4] = {'A', 'T', 'G', 'C'};
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 3);
    std::string out(length, 'A');
    for (auto& c : out)
        c = bases[dist(rng)];
    return out;
}

} // namespace musedna::utils
