#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>

namespace musedna::utils {

// Uppercase the input and keep only A, T, G and C. Everything else
// (whitespace, digits, IUPAC ambiguity codes, FASTA noise) is dropped.
std::string sanitize_sequence(std::string_view raw);

// Concatenate the sequence lines of a FASTA stream. Lines starting with '>'
// are record headers and are skipped; surrounding whitespace is trimmed.
// Multiple records are joined into one sequence.
std::string parse_fasta(std::istream& in);

// Resolve a user-supplied source: if `arg` names an existing regular file it
// is read (FASTA for .fasta/.fa, raw text otherwise); otherwise `arg` itself
// is the sequence. Throws std::runtime_error if the file cannot be read.
std::string load_sequence_source(const std::string& arg);

// Uniformly random sequence over ATGC, reproducible for a given seed.
std::string random_sequence(size_t length, uint32_t seed);

} // namespace musedna::utils
