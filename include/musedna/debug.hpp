// Lightweight debug hook for internal encode/decode steps.
#pragma once
#include <cstdlib>

namespace musedna { namespace debug {

// Failure checkpoints recorded by the pipelines.
enum FailStep : int {
    FAIL_NONE = 0,
    FAIL_INPUT = 1,
    FAIL_WRITE = 2,
    FAIL_AUDIO_LOAD = 10,
    FAIL_HEADER = 11,
    FAIL_BLOCK_DECODE = 12,
};

inline thread_local int last_fail_step = FAIL_NONE; // set by TX/RX helpers on failure paths
inline void set_fail(int code) { last_fail_step = code; }
inline void clear_fail() { last_fail_step = FAIL_NONE; }

// Tracing to stderr is enabled by exporting MUSEDNA_DEBUG.
inline bool enabled() { return std::getenv("MUSEDNA_DEBUG") != nullptr; }

} } // namespace musedna::debug
