// Process configuration read from DYNQ_* environment variables.
#pragma once

namespace dynq {

struct query_env {
    bool jit = false;          // DYNQ_JIT=1: compile eligible lambdas to native code
    bool debug_parse = false;  // DYNQ_DEBUG_PARSE=1: dump parsed trees
    bool debug_jit = false;    // DYNQ_DEBUG_JIT=1: JIT decisions and generated IR
    bool trace_query = false;  // DYNQ_TRACE_QUERY=1: repository pipeline steps
    bool diag_json = false;    // DYNQ_DIAG_JSON=1: JSON of every parse error on stderr
    bool suggest = true;       // DYNQ_SUGGEST=0 disables "did you mean" notes
};

// Reads the environment on every call so tests can toggle flags.
query_env detect_env();

} // namespace dynq
