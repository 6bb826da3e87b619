#include "dynq/env.hpp"
#include <cstdlib>
#include <string>

namespace dynq {

query_env detect_env(){
    query_env e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("DYNQ_JIT")) e.jit = (std::string(v) == "1");

    // Debug channels
    if (const char* v = get("DYNQ_DEBUG_PARSE")) e.debug_parse = (std::string(v) == "1");
    if (const char* v = get("DYNQ_DEBUG_JIT")) e.debug_jit = (std::string(v) == "1");
    if (const char* v = get("DYNQ_TRACE_QUERY")) e.trace_query = (std::string(v) == "1");

    // Diagnostics; suggestions stay on unless explicitly disabled
    if (const char* v = get("DYNQ_DIAG_JSON")) e.diag_json = (std::string(v) == "1");
    if (const char* v = get("DYNQ_SUGGEST")) e.suggest = (v[0] != '0');

    return e;
}

} // namespace dynq
