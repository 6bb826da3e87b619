#include "conference_model.hpp"
#include "dynq/dynamic_expression.hpp"
#include "dynq/queryable.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <vector>

using Clock = std::chrono::steady_clock;
using conference::Conference;

struct RunResult { double ms_parse; double ms_eval; size_t hits; bool native; };

static RunResult bench_case(const std::vector<Conference>& rows, const char* text, bool jit){
    auto t0 = Clock::now();
    dynq::compiled_lambda fn = dynq::compile_lambda(dynq::entity_type_of<Conference>(), dynq::bool_type(), text, {},
                                                    dynq::compile_options{jit});
    auto t1 = Clock::now();
    size_t hits = 0;
    for(const auto& c : rows)
        if(dynq::is_true(fn(dynq::entity_type<Conference>::instance().wrap(c)))) ++hits;
    auto t2 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(),
             std::chrono::duration<double, std::milli>(t2 - t1).count(), hits, fn.is_native() };
}

int main(int argc, char** argv){
    int n = argc > 1 ? std::atoi(argv[1]) : 200000;
    std::vector<Conference> rows;
    rows.reserve((size_t)n);
    for(int i = 1; i <= n; ++i) rows.push_back(conference::make_conference(i));

    const char* cases[] = {
        "ConferenceId < 100",
        "ParticipantsNum * 2 + Status > 150 && Rating >= 2.5",
        "iif(Status == 1, ParticipantsNum % 7, Track / 2) == 3",
        "Name.StartsWith(\"Query\") and Budget > 2000",
        "Sessions.Any(Attendees > 30)",
    };
    for(const char* text : cases){
        for(bool jit : {false, true}){
            RunResult r = bench_case(rows, text, jit);
            std::cout << "[bench] " << (r.native ? "native     " : "interpreter") << "  parse " << r.ms_parse
                      << " ms  eval " << r.ms_eval << " ms  hits " << r.hits << "  " << text << "\n";
        }
    }
    return 0;
}
