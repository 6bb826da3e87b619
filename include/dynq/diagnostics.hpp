// Rendering of query errors: caret excerpts, JSON, "did you mean" hints.
#pragma once
#include "dynq/errors.hpp"
#include <string>
#include <vector>

namespace dynq {

std::string json_escape(const std::string& s);
// {"code":..,"message":..,"position":..,"notes":[{"message":..,"position":..}]}
std::string to_json(const query_error& e);
// Prints to_json(e) on stderr when DYNQ_DIAG_JSON=1.
void maybe_print_json(const query_error& e);

// Two-line excerpt: the source text and a caret under the error offset,
// followed by "error[code]: message" and one "note:" line per note.
std::string render_caret(const query_error& e, const std::string& source);

size_t edit_distance(const std::string& a, const std::string& b);
// Candidates within maxDist edits of target (case-insensitive), closest
// first, at most five.
std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, size_t maxDist=2);
// Adds a "did you mean ..." note unless DYNQ_SUGGEST=0 or nothing is close.
void append_suggestions(query_error& e, const std::string& target, const std::vector<std::string>& pool);

} // namespace dynq
