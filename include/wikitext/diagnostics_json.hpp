// diagnostics_json.hpp - JSON serialization for parse diagnostics
#pragma once
#include "wikitext/diagnostic.hpp"
#include "wikitext/outcome.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace wikitext {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string. When `text` is non-empty each
// entry also carries the 1-based line/col of its span start.
std::string diagnostics_to_json(const std::vector<Diagnostic>& diagnostics, std::string_view text = {});
std::string diagnostics_to_json(const ParseOutcome& outcome, std::string_view text = {});

// If WIKITEXT_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ParseOutcome& outcome, std::string_view text = {});

} // namespace wikitext
