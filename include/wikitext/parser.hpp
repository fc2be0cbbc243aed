// Error-recovering tree builder
#pragma once
#include "wikitext/outcome.hpp"
#include "wikitext/token.hpp"
#include <cstddef>

namespace wikitext {

struct ParseOptions {
    // Maximum depth of open block frames and of open inline spans; openers past
    // the limit are kept as literal text.
    size_t max_nesting = 64;
};

// Build the syntax tree for a tokenization. Total: every input yields an outcome,
// anomalies are reported as warnings.
ParseOutcome parse(const Tokenization& tokens, const ParseOptions& opts = {});

} // namespace wikitext
