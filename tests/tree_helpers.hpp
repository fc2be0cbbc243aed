#pragma once
// Shared helpers for tree-builder tests.
#include "wikitext/lexer.hpp"
#include "wikitext/parser.hpp"
#include "wikitext/outcome.hpp"
#include <gtest/gtest.h>
#include <string>

namespace wikitext_test {

// Tokenize and parse without preprocessing so spans index the literal input.
inline wikitext::ParseOutcome parse_text(const std::string& s, const wikitext::ParseOptions& opts = {}){
    return wikitext::parse(wikitext::tokenize(s), opts);
}

inline const wikitext::node& child(const wikitext::node& n, size_t i){
    return *n.children.at(i);
}

inline std::string text_of(const wikitext::node& n){
    return wikitext::as<wikitext::text>(n).value;
}

inline wikitext::NodeKind kind_of(const wikitext::node& n){
    return wikitext::node_kind(n);
}

} // namespace wikitext_test
