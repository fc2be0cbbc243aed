// EDN encoding of syntax trees and diagnostics
#pragma once
#include "wikitext/ast.hpp"
#include "wikitext/diagnostic.hpp"
#include "wikitext/outcome.hpp"
#include <string>
#include <vector>

namespace wikitext {

// Quote and escape a string as an EDN string literal.
std::string edn_escape(const std::string& s);

// Every node is a map tagged with :type and carrying :span [start end], e.g.
//   {:type :format :span [0 8] :style :bold :children [{:type :text :span [2 6] :value "bold"}]}
std::string to_edn(const node& n);
inline std::string to_edn(const node_ptr& p) { return p ? to_edn(*p) : std::string("nil"); }
// Pretty printer with newlines and indentation for readability
std::string to_pretty_edn(const node& n, int indentWidth = 2);
inline std::string to_pretty_edn(const node_ptr& p, int indentWidth = 2) { return p ? to_pretty_edn(*p, indentWidth) : std::string("nil"); }

std::string to_edn(const std::vector<Diagnostic>& diagnostics);
// {:tree ... :diagnostics [...]}
std::string to_edn(const ParseOutcome& outcome);

} // namespace wikitext
