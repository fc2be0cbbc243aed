// Result container pairing a syntax tree with its diagnostics
#pragma once
#include "wikitext/ast.hpp"
#include "wikitext/diagnostic.hpp"
#include <cstddef>
#include <vector>

namespace wikitext {

class ParseOutcome {
public:
    // Diagnostics are stored in document order (stable by span start).
    ParseOutcome(node_ptr tree, std::vector<Diagnostic> diagnostics);

    const node_ptr& tree() const { return tree_; }
    const node& root() const { return *tree_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    bool has_diagnostics() const { return !diagnostics_.empty(); }
    size_t count(DiagnosticKind k) const;

private:
    node_ptr tree_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace wikitext
