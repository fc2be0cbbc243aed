#include "wikitext/diagnostic.hpp"
#include "wikitext/outcome.hpp"
#include <algorithm>

namespace wikitext {

const char* diagnostic_kind_name(DiagnosticKind k){
    switch(k){
        case DiagnosticKind::unmatched_closing_marker: return "unmatched-closing-marker";
        case DiagnosticKind::unclosed_block_auto_closed: return "unclosed-block-auto-closed";
        case DiagnosticKind::malformed_construct_degraded: return "malformed-construct-degraded";
        case DiagnosticKind::deprecated_construct: return "deprecated-construct";
    }
    return "unknown";
}

const char* diagnostic_code(DiagnosticKind k){
    switch(k){
        case DiagnosticKind::unmatched_closing_marker: return "W1001";
        case DiagnosticKind::unclosed_block_auto_closed: return "W1002";
        case DiagnosticKind::malformed_construct_degraded: return "W1003";
        case DiagnosticKind::deprecated_construct: return "W1004";
    }
    return "W1000";
}

const char* severity_name(Severity){ return "warning"; }

ParseOutcome::ParseOutcome(node_ptr tree, std::vector<Diagnostic> diagnostics)
    : tree_(tree ? std::move(tree) : make_node(document{}, Span{})), diagnostics_(std::move(diagnostics)) {
    std::stable_sort(diagnostics_.begin(), diagnostics_.end(),
                     [](const Diagnostic& a, const Diagnostic& b){ return a.span.start < b.span.start; });
}

size_t ParseOutcome::count(DiagnosticKind k) const {
    return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
                                             [k](const Diagnostic& d){ return d.kind==k; }));
}

} // namespace wikitext
