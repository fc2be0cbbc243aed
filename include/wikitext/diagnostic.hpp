// Non-fatal parse diagnostics
#pragma once
#include "wikitext/span.hpp"
#include <string>
#include <vector>

namespace wikitext {

enum class DiagnosticKind {
    unmatched_closing_marker,    // W1001
    unclosed_block_auto_closed,  // W1002
    malformed_construct_degraded, // W1003
    deprecated_construct         // W1004
};

// Parsing never fails, so warning is the only severity.
enum class Severity { warning };

const char* diagnostic_kind_name(DiagnosticKind k);
const char* diagnostic_code(DiagnosticKind k);
const char* severity_name(Severity s);

struct Diagnostic {
    std::string code;
    DiagnosticKind kind = DiagnosticKind::malformed_construct_degraded;
    Severity severity = Severity::warning;
    Span span;
    std::string rule; // grammar rule that reported it ("inline-toggle", "page-link", ...)
    std::string message;
    std::string hint;
};

// Central sink so every parser component formats diagnostics the same way.
struct DiagnosticSink {
    std::vector<Diagnostic>* out = nullptr;
    void emit(const Diagnostic& d){ if(out) out->push_back(d); }
    void emit(DiagnosticKind k, Span s, std::string rule, std::string message, std::string hint = ""){
        emit(make(k, s, std::move(rule), std::move(message), std::move(hint)));
    }
    static Diagnostic make(DiagnosticKind k, Span s, std::string rule, std::string message, std::string hint = ""){
        return Diagnostic{diagnostic_code(k), k, Severity::warning, s, std::move(rule), std::move(message), std::move(hint)};
    }
};

} // namespace wikitext
