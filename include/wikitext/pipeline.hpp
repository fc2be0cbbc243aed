// preprocess -> tokenize -> parse in one call
#pragma once
#include "wikitext/include.hpp"
#include "wikitext/outcome.hpp"
#include "wikitext/parser.hpp"
#include "wikitext/preprocess.hpp"
#include <string>

namespace wikitext {

struct PipelineOptions {
    PreprocessOptions preprocess;
    ParseOptions parse;
};

// Defaults overridden by WIKITEXT_TYPOGRAPHY, WIKITEXT_MAX_INCLUDE_DEPTH and
// WIKITEXT_MAX_NESTING when set.
PipelineOptions options_from_env();

struct PipelineResult {
    std::string text; // preprocessed text; node spans index into it
    ParseOutcome outcome;
    IncludeReport includes;
};

PipelineResult run_pipeline(std::string text, const PipelineOptions& opts = {});
PipelineResult run_pipeline(std::string text, Includer& includer, const PipelineOptions& opts = {});

} // namespace wikitext
