// Text-level substitution engine run before tokenization
#pragma once
#include "wikitext/include.hpp"
#include <cstddef>
#include <string>

namespace wikitext {

struct PreprocessOptions {
    bool typography = true;        // curly quotes, guillemets, ellipses
    size_t max_include_depth = 16; // nested include levels before a depth placeholder
    std::string page_name;         // page being rendered, seeds include cycle tracking
};

// Rewrite `text` in place: BOM, comments, line endings, whitespace, line
// continuations, tabs, newline compression, then optional typography.
void preprocess(std::string& text, const PreprocessOptions& opts = {});

// Same, with include directives expanded first through `includer`.
IncludeReport preprocess(std::string& text, Includer& includer, const PreprocessOptions& opts = {});

void strip_bom(std::string& text);
void substitute_misc(std::string& text);
void substitute_typography(std::string& text);

} // namespace wikitext
