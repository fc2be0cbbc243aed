// Lenient scanner: any text produces a gap-free token sequence
#pragma once
#include "wikitext/token.hpp"
#include <string_view>

namespace wikitext {

// Tokenize preprocessed text. Never fails; bytes matching no structural rule
// become text/other tokens. The result borrows `text`.
Tokenization tokenize(std::string_view text);

} // namespace wikitext
