// Lexical tokens shared between the scanner and the tree builder
#pragma once
#include "wikitext/span.hpp"
#include <string_view>
#include <vector>

namespace wikitext {

enum class TokenKind {
    // line-start markers
    heading,
    bullet_item,
    numbered_item,
    quote,
    horizontal_rule,
    // tables
    table_column_title,
    table_column,
    // links and blocks
    left_link,
    right_link,
    left_block_end,
    left_block,
    right_block,
    left_anchor,
    left_bracket,
    right_bracket,
    pipe,
    // formatting toggles; open/close role is decided by the parser
    bold,
    italics,
    underline,
    strikethrough,
    superscript,
    subscript,
    left_monospace,
    right_monospace,
    raw,
    left_raw,
    right_raw,
    color,
    // text and whitespace
    url,
    email,
    paragraph_break,
    line_break,
    whitespace,
    text,
    other,
    input_end
};

const char* token_kind_name(TokenKind k);

// True for the ambiguous formatting delimiters (**, //, __, --, ^^, ,,).
bool is_format_toggle(TokenKind k);

struct ExtractedToken {
    TokenKind kind = TokenKind::other;
    Span span;
    std::string_view slice; // borrows the tokenized text
    int level = 0;          // heading level, list depth or quote depth
};

struct Tokenization {
    std::string_view text;
    std::vector<ExtractedToken> tokens; // always terminated by one input_end token
};

} // namespace wikitext
