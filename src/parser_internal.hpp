// Tree builder internals shared by the block, inline and link parsers
#pragma once
#include "wikitext/ast.hpp"
#include "wikitext/diagnostic.hpp"
#include "wikitext/parser.hpp"
#include "wikitext/token.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wikitext::detail {

constexpr size_t npos = static_cast<size_t>(-1);

// Open formatting span, or an inline [[span]] / [[del]] / [[footnote]] container
struct inline_frame {
    node_ptr n;
    FormatKind kind = FormatKind::bold;
    Span opener;
    std::string container; // lowercased block name; empty for markup spans
};

// Inline state of one block (paragraph, heading, list item, table cell).
struct inline_scope {
    node_ptr root;
    std::vector<inline_frame> stack;
    node& sink(){ return stack.empty() ? *root : *stack.back().n; }
};

// explicit_block: div, div_, collapsible and the alignment blocks, closed by [[/name]]
enum class BlockKind { document, explicit_block, paragraph, list, list_item, table, blockquote };

// Open block construct
struct block_frame {
    BlockKind kind = BlockKind::document;
    node_ptr n;
    Span opener;
    std::string name;     // explicit block name, lowercased
    int depth = 0;        // list or quote depth
    bool ordered = false;
    bool bare = false;    // [[div_]]: lines go into inl without paragraphs
    bool run = false;     // bare frame holds an inline run that later lines continue
    inline_scope inl;     // paragraphs keep spans open across lines
};

const char* block_kind_name(BlockKind k);

// Closing names that match an opener: "div_" closes "div", "deletion" closes "del".
std::string block_family(std::string_view lname);
bool is_inline_container(std::string_view lname);

class TreeBuilder {
public:
    TreeBuilder(const Tokenization& tz, const ParseOptions& opts);
    ParseOutcome build();

private:
    const Tokenization& tz_;
    ParseOptions opts_;
    std::vector<Diagnostic> diags_;
    DiagnosticSink sink_;
    std::vector<block_frame> stack_;
    size_t count_ = 0;         // tokens before input_end
    ExtractedToken end_token_; // returned for any index past count_
    size_t pos_ = 0;
    int footnotes_ = 0;
    bool trace_ = false;

    // Last failed closer search per token kind.
    struct closer_miss { size_t from = static_cast<size_t>(-1); size_t end = 0; };
    std::vector<closer_miss> misses_;

    // cursor
    const ExtractedToken& tok(size_t i) const { return i < count_ ? tz_.tokens[i] : end_token_; }
    const ExtractedToken& cur() const { return tok(pos_); }
    size_t line_end(size_t from) const;
    size_t find_kind(TokenKind k, size_t from, size_t end) const;
    size_t find_closer(TokenKind k, size_t from, size_t end);
    std::string_view source(Span s) const;
    std::string_view source(size_t from, size_t to) const { return source(Span{from, to}); }
    Span cover(size_t first, size_t last) const { return Span{tok(first).span.start, tok(last).span.end}; }
    void warn(DiagnosticKind k, Span s, const char* rule, std::string message, std::string hint = "");

    // block level (parser_block.cpp)
    void parse_line(size_t line_break_tok);
    void parse_heading();
    void parse_list_item();
    void parse_quote_line(size_t line_break_tok);
    void parse_table_row();
    void parse_paragraph_line(size_t line_break_tok);
    void parse_horizontal_rule();
    bool parse_block_opener();
    bool parse_block_closer();
    void parse_code_block(size_t open, size_t close, std::string_view args);
    bool room_for_block(Span header, const std::string& lname);
    void open_explicit_block(node_ptr n, Span header, const std::string& lname, bool bare);
    attribute_list block_attributes(std::string_view args, Span header, const std::string& lname);
    collapsible make_collapsible(std::string_view args, Span header);
    void end_bare_run();
    block_frame& top() { return stack_.back(); }
    BlockKind parent_kind() const;
    void push_frame(block_frame f);
    void close_top();
    void close_to_flow();
    int quote_depth() const;
    bool nesting_full() const { return stack_.size() >= opts_.max_nesting; }

    // inline level (parser_inline.cpp)
    void parse_inline(inline_scope& sc, size_t begin, size_t end);
    void inline_token(inline_scope& sc, size_t begin, size_t end);
    void inline_toggle(inline_scope& sc, size_t begin, size_t end);
    void inline_monospace_close(inline_scope& sc);
    void inline_raw(inline_scope& sc, TokenKind closer, size_t end);
    void open_span(inline_scope& sc, FormatKind kind, const ExtractedToken& opener);
    void close_span(inline_scope& sc, size_t index, Span closer);
    void inline_color(inline_scope& sc, size_t end);
    void open_container(inline_scope& sc, size_t open, size_t close, const std::string& lname, std::string_view args);
    bool close_container(inline_scope& sc, const std::string& lname, Span closer);
    void auto_close_span(const inline_frame& f);
    void finish_inline(inline_scope& sc);
    void append_text(inline_scope& sc, Span s);
    void degrade(inline_scope& sc, size_t first, size_t last, const char* rule, std::string message);
    bool space_before(size_t i, size_t begin) const;
    bool space_after(size_t i, size_t end) const;

    // links and inline blocks (parser_links.cpp)
    void inline_page_link(inline_scope& sc, size_t end);
    void inline_bracket_link(inline_scope& sc, size_t end);
    void inline_anchor_link(inline_scope& sc, size_t end);
    void inline_block(inline_scope& sc, size_t end);
    void inline_block_end(inline_scope& sc, size_t end);
    std::optional<node_ptr> make_include(std::string_view name, std::string_view args, Span span) const;
    node_ptr make_footnote_block(std::string_view args, Span header);
};

// Extend a node's span to cover its children.
void extend_to_children(node& n);

} // namespace wikitext::detail
