#include "wikitext/lexer.hpp"
#include "wikitext/debug.hpp"
#include "pegtl/grammar.hpp"
#include <cstdio>
#include <tao/pegtl.hpp>

using namespace tao::pegtl;

namespace wikitext {

const char* token_kind_name(TokenKind k){
    switch(k){
        case TokenKind::heading: return "heading";
        case TokenKind::bullet_item: return "bullet-item";
        case TokenKind::numbered_item: return "numbered-item";
        case TokenKind::quote: return "quote";
        case TokenKind::horizontal_rule: return "horizontal-rule";
        case TokenKind::table_column_title: return "table-column-title";
        case TokenKind::table_column: return "table-column";
        case TokenKind::left_link: return "left-link";
        case TokenKind::right_link: return "right-link";
        case TokenKind::left_block_end: return "left-block-end";
        case TokenKind::left_block: return "left-block";
        case TokenKind::right_block: return "right-block";
        case TokenKind::left_anchor: return "left-anchor";
        case TokenKind::left_bracket: return "left-bracket";
        case TokenKind::right_bracket: return "right-bracket";
        case TokenKind::pipe: return "pipe";
        case TokenKind::bold: return "bold";
        case TokenKind::italics: return "italics";
        case TokenKind::underline: return "underline";
        case TokenKind::strikethrough: return "strikethrough";
        case TokenKind::superscript: return "superscript";
        case TokenKind::subscript: return "subscript";
        case TokenKind::left_monospace: return "left-monospace";
        case TokenKind::right_monospace: return "right-monospace";
        case TokenKind::raw: return "raw";
        case TokenKind::left_raw: return "left-raw";
        case TokenKind::right_raw: return "right-raw";
        case TokenKind::color: return "color";
        case TokenKind::url: return "url";
        case TokenKind::email: return "email";
        case TokenKind::paragraph_break: return "paragraph-break";
        case TokenKind::line_break: return "line-break";
        case TokenKind::whitespace: return "whitespace";
        case TokenKind::text: return "text";
        case TokenKind::other: return "other";
        case TokenKind::input_end: return "input-end";
    }
    return "unknown";
}

bool is_format_toggle(TokenKind k){
    switch(k){
        case TokenKind::bold: case TokenKind::italics: case TokenKind::underline:
        case TokenKind::strikethrough: case TokenKind::superscript: case TokenKind::subscript:
            return true;
        default:
            return false;
    }
}

namespace {

// State carried during scanning
struct scan_state {
    std::string_view text;
    std::vector<ExtractedToken>* out = nullptr;
    void push(TokenKind k, const char* begin, size_t size, int level = 0){
        size_t start = static_cast<size_t>(begin - text.data());
        ExtractedToken t;
        t.kind = k;
        t.span = Span{start, start + size};
        t.slice = text.substr(start, size);
        t.level = level;
        out->push_back(t);
    }
};

template<typename Rule>
struct action : nothing<Rule> {};

template<TokenKind K>
struct emit {
    template<typename Input>
    static void apply(const Input& in, scan_state& st){ st.push(K, in.begin(), in.size()); }
};

// Level = number of leading `Marker` characters, or leading spaces + 1 for list markers.
template<TokenKind K, char Marker, bool CountSpaces = false>
struct emit_level {
    template<typename Input>
    static void apply(const Input& in, scan_state& st){
        int level = 0;
        const char* p = in.begin();
        const char* e = in.end();
        if(CountSpaces){
            while(p!=e && *p==' '){ ++level; ++p; }
            ++level;
        } else {
            while(p!=e && *p==Marker){ ++level; ++p; }
        }
        st.push(K, in.begin(), in.size(), level);
    }
};

namespace g = pegtl_front::grammar;

template<> struct action< g::heading_marker > : emit_level< TokenKind::heading, '+' > {};
template<> struct action< g::bullet_marker > : emit_level< TokenKind::bullet_item, '*', true > {};
template<> struct action< g::numbered_marker > : emit_level< TokenKind::numbered_item, '#', true > {};
template<> struct action< g::quote_marker > : emit_level< TokenKind::quote, '>' > {};
template<> struct action< g::rule_marker > : emit< TokenKind::horizontal_rule > {};
template<> struct action< g::column_title > : emit< TokenKind::table_column_title > {};
template<> struct action< g::column > : emit< TokenKind::table_column > {};
template<> struct action< g::link_open > : emit< TokenKind::left_link > {};
template<> struct action< g::link_close > : emit< TokenKind::right_link > {};
template<> struct action< g::block_end_open > : emit< TokenKind::left_block_end > {};
template<> struct action< g::block_open > : emit< TokenKind::left_block > {};
template<> struct action< g::block_close > : emit< TokenKind::right_block > {};
template<> struct action< g::anchor_open > : emit< TokenKind::left_anchor > {};
template<> struct action< g::bracket_open > : emit< TokenKind::left_bracket > {};
template<> struct action< g::bracket_close > : emit< TokenKind::right_bracket > {};
template<> struct action< g::pipe > : emit< TokenKind::pipe > {};
template<> struct action< g::bold > : emit< TokenKind::bold > {};
template<> struct action< g::italics > : emit< TokenKind::italics > {};
template<> struct action< g::underline > : emit< TokenKind::underline > {};
template<> struct action< g::strikethrough > : emit< TokenKind::strikethrough > {};
template<> struct action< g::superscript > : emit< TokenKind::superscript > {};
template<> struct action< g::subscript > : emit< TokenKind::subscript > {};
template<> struct action< g::mono_open > : emit< TokenKind::left_monospace > {};
template<> struct action< g::mono_close > : emit< TokenKind::right_monospace > {};
template<> struct action< g::raw_toggle > : emit< TokenKind::raw > {};
template<> struct action< g::raw_open > : emit< TokenKind::left_raw > {};
template<> struct action< g::raw_close > : emit< TokenKind::right_raw > {};
template<> struct action< g::color > : emit< TokenKind::color > {};
template<> struct action< g::url > : emit< TokenKind::url > {};
template<> struct action< g::email > : emit< TokenKind::email > {};
template<> struct action< g::paragraph_break > : emit< TokenKind::paragraph_break > {};
template<> struct action< g::line_break > : emit< TokenKind::line_break > {};
template<> struct action< g::whitespace > : emit< TokenKind::whitespace > {};
template<> struct action< g::word > : emit< TokenKind::text > {};
template<> struct action< g::other > : emit< TokenKind::other > {};

void push_end(Tokenization& tz){
    ExtractedToken end;
    end.kind = TokenKind::input_end;
    end.span = Span{tz.text.size(), tz.text.size()};
    end.slice = tz.text.substr(tz.text.size());
    tz.tokens.push_back(end);
}

// Whole input as a single other token.
void fallback(Tokenization& tz){
    tz.tokens.clear();
    if(!tz.text.empty()){
        ExtractedToken t;
        t.kind = TokenKind::other;
        t.span = Span{0, tz.text.size()};
        t.slice = tz.text;
        tz.tokens.push_back(t);
    }
    push_end(tz);
}

} // namespace

Tokenization tokenize(std::string_view text){
    Tokenization tz;
    tz.text = text;
    if(text.empty()){
        push_end(tz);
        return tz;
    }
    tz.tokens.reserve(text.size() / 3 + 4);
    scan_state st{text, &tz.tokens};
    try {
        memory_input<> in(text.data(), text.data() + text.size(), "wikitext");
        if(!tao::pegtl::parse< g::document, action >(in, st)){
            if(detail::debug_enabled("WIKITEXT_DEBUG_LEX")) std::fprintf(stderr, "[dbg][lex] scan failed, emitting fallback token\n");
            fallback(tz);
            return tz;
        }
    } catch (const tao::pegtl::parse_error& e) {
        if(detail::debug_enabled("WIKITEXT_DEBUG_LEX")) std::fprintf(stderr, "[dbg][lex] scan error: %s\n", e.what());
        fallback(tz);
        return tz;
    }
    push_end(tz);
    if(detail::debug_enabled("WIKITEXT_DEBUG_LEX")){
        std::fprintf(stderr, "[dbg][lex] %zu tokens for %zu bytes\n", tz.tokens.size(), text.size());
        for(const auto& t : tz.tokens)
            std::fprintf(stderr, "[dbg][lex]   %s [%zu,%zu) level=%d\n", token_kind_name(t.kind), t.span.start, t.span.end, t.level);
    }
    return tz;
}

} // namespace wikitext
