#include "parser_internal.hpp"
#include "block_arguments.hpp"
#include "strings.hpp"
#include <cstddef>
#include <cstdio>
#include <variant>

namespace wikitext::detail {

namespace {

bool is_space_like(TokenKind k){
    return k==TokenKind::whitespace || k==TokenKind::line_break ||
           k==TokenKind::paragraph_break || k==TokenKind::input_end;
}

bool is_break(const node_ptr& n){ return n && std::holds_alternative<line_break>(n->data); }

// [[span_]] drops line breaks at either end of its contents.
void strip_edge_breaks(node& n){
    auto& ch = n.children;
    while(!ch.empty() && is_break(ch.back())) ch.pop_back();
    size_t lead = 0;
    while(lead<ch.size() && is_break(ch[lead])) ++lead;
    ch.erase(ch.begin(), ch.begin()+static_cast<std::ptrdiff_t>(lead));
}

FormatKind format_for(TokenKind k){
    switch(k){
        case TokenKind::bold: return FormatKind::bold;
        case TokenKind::italics: return FormatKind::italics;
        case TokenKind::underline: return FormatKind::underline;
        case TokenKind::strikethrough: return FormatKind::strikethrough;
        case TokenKind::superscript: return FormatKind::superscript;
        case TokenKind::subscript: return FormatKind::subscript;
        default: return FormatKind::monospace;
    }
}

} // namespace

bool TreeBuilder::space_before(size_t i, size_t begin) const {
    if(i<=begin) return true;
    return is_space_like(tok(i-1).kind);
}

bool TreeBuilder::space_after(size_t i, size_t end) const {
    if(i+1>=end) return true;
    return is_space_like(tok(i+1).kind);
}

void TreeBuilder::parse_inline(inline_scope& sc, size_t begin, size_t end){
    pos_ = begin;
    while(pos_<end){
        size_t before = pos_;
        inline_token(sc, begin, end);
        if(pos_==before){
            append_text(sc, cur().span);
            ++pos_;
        }
    }
}

void TreeBuilder::inline_token(inline_scope& sc, size_t begin, size_t end){
    const ExtractedToken& t = cur();
    switch(t.kind){
        case TokenKind::text:
        case TokenKind::other:
        case TokenKind::whitespace:
            append_text(sc, t.span);
            ++pos_;
            return;
        case TokenKind::url:
            sc.sink().children.push_back(make_node(link{LinkKind::url, std::string(source(t.span)), std::nullopt, false}, t.span));
            ++pos_;
            return;
        case TokenKind::email:
            sc.sink().children.push_back(make_node(link{LinkKind::email, std::string(source(t.span)), std::nullopt, false}, t.span));
            ++pos_;
            return;
        case TokenKind::color:
            inline_color(sc, end);
            return;
        case TokenKind::bold:
        case TokenKind::italics:
        case TokenKind::underline:
        case TokenKind::strikethrough:
        case TokenKind::superscript:
        case TokenKind::subscript:
            inline_toggle(sc, begin, end);
            return;
        case TokenKind::left_monospace:
            if(sc.stack.size()>=opts_.max_nesting){
                degrade(sc, pos_, pos_, "monospace", "formatting nesting exceeds the maximum depth; '{{' kept as text");
            } else {
                open_span(sc, FormatKind::monospace, t);
            }
            ++pos_;
            return;
        case TokenKind::right_monospace:
            inline_monospace_close(sc);
            return;
        case TokenKind::raw:
            inline_raw(sc, TokenKind::raw, end);
            return;
        case TokenKind::left_raw:
            inline_raw(sc, TokenKind::right_raw, end);
            return;
        case TokenKind::right_raw:
            append_text(sc, t.span);
            warn(DiagnosticKind::unmatched_closing_marker, t.span, "raw", "closing '>@' has no matching '@<'; kept as text");
            ++pos_;
            return;
        case TokenKind::left_link:
            inline_page_link(sc, end);
            return;
        case TokenKind::left_bracket:
            inline_bracket_link(sc, end);
            return;
        case TokenKind::left_anchor:
            inline_anchor_link(sc, end);
            return;
        case TokenKind::left_block:
            inline_block(sc, end);
            return;
        case TokenKind::left_block_end:
            inline_block_end(sc, end);
            return;
        default:
            // stray ]] ]]] ] | and markers outside their line-start position
            append_text(sc, t.span);
            ++pos_;
            return;
    }
}

void TreeBuilder::inline_toggle(inline_scope& sc, size_t begin, size_t end){
    const ExtractedToken& t = cur();
    const FormatKind kind = format_for(t.kind);
    const bool can_open = !space_after(pos_, end);
    const bool can_close = !space_before(pos_, begin);

    // word--word is a dash, not strikethrough
    if(t.kind==TokenKind::strikethrough && pos_>begin && pos_+1<end &&
       tok(pos_-1).kind==TokenKind::text && tok(pos_+1).kind==TokenKind::text){
        append_text(sc, t.span);
        ++pos_;
        return;
    }
    if(can_close){
        for(size_t i=sc.stack.size(); i-- > 0;){
            if(sc.stack[i].kind==kind && sc.stack[i].container.empty()){
                close_span(sc, i, t.span);
                ++pos_;
                return;
            }
        }
    }
    if(can_open){
        if(sc.stack.size()>=opts_.max_nesting){
            degrade(sc, pos_, pos_, "inline-toggle", "formatting nesting exceeds the maximum depth; marker kept as text");
        } else {
            open_span(sc, kind, t);
        }
        ++pos_;
        return;
    }
    append_text(sc, t.span);
    if(can_close){
        warn(DiagnosticKind::unmatched_closing_marker, t.span, "inline-toggle",
             "closing '" + std::string(source(t.span)) + "' has no matching opener; kept as text",
             "remove the marker or add an opening one");
    }
    ++pos_;
}

void TreeBuilder::inline_monospace_close(inline_scope& sc){
    const ExtractedToken& t = cur();
    for(size_t i=sc.stack.size(); i-- > 0;){
        if(sc.stack[i].kind==FormatKind::monospace && sc.stack[i].container.empty()){
            close_span(sc, i, t.span);
            ++pos_;
            return;
        }
    }
    append_text(sc, t.span);
    warn(DiagnosticKind::unmatched_closing_marker, t.span, "monospace", "closing '}}' has no matching '{{'; kept as text");
    ++pos_;
}

void TreeBuilder::inline_raw(inline_scope& sc, TokenKind closer, size_t end){
    const size_t open = pos_;
    const size_t close = find_closer(closer, open+1, end);
    if(close==npos){
        degrade(sc, open, open, "raw", "'" + std::string(source(tok(open).span)) + "' raw text is never closed; kept as text");
        ++pos_;
        return;
    }
    sc.sink().children.push_back(make_node(raw{std::string(source(tok(open).span.end, tok(close).span.start))}, cover(open, close)));
    pos_ = close+1;
}

void TreeBuilder::open_span(inline_scope& sc, FormatKind kind, const ExtractedToken& opener){
    auto n = make_node(format{kind}, opener.span);
    sc.sink().children.push_back(n);
    sc.stack.push_back(inline_frame{n, kind, opener.span});
}

void TreeBuilder::close_span(inline_scope& sc, size_t index, Span closer){
    while(sc.stack.size()>index+1){
        inline_frame inner = sc.stack.back();
        sc.stack.pop_back();
        auto_close_span(inner);
    }
    inline_frame f = sc.stack.back();
    sc.stack.pop_back();
    if(f.container=="span_") strip_edge_breaks(*f.n);
    extend_to_children(*f.n);
    if(closer.end > f.n->span.end) f.n->span.end = closer.end;
}

void TreeBuilder::auto_close_span(const inline_frame& f){
    if(f.container=="span_") strip_edge_breaks(*f.n);
    extend_to_children(*f.n);
    if(!f.container.empty()){
        warn(DiagnosticKind::unclosed_block_auto_closed, f.opener, "inline-block",
             "'[[" + f.container + "]]' was never closed; auto-closed at end of block",
             "add '[[/" + f.container + "]]'");
        return;
    }
    warn(DiagnosticKind::unclosed_block_auto_closed, f.opener, "inline-span",
         std::string("unclosed ") + format_kind_name(f.kind) + " span auto-closed at end of block",
         "add the closing marker");
}

// ##color|text##; the first '##' after an open color span closes it.
void TreeBuilder::inline_color(inline_scope& sc, size_t end){
    const size_t open = pos_;
    for(size_t i=sc.stack.size(); i-- > 0;){
        if(sc.stack[i].kind==FormatKind::color && sc.stack[i].container.empty()){
            close_span(sc, i, tok(open).span);
            ++pos_;
            return;
        }
    }
    const size_t bar = find_closer(TokenKind::pipe, open+1, end);
    const std::string_view color = bar==npos ? std::string_view{} : trim(source(tok(open).span.end, tok(bar).span.start));
    if(color.empty()){
        degrade(sc, open, open, "color", "'##' is not followed by 'color|'; kept as text");
        ++pos_;
        return;
    }
    const Span opener = cover(open, bar);
    if(sc.stack.size()>=opts_.max_nesting){
        degrade(sc, open, bar, "color", "formatting nesting exceeds the maximum depth; color kept as text");
        pos_ = bar+1;
        return;
    }
    auto n = make_node(format{FormatKind::color, std::string(color)}, opener);
    sc.sink().children.push_back(n);
    sc.stack.push_back(inline_frame{n, FormatKind::color, opener, {}});
    pos_ = bar+1;
}

// [[span ...]], [[span_]], [[del]] and [[footnote]] inside running text.
void TreeBuilder::open_container(inline_scope& sc, size_t open, size_t close, const std::string& lname, std::string_view args){
    const Span header = cover(open, close);
    if(sc.stack.size()>=opts_.max_nesting){
        degrade(sc, open, close, "inline-block", "formatting nesting exceeds the maximum depth; '[[" + lname + "]]' kept as text");
        pos_ = close+1;
        return;
    }
    node_ptr n;
    if(lname=="footnote"){
        for(const auto& f : sc.stack){
            if(f.container=="footnote"){
                degrade(sc, open, close, "footnote", "footnotes cannot nest; '[[footnote]]' kept as text");
                pos_ = close+1;
                return;
            }
        }
        n = make_node(footnote{++footnotes_}, header);
    } else {
        auto attrs = parse_attributes(args);
        if(!attrs){
            warn(DiagnosticKind::malformed_construct_degraded, header, "inline-block",
                 "malformed attributes on '[[" + lname + "]]' ignored", "use key=\"value\" pairs");
            attrs = attribute_list{};
        }
        const ContainerKind kind = block_family(lname)=="del" ? ContainerKind::deletion : ContainerKind::span;
        n = make_node(container{kind, std::move(*attrs)}, header);
    }
    sc.sink().children.push_back(n);
    sc.stack.push_back(inline_frame{n, FormatKind::bold, header, lname});
    pos_ = close+1;
}

bool TreeBuilder::close_container(inline_scope& sc, const std::string& lname, Span closer){
    const std::string family = block_family(lname);
    for(size_t i=sc.stack.size(); i-- > 0;){
        const std::string& name = sc.stack[i].container;
        if(!name.empty() && block_family(name)==family){
            close_span(sc, i, closer);
            return true;
        }
    }
    return false;
}

void TreeBuilder::finish_inline(inline_scope& sc){
    while(!sc.stack.empty()){
        inline_frame f = sc.stack.back();
        sc.stack.pop_back();
        auto_close_span(f);
    }
}

// Adjacent text merges into one node.
void TreeBuilder::append_text(inline_scope& sc, Span s){
    node& parent = sc.sink();
    if(!parent.children.empty()){
        node& last = *parent.children.back();
        if(auto* t = std::get_if<text>(&last.data); t && last.span.end==s.start){
            t->value += source(s);
            last.span.end = s.end;
            return;
        }
    }
    parent.children.push_back(make_node(text{std::string(source(s))}, s));
}

void TreeBuilder::degrade(inline_scope& sc, size_t first, size_t last, const char* rule, std::string message){
    Span s = cover(first, last);
    append_text(sc, s);
    warn(DiagnosticKind::malformed_construct_degraded, s, rule, std::move(message));
}

} // namespace wikitext::detail
