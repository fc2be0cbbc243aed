#include "parser_internal.hpp"
#include "block_arguments.hpp"
#include "strings.hpp"

namespace wikitext::detail {

namespace {

std::optional<std::string> label_of(std::string_view s){
    s = trim(s);
    if(s.empty()) return std::nullopt;
    return std::string(s);
}

// A target stops at whitespace, ']' or the start of another bracket link.
bool ends_target(TokenKind k){
    return k==TokenKind::whitespace || k==TokenKind::right_bracket ||
           k==TokenKind::left_bracket || k==TokenKind::left_anchor;
}

} // namespace

// [[[target|label]]], a leading '*' on the target opens a new tab.
void TreeBuilder::inline_page_link(inline_scope& sc, size_t end){
    const size_t open = pos_;
    const size_t close = find_closer(TokenKind::right_link, open+1, end);
    if(close==npos){
        degrade(sc, open, open, "page-link", "'[[[' has no closing ']]]'; kept as text");
        ++pos_;
        return;
    }
    std::string_view inner = source(tok(open).span.end, tok(close).span.start);
    size_t bar = inner.find('|');
    std::string_view target = trim(inner.substr(0, bar));
    std::optional<std::string> label;
    if(bar!=std::string_view::npos) label = std::string(trim(inner.substr(bar+1)));
    bool new_tab = false;
    if(!target.empty() && target.front()=='*'){
        new_tab = true;
        target = trim(target.substr(1));
    }
    if(target.empty()){
        degrade(sc, open, close, "page-link", "page link has an empty target; kept as text");
        pos_ = close+1;
        return;
    }
    sc.sink().children.push_back(make_node(link{LinkKind::page, std::string(target), std::move(label), new_tab}, cover(open, close)));
    pos_ = close+1;
}

// [url label], [*url label] or [/page label]. Anything else leaves '[' as text.
void TreeBuilder::inline_bracket_link(inline_scope& sc, size_t end){
    const size_t open = pos_;
    size_t first = open+1;
    bool new_tab = false;
    if(first+1<end && tok(first).kind==TokenKind::other && source(tok(first).span)=="*" &&
       tok(first+1).kind==TokenKind::url){
        new_tab = true;
        ++first;
    }

    LinkKind kind = LinkKind::url;
    size_t last = npos;
    if(first<end && tok(first).kind==TokenKind::url){
        last = first;
    } else if(first<end && tok(first).kind==TokenKind::other && source(tok(first).span)=="/"){
        kind = LinkKind::page;
        last = first;
        while(last+1<end && !ends_target(tok(last+1).kind)) ++last;
    }
    if(last==npos){
        append_text(sc, tok(open).span);
        ++pos_;
        return;
    }

    const size_t close = find_closer(TokenKind::right_bracket, last+1, end);
    if(close==npos){
        degrade(sc, open, last, "link", "link is missing its closing ']'; kept as text");
        pos_ = last+1;
        return;
    }
    std::string target(source(tok(first).span.start, tok(last).span.end));
    if(kind==LinkKind::page) target.erase(0, 1);
    if(target.empty()){
        degrade(sc, open, close, "link", "link has an empty target; kept as text");
        pos_ = close+1;
        return;
    }
    auto label = label_of(source(tok(last).span.end, tok(close).span.start));
    sc.sink().children.push_back(make_node(link{kind, std::move(target), std::move(label), new_tab}, cover(open, close)));
    pos_ = close+1;
}

// [#anchor label]
void TreeBuilder::inline_anchor_link(inline_scope& sc, size_t end){
    const size_t open = pos_;
    size_t last = open;
    while(last+1<end && !ends_target(tok(last+1).kind)) ++last;
    const size_t close = find_closer(TokenKind::right_bracket, last+1, end);
    if(close==npos){
        degrade(sc, open, last, "anchor-link", "anchor link is missing its closing ']'; kept as text");
        pos_ = last+1;
        return;
    }
    if(last==open){
        degrade(sc, open, close, "anchor-link", "anchor link has an empty name; kept as text");
        pos_ = close+1;
        return;
    }
    std::string name(source(tok(open).span.end, tok(last).span.end));
    auto label = label_of(source(tok(last).span.end, tok(close).span.start));
    sc.sink().children.push_back(make_node(link{LinkKind::anchor, std::move(name), std::move(label), false}, cover(open, close)));
    pos_ = close+1;
}

std::optional<node_ptr> TreeBuilder::make_include(std::string_view name, std::string_view args, Span span) const {
    include_placeholder ph;
    if(name=="include") ph.status = IncludeStatus::unexpanded;
    else if(name=="include-missing") ph.status = IncludeStatus::missing;
    else if(name=="include-cycle") ph.status = IncludeStatus::cycle;
    else if(name=="include-depth") ph.status = IncludeStatus::depth;
    else return std::nullopt;

    if(ph.status==IncludeStatus::unexpanded){
        auto call = parse_include_call(args);
        if(!call) return std::nullopt;
        ph.target = call->page.to_string();
        ph.variables = std::move(call->variables);
    } else {
        std::string_view target = trim(args);
        if(target.empty()) return std::nullopt;
        ph.target = std::string(target);
    }
    return make_node(std::move(ph), span);
}

node_ptr TreeBuilder::make_footnote_block(std::string_view args, Span header){
    footnote_block b;
    auto attrs = parse_attributes(args);
    if(!attrs){
        warn(DiagnosticKind::malformed_construct_degraded, header, "footnoteblock",
             "malformed attributes on '[[footnoteblock]]' ignored", "use key=\"value\" pairs");
    } else {
        for(const auto& kv : *attrs) if(iequals(kv.first, "title")) b.title = kv.second;
    }
    return make_node(std::move(b), header);
}

// [[name ...]] in running text: include placeholders, inline containers and
// footnote blocks; anything else is unrecognized.
void TreeBuilder::inline_block(inline_scope& sc, size_t end){
    const size_t open = pos_;
    const size_t close = find_closer(TokenKind::right_block, open+1, end);
    if(close==npos){
        degrade(sc, open, open, "block", "'[[' has no closing ']]'; kept as text");
        ++pos_;
        return;
    }
    auto [name, args] = split_header(source(tok(open).span.end, tok(close).span.start));
    const std::string lname = to_lower(name);
    const Span span = cover(open, close);
    if(lname=="include" || lname=="include-missing" || lname=="include-cycle" || lname=="include-depth"){
        if(auto ph = make_include(lname, args, span)) sc.sink().children.push_back(*ph);
        else degrade(sc, open, close, "include", "malformed include directive; kept as text");
        pos_ = close+1;
        return;
    }
    if(is_inline_container(lname)){
        open_container(sc, open, close, lname, args);
        return;
    }
    if(lname=="footnoteblock"){
        sc.sink().children.push_back(make_footnote_block(args, span));
        pos_ = close+1;
        return;
    }
    sc.sink().children.push_back(make_node(unrecognized{std::string(name), std::string(source(span))}, span));
    pos_ = close+1;
}

// [[/name]] closing an inline container, otherwise kept as text.
void TreeBuilder::inline_block_end(inline_scope& sc, size_t end){
    const size_t open = pos_;
    const size_t close = find_closer(TokenKind::right_block, open+1, end);
    if(close==npos){
        append_text(sc, tok(open).span);
        warn(DiagnosticKind::unmatched_closing_marker, tok(open).span, "block",
             "'[[/' closing marker without an open block; kept as text");
        ++pos_;
        return;
    }
    const Span span = cover(open, close);
    if(close_container(sc, to_lower(trim(source(tok(open).span.end, tok(close).span.start))), span)){
        pos_ = close+1;
        return;
    }
    append_text(sc, span);
    warn(DiagnosticKind::unmatched_closing_marker, span, "block",
         "'" + std::string(source(span)) + "' has no matching opening block; kept as text",
         "remove it or add the opening block");
    pos_ = close+1;
}

} // namespace wikitext::detail
