#include "wikitext/parser.hpp"
#include "wikitext/debug.hpp"
#include "parser_internal.hpp"
#include <algorithm>
#include <cstdio>

namespace wikitext {

namespace detail {

const char* block_kind_name(BlockKind k){
    switch(k){
        case BlockKind::document: return "document";
        case BlockKind::explicit_block: return "explicit-block";
        case BlockKind::paragraph: return "paragraph";
        case BlockKind::list: return "list";
        case BlockKind::list_item: return "list-item";
        case BlockKind::table: return "table";
        case BlockKind::blockquote: return "blockquote";
    }
    return "unknown";
}

std::string block_family(std::string_view lname){
    if(lname=="deletion") return "del";
    if(lname.size()>1 && lname.back()=='_') lname.remove_suffix(1);
    return std::string(lname);
}

bool is_inline_container(std::string_view lname){
    return lname=="span" || lname=="span_" || lname=="del" || lname=="deletion" || lname=="footnote";
}

void extend_to_children(node& n){
    for(const auto& ch : n.children){
        if(!ch) continue;
        if(ch->span.start < n.span.start) n.span.start = ch->span.start;
        if(ch->span.end > n.span.end) n.span.end = ch->span.end;
    }
}

TreeBuilder::TreeBuilder(const Tokenization& tz, const ParseOptions& opts)
    : tz_(tz), opts_(opts) {
    sink_.out = &diags_;
    if(opts_.max_nesting < 2) opts_.max_nesting = 2;
    count_ = tz_.tokens.size();
    for(size_t i=0;i<tz_.tokens.size();++i){
        if(tz_.tokens[i].kind==TokenKind::input_end){ count_ = i; break; }
    }
    size_t end = tz_.text.size();
    if(count_>0) end = std::max(end, tz_.tokens[count_-1].span.end);
    end_token_.kind = TokenKind::input_end;
    end_token_.span = Span{end, end};
    misses_.resize(static_cast<size_t>(TokenKind::input_end) + 1);
    trace_ = debug_enabled("WIKITEXT_DEBUG_PARSE");
}

size_t TreeBuilder::line_end(size_t from) const {
    for(size_t i=from;i<count_;++i){
        TokenKind k = tz_.tokens[i].kind;
        if(k==TokenKind::line_break || k==TokenKind::paragraph_break) return i;
    }
    return count_;
}

size_t TreeBuilder::find_kind(TokenKind k, size_t from, size_t end) const {
    for(size_t i=from;i<end && i<count_;++i)
        if(tz_.tokens[i].kind==k) return i;
    return npos;
}

// A miss over [from, end) also answers every narrower search for the same kind.
size_t TreeBuilder::find_closer(TokenKind k, size_t from, size_t end){
    closer_miss& m = misses_[static_cast<size_t>(k)];
    if(m.from!=npos && from>=m.from && end<=m.end) return npos;
    const size_t i = find_kind(k, from, end);
    if(i==npos){
        m.from = from;
        m.end = end;
    }
    return i;
}

std::string_view TreeBuilder::source(Span s) const {
    size_t n = tz_.text.size();
    size_t b = std::min(s.start, n);
    size_t e = std::min(s.end, n);
    if(e<=b) return {};
    return tz_.text.substr(b, e-b);
}

void TreeBuilder::warn(DiagnosticKind k, Span s, const char* rule, std::string message, std::string hint){
    if(trace_) std::fprintf(stderr, "[dbg][parse] %s %s [%zu,%zu): %s\n", diagnostic_code(k), rule, s.start, s.end, message.c_str());
    sink_.emit(k, s, rule, std::move(message), std::move(hint));
}

ParseOutcome TreeBuilder::build(){
    auto root = make_node(document{}, Span{0, end_token_.span.end});
    block_frame doc;
    doc.kind = BlockKind::document;
    doc.n = root;
    stack_.push_back(std::move(doc));

    size_t pending_break = npos;
    while(pos_ < count_){
        TokenKind k = cur().kind;
        if(k==TokenKind::paragraph_break){
            // inside [[div_]] a blank line separates runs instead of paragraphs
            const bool in_run = top().bare && top().run;
            close_to_flow();
            pending_break = npos;
            if(in_run){
                finish_inline(top().inl);
                top().run = true;
                pending_break = pos_;
            }
            ++pos_;
            continue;
        }
        if(k==TokenKind::line_break){
            pending_break = pos_;
            ++pos_;
            continue;
        }
        size_t before = pos_;
        parse_line(pending_break);
        pending_break = npos;
        if(pos_==before) ++pos_;
    }
    while(stack_.size()>1) close_top();
    extend_to_children(*root);
    if(trace_) std::fprintf(stderr, "[dbg][parse] done: %zu top-level nodes, %zu diagnostics\n", root->children.size(), diags_.size());
    return ParseOutcome(root, std::move(diags_));
}

} // namespace detail

ParseOutcome parse(const Tokenization& tokens, const ParseOptions& opts){
    detail::TreeBuilder builder(tokens, opts);
    return builder.build();
}

} // namespace wikitext
