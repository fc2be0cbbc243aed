#include "parser_internal.hpp"
#include "block_arguments.hpp"
#include "strings.hpp"
#include <algorithm>
#include <cstdio>

namespace wikitext::detail {

namespace {

struct alignment { const char* marker; const char* align; };

// Legacy [[<]] [[>]] [[=]] [[==]] blocks.
const alignment* find_alignment(std::string_view name){
    static const alignment table[] = {
        {"<", "left"}, {">", "right"}, {"=", "center"}, {"==", "justify"},
    };
    for(const auto& a : table) if(name==a.marker) return &a;
    return nullptr;
}

struct hide_location { const char* name; bool top; bool bottom; };

// [[collapsible hideLocation="..."]]
const hide_location* find_hide_location(std::string_view value){
    static const hide_location table[] = {
        {"top", true, false}, {"bottom", false, true}, {"both", true, true},
        {"neither", false, false}, {"none", false, false},
    };
    for(const auto& h : table) if(iequals(value, h.name)) return &h;
    return nullptr;
}

} // namespace

BlockKind TreeBuilder::parent_kind() const {
    return stack_.size()>=2 ? stack_[stack_.size()-2].kind : BlockKind::document;
}

int TreeBuilder::quote_depth() const {
    int depth = 0;
    for(size_t i=stack_.size(); i-- > 0;){
        BlockKind k = stack_[i].kind;
        if(k==BlockKind::document || k==BlockKind::explicit_block) break;
        if(k==BlockKind::blockquote) ++depth;
    }
    return depth;
}

void TreeBuilder::push_frame(block_frame f){
    top().n->children.push_back(f.n);
    if(trace_) std::fprintf(stderr, "[dbg][parse] open %s at %zu (depth %zu)\n", block_kind_name(f.kind), f.opener.start, stack_.size());
    stack_.push_back(std::move(f));
}

// Implicit close. Only explicit blocks report it.
void TreeBuilder::close_top(){
    block_frame f = std::move(stack_.back());
    stack_.pop_back();
    if(f.kind==BlockKind::paragraph || f.bare) finish_inline(f.inl);
    extend_to_children(*f.n);
    if(f.kind==BlockKind::explicit_block){
        warn(DiagnosticKind::unclosed_block_auto_closed, f.opener, "block",
             "'[[" + f.name + "]]' block was never closed; auto-closed", "add '[[/" + f.name + "]]'");
    }
    if(trace_) std::fprintf(stderr, "[dbg][parse] close %s [%zu,%zu)\n", block_kind_name(f.kind), f.n->span.start, f.n->span.end);
}

void TreeBuilder::close_to_flow(){
    while(top().kind!=BlockKind::document && top().kind!=BlockKind::explicit_block) close_top();
    end_bare_run();
}

// A block construct inside [[div_]] ends the current inline run.
void TreeBuilder::end_bare_run(){
    block_frame& f = top();
    if(!f.bare) return;
    finish_inline(f.inl);
    f.run = false;
}

void TreeBuilder::parse_line(size_t line_break_tok){
    switch(cur().kind){
        case TokenKind::heading: parse_heading(); return;
        case TokenKind::bullet_item:
        case TokenKind::numbered_item: parse_list_item(); return;
        case TokenKind::quote: parse_quote_line(line_break_tok); return;
        case TokenKind::horizontal_rule: parse_horizontal_rule(); return;
        case TokenKind::table_column:
        case TokenKind::table_column_title: parse_table_row(); return;
        case TokenKind::left_block:
            if(parse_block_opener()) return;
            break;
        case TokenKind::left_block_end:
            if(parse_block_closer()) return;
            break;
        default:
            break;
    }
    parse_paragraph_line(line_break_tok);
}

void TreeBuilder::parse_heading(){
    const ExtractedToken& t = cur();
    close_to_flow();
    auto h = make_node(heading{std::clamp(t.level, 1, 6)}, t.span);
    top().n->children.push_back(h);
    ++pos_;
    size_t end = line_end(pos_);
    inline_scope sc{h, {}};
    parse_inline(sc, pos_, end);
    finish_inline(sc);
    extend_to_children(*h);
}

void TreeBuilder::parse_horizontal_rule(){
    const ExtractedToken& t = cur();
    close_to_flow();
    top().n->children.push_back(make_node(horizontal_rule{}, t.span));
    ++pos_;
}

void TreeBuilder::parse_list_item(){
    const ExtractedToken& t = cur();
    const bool ordered = t.kind==TokenKind::numbered_item;
    const int depth = std::max(1, t.level);

    while(top().kind!=BlockKind::document && top().kind!=BlockKind::explicit_block &&
          top().kind!=BlockKind::list && top().kind!=BlockKind::list_item)
        close_top();

    // Unwind to the list this item belongs to.
    while(true){
        if(top().kind==BlockKind::list_item){
            const block_frame& owner = stack_[stack_.size()-2];
            const int owner_depth = owner.depth;
            const bool owner_ordered = owner.ordered;
            if(owner_depth < depth) break; // nest inside the open item
            close_top();
            if(owner_depth > depth || owner_ordered != ordered){ close_top(); continue; }
            break;
        }
        if(top().kind==BlockKind::list && (top().depth > depth || (top().depth==depth && top().ordered!=ordered))){
            close_top();
            continue;
        }
        break;
    }
    end_bare_run();

    bool reuse = top().kind==BlockKind::list && top().depth==depth && top().ordered==ordered;
    if(!reuse && top().kind==BlockKind::list_item && stack_.size()+2 > opts_.max_nesting){
        warn(DiagnosticKind::malformed_construct_degraded, t.span, "list",
             "list nesting exceeds the maximum depth; item added to the enclosing list");
        close_top();
        reuse = top().kind==BlockKind::list;
    }
    if(!reuse){
        block_frame lf;
        lf.kind = BlockKind::list;
        lf.n = make_node(list{ordered, depth}, t.span);
        lf.opener = t.span;
        lf.depth = depth;
        lf.ordered = ordered;
        push_frame(std::move(lf));
    }

    block_frame item;
    item.kind = BlockKind::list_item;
    item.n = make_node(list_item{}, t.span);
    item.opener = t.span;
    item.depth = depth;
    push_frame(std::move(item));

    ++pos_;
    size_t end = line_end(pos_);
    inline_scope sc{top().n, {}};
    parse_inline(sc, pos_, end);
    finish_inline(sc);
    extend_to_children(*sc.root);
}

void TreeBuilder::parse_quote_line(size_t line_break_tok){
    const ExtractedToken& t = cur();
    const int depth = std::max(1, t.level);
    ++pos_;
    size_t end = line_end(pos_);
    while(pos_<end && cur().kind==TokenKind::whitespace) ++pos_;
    const bool has_content = pos_ < end;

    // Same depth as the previous line: the paragraph continues.
    if(has_content && line_break_tok!=npos && top().kind==BlockKind::paragraph &&
       parent_kind()==BlockKind::blockquote && quote_depth()==depth){
        inline_scope& sc = top().inl;
        sc.sink().children.push_back(make_node(line_break{}, tok(line_break_tok).span));
        parse_inline(sc, pos_, end);
        return;
    }

    while(true){
        BlockKind k = top().kind;
        if(k==BlockKind::blockquote && quote_depth()>depth){ close_top(); continue; }
        if(k!=BlockKind::document && k!=BlockKind::explicit_block && k!=BlockKind::blockquote){ close_top(); continue; }
        break;
    }
    end_bare_run();
    while(quote_depth()<depth){
        if(nesting_full()){
            warn(DiagnosticKind::malformed_construct_degraded, t.span, "blockquote",
                 "quote nesting exceeds the maximum depth; line kept at depth " + std::to_string(quote_depth()));
            break;
        }
        block_frame qf;
        qf.kind = BlockKind::blockquote;
        qf.depth = quote_depth()+1;
        qf.n = make_node(blockquote{qf.depth}, t.span);
        qf.opener = t.span;
        push_frame(std::move(qf));
    }
    if(!has_content) return;

    block_frame pf;
    pf.kind = BlockKind::paragraph;
    pf.n = make_node(paragraph{}, cur().span);
    pf.opener = cur().span;
    pf.inl.root = pf.n;
    push_frame(std::move(pf));
    parse_inline(top().inl, pos_, end);
}

void TreeBuilder::parse_table_row(){
    const ExtractedToken& first = cur();
    if(top().kind!=BlockKind::table){
        close_to_flow();
        block_frame tf;
        tf.kind = BlockKind::table;
        tf.n = make_node(table{}, first.span);
        tf.opener = first.span;
        push_frame(std::move(tf));
    }
    auto row = make_node(table_row{}, first.span);
    top().n->children.push_back(row);

    size_t end = line_end(pos_);
    while(pos_<end){
        const ExtractedToken& marker = cur();
        if(marker.kind!=TokenKind::table_column && marker.kind!=TokenKind::table_column_title) break;
        const bool header = marker.kind==TokenKind::table_column_title;
        ++pos_;
        size_t next = pos_;
        while(next<end && tok(next).kind!=TokenKind::table_column && tok(next).kind!=TokenKind::table_column_title) ++next;

        if(next==end){
            bool blank = true;
            for(size_t i=pos_;i<end;++i) if(tok(i).kind!=TokenKind::whitespace){ blank=false; break; }
            if(blank){
                // row terminator
                row->span.end = std::max(row->span.end, marker.span.end);
                pos_ = end;
                break;
            }
        }

        auto cell = make_node(table_cell{header}, marker.span);
        row->children.push_back(cell);
        inline_scope sc{cell, {}};
        parse_inline(sc, pos_, next);
        finish_inline(sc);
        extend_to_children(*cell);
        if(next==end){
            warn(DiagnosticKind::unclosed_block_auto_closed, marker.span, "table-row",
                 "table row is missing its closing '||'; last cell auto-closed", "end the row with '||'");
            break;
        }
        pos_ = next;
    }
    extend_to_children(*row);
}

void TreeBuilder::parse_paragraph_line(size_t line_break_tok){
    size_t end = line_end(pos_);
    while(pos_<end && cur().kind==TokenKind::whitespace) ++pos_;
    if(pos_>=end) return;

    while(true){
        BlockKind k = top().kind;
        if(k==BlockKind::document || k==BlockKind::explicit_block) break;
        if(k==BlockKind::paragraph && (parent_kind()==BlockKind::document || parent_kind()==BlockKind::explicit_block)) break;
        close_top();
    }
    if(top().bare){
        block_frame& f = top();
        if(f.run && line_break_tok!=npos)
            f.inl.sink().children.push_back(make_node(line_break{}, tok(line_break_tok).span));
        f.run = true;
        parse_inline(f.inl, pos_, end);
        return;
    }
    if(top().kind==BlockKind::paragraph){
        if(line_break_tok!=npos)
            top().inl.sink().children.push_back(make_node(line_break{}, tok(line_break_tok).span));
    } else {
        block_frame pf;
        pf.kind = BlockKind::paragraph;
        pf.n = make_node(paragraph{}, cur().span);
        pf.opener = cur().span;
        pf.inl.root = pf.n;
        push_frame(std::move(pf));
    }
    parse_inline(top().inl, pos_, end);
}

bool TreeBuilder::room_for_block(Span header, const std::string& lname){
    if(!nesting_full()) return true;
    warn(DiagnosticKind::malformed_construct_degraded, header, "block",
         "block nesting exceeds the maximum depth; '[[" + lname + "]]' kept inline");
    return false;
}

attribute_list TreeBuilder::block_attributes(std::string_view args, Span header, const std::string& lname){
    auto attrs = parse_attributes(args);
    if(attrs) return std::move(*attrs);
    warn(DiagnosticKind::malformed_construct_degraded, header, "block",
         "malformed attributes on '[[" + lname + "]]' ignored", "use key=\"value\" pairs");
    return {};
}

void TreeBuilder::open_explicit_block(node_ptr n, Span header, const std::string& lname, bool bare){
    close_to_flow();
    block_frame f;
    f.kind = BlockKind::explicit_block;
    f.n = n;
    f.opener = header;
    f.name = lname;
    f.bare = bare;
    if(bare) f.inl.root = n;
    push_frame(std::move(f));
}

collapsible TreeBuilder::make_collapsible(std::string_view args, Span header){
    collapsible c;
    c.attributes = block_attributes(args, header, "collapsible");
    for(const auto& kv : c.attributes){
        if(iequals(kv.first, "show")){
            c.show_text = kv.second;
        } else if(iequals(kv.first, "hide")){
            c.hide_text = kv.second;
        } else if(iequals(kv.first, "folded")){
            if(auto folded = parse_boolean(kv.second)) c.start_open = !*folded;
            else warn(DiagnosticKind::malformed_construct_degraded, header, "collapsible",
                      "'folded' value '" + kv.second + "' is not a boolean; starting folded", "use folded=\"yes\" or folded=\"no\"");
        } else if(iequals(kv.first, "hideLocation")){
            if(const hide_location* h = find_hide_location(trim(kv.second))){
                c.show_top = h->top;
                c.show_bottom = h->bottom;
            } else {
                warn(DiagnosticKind::malformed_construct_degraded, header, "collapsible",
                     "unknown hideLocation '" + kv.second + "'; using top", "use top, bottom, both or neither");
            }
        }
    }
    return c;
}

bool TreeBuilder::parse_block_opener(){
    const size_t open = pos_;
    const size_t end = line_end(pos_);
    const size_t close = find_kind(TokenKind::right_block, open+1, end);
    if(close==npos) return false;

    auto [name, args] = split_header(source(tok(open).span.end, tok(close).span.start));
    const std::string lname = to_lower(name);
    const Span header = cover(open, close);

    if(lname=="div" || lname=="div_"){
        if(!room_for_block(header, lname)) return false;
        div_block d{lname, "", block_attributes(args, header, lname), lname=="div"};
        open_explicit_block(make_node(std::move(d), header), header, lname, lname=="div_");
        pos_ = close+1;
        return true;
    }

    if(lname=="collapsible"){
        if(!room_for_block(header, lname)) return false;
        open_explicit_block(make_node(make_collapsible(args, header), header), header, lname, false);
        pos_ = close+1;
        return true;
    }

    if(const alignment* a = find_alignment(lname)){
        if(!room_for_block(header, lname)) return false;
        warn(DiagnosticKind::deprecated_construct, header, "alignment",
             "alignment block '[[" + lname + "]]' is deprecated",
             std::string("use [[div style=\"text-align: ") + a->align + "\"]]");
        open_explicit_block(make_node(div_block{lname, a->align, {}}, header), header, lname, false);
        pos_ = close+1;
        return true;
    }

    if(lname=="code"){
        parse_code_block(open, close, args);
        return true;
    }

    // Include placeholders and [[footnoteblock]] alone on their line sit between blocks.
    size_t after = close+1;
    while(after<end && tok(after).kind==TokenKind::whitespace) ++after;
    if(after!=end) return false;

    if(lname.rfind("include", 0)==0){
        auto ph = make_include(lname, args, header);
        if(!ph) return false;
        close_to_flow();
        top().n->children.push_back(*ph);
        pos_ = end;
        return true;
    }
    if(lname=="footnoteblock"){
        close_to_flow();
        top().n->children.push_back(make_footnote_block(args, header));
        pos_ = end;
        return true;
    }
    return false;
}

bool TreeBuilder::parse_block_closer(){
    const size_t open = pos_;
    const size_t end = line_end(pos_);
    const size_t close = find_kind(TokenKind::right_block, open+1, end);
    if(close==npos) return false;

    const std::string family = block_family(to_lower(trim(source(tok(open).span.end, tok(close).span.start))));
    size_t target = npos;
    for(size_t i=stack_.size(); i-- > 1;){
        if(stack_[i].kind==BlockKind::explicit_block && block_family(stack_[i].name)==family){ target = i; break; }
    }
    if(target==npos) return false;

    while(stack_.size()-1 > target) close_top();
    block_frame f = std::move(stack_.back());
    stack_.pop_back();
    if(f.bare) finish_inline(f.inl);
    f.n->span.end = std::max(f.n->span.end, tok(close).span.end);
    extend_to_children(*f.n);
    if(trace_) std::fprintf(stderr, "[dbg][parse] close [[%s]] [%zu,%zu)\n", f.name.c_str(), f.n->span.start, f.n->span.end);
    pos_ = close+1;
    return true;
}

void TreeBuilder::parse_code_block(size_t open, size_t close, std::string_view args){
    std::string language;
    if(auto attrs = parse_attributes(args)){
        for(const auto& kv : *attrs) if(iequals(kv.first, "type")) language = kv.second;
    }
    close_to_flow();

    const size_t content_start = tok(close).span.end;
    size_t closer = npos, closer_end = npos;
    size_t le = 0; // end of the line holding token i
    for(size_t i=close+1;i<count_;++i){
        if(le<i) le = line_end(i);
        if(tok(i).kind!=TokenKind::left_block_end) continue;
        size_t rb = find_closer(TokenKind::right_block, i+1, le);
        if(rb==npos) continue;
        if(iequals(trim(source(tok(i).span.end, tok(rb).span.start)), "code")){
            closer = i;
            closer_end = rb;
            break;
        }
    }

    std::string contents;
    Span span;
    if(closer!=npos){
        contents = std::string(source(content_start, tok(closer).span.start));
        span = Span{tok(open).span.start, tok(closer_end).span.end};
        pos_ = closer_end+1;
    } else {
        contents = std::string(source(content_start, end_token_.span.start));
        span = Span{tok(open).span.start, end_token_.span.start};
        pos_ = count_;
        warn(DiagnosticKind::unclosed_block_auto_closed, cover(open, close), "code",
             "'[[code]]' block was never closed; auto-closed at end of input", "add '[[/code]]'");
    }
    if(!contents.empty() && contents.front()=='\n') contents.erase(0, 1);
    if(!contents.empty() && contents.back()=='\n') contents.pop_back();
    top().n->children.push_back(make_node(code_block{language, contents}, span));
}

} // namespace wikitext::detail
