#include "wikitext/ast.hpp"

namespace wikitext {

const char* node_kind_name(NodeKind k){
    switch(k){
        case NodeKind::document: return "document";
        case NodeKind::paragraph: return "paragraph";
        case NodeKind::heading: return "heading";
        case NodeKind::list: return "list";
        case NodeKind::list_item: return "list-item";
        case NodeKind::table: return "table";
        case NodeKind::table_row: return "table-row";
        case NodeKind::table_cell: return "table-cell";
        case NodeKind::format: return "format";
        case NodeKind::link: return "link";
        case NodeKind::text: return "text";
        case NodeKind::include_placeholder: return "include-placeholder";
        case NodeKind::raw: return "raw";
        case NodeKind::unrecognized: return "unrecognized";
        case NodeKind::line_break: return "line-break";
        case NodeKind::horizontal_rule: return "horizontal-rule";
        case NodeKind::blockquote: return "blockquote";
        case NodeKind::div: return "div";
        case NodeKind::code_block: return "code-block";
        case NodeKind::container: return "container";
        case NodeKind::collapsible: return "collapsible";
        case NodeKind::footnote: return "footnote";
        case NodeKind::footnote_block: return "footnote-block";
    }
    return "unknown";
}

const std::vector<NodeKind>& all_node_kinds(){
    static const std::vector<NodeKind> kinds = [](){
        std::vector<NodeKind> v;
        for(size_t i=0;i<std::variant_size_v<node_data>;++i) v.push_back(static_cast<NodeKind>(i));
        return v;
    }();
    return kinds;
}

const char* format_kind_name(FormatKind k){
    switch(k){
        case FormatKind::bold: return "bold";
        case FormatKind::italics: return "italics";
        case FormatKind::underline: return "underline";
        case FormatKind::strikethrough: return "strikethrough";
        case FormatKind::superscript: return "superscript";
        case FormatKind::subscript: return "subscript";
        case FormatKind::monospace: return "monospace";
        case FormatKind::color: return "color";
    }
    return "unknown";
}

const char* link_kind_name(LinkKind k){
    switch(k){
        case LinkKind::page: return "page";
        case LinkKind::url: return "url";
        case LinkKind::anchor: return "anchor";
        case LinkKind::email: return "email";
    }
    return "unknown";
}

const char* container_kind_name(ContainerKind k){
    switch(k){
        case ContainerKind::span: return "span";
        case ContainerKind::deletion: return "deletion";
    }
    return "unknown";
}

const char* include_status_name(IncludeStatus s){
    switch(s){
        case IncludeStatus::unexpanded: return "unexpanded";
        case IncludeStatus::missing: return "missing";
        case IncludeStatus::cycle: return "cycle";
        case IncludeStatus::depth: return "depth";
    }
    return "unknown";
}

std::string plain_text(const node& n){
    std::string out;
    walk(n, [&](const node& x){
        if(auto* t = std::get_if<text>(&x.data)) out += t->value;
        else if(auto* r = std::get_if<raw>(&x.data)) out += r->value;
    });
    return out;
}

} // namespace wikitext
