#include "wikitext/edn_writer.hpp"
#include <sstream>

namespace wikitext {

std::string edn_escape(const std::string& s){
    std::string out = "\"";
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

namespace {

std::string attributes_edn(const attribute_list& attrs){
    std::string out = "{";
    bool first = true;
    for(const auto& kv : attrs){
        if(!first) out += ' ';
        first = false;
        out += edn_escape(kv.first) + ' ' + edn_escape(kv.second);
    }
    out += '}';
    return out;
}

// Payload entries after :type and :span, e.g. " :level 2".
struct payload_writer {
    std::string operator()(const document&) const { return ""; }
    std::string operator()(const paragraph&) const { return ""; }
    std::string operator()(const heading& h) const { return " :level " + std::to_string(h.level); }
    std::string operator()(const list& l) const {
        return std::string(" :ordered ") + (l.ordered ? "true" : "false") + " :depth " + std::to_string(l.depth);
    }
    std::string operator()(const list_item&) const { return ""; }
    std::string operator()(const table&) const { return ""; }
    std::string operator()(const table_row&) const { return ""; }
    std::string operator()(const table_cell& c) const { return std::string(" :header ") + (c.header ? "true" : "false"); }
    std::string operator()(const format& f) const {
        std::string out = std::string(" :style :") + format_kind_name(f.kind);
        if(f.kind==FormatKind::color) out += " :color " + edn_escape(f.color);
        return out;
    }
    std::string operator()(const link& l) const {
        std::string out = std::string(" :link-type :") + link_kind_name(l.kind) + " :target " + edn_escape(l.target);
        out += " :label " + (l.label ? edn_escape(*l.label) : std::string("nil"));
        out += std::string(" :new-tab ") + (l.new_tab ? "true" : "false");
        return out;
    }
    std::string operator()(const text& t) const { return " :value " + edn_escape(t.value); }
    std::string operator()(const include_placeholder& p) const {
        return " :target " + edn_escape(p.target) + " :status :" + include_status_name(p.status) +
               " :variables " + attributes_edn(p.variables);
    }
    std::string operator()(const raw& r) const { return " :value " + edn_escape(r.value); }
    std::string operator()(const unrecognized& u) const { return " :name " + edn_escape(u.name) + " :source " + edn_escape(u.source); }
    std::string operator()(const line_break&) const { return ""; }
    std::string operator()(const horizontal_rule&) const { return ""; }
    std::string operator()(const blockquote& q) const { return " :depth " + std::to_string(q.depth); }
    std::string operator()(const div_block& d) const {
        std::string out = " :name " + edn_escape(d.name);
        out += " :align " + (d.align.empty() ? std::string("nil") : ":" + d.align);
        out += " :attributes " + attributes_edn(d.attributes);
        out += std::string(" :paragraphs ") + (d.paragraphs ? "true" : "false");
        return out;
    }
    std::string operator()(const code_block& c) const {
        return " :language " + (c.language.empty() ? std::string("nil") : edn_escape(c.language)) +
               " :contents " + edn_escape(c.contents);
    }
    std::string operator()(const container& c) const {
        return std::string(" :container :") + container_kind_name(c.kind) + " :attributes " + attributes_edn(c.attributes);
    }
    std::string operator()(const collapsible& c) const {
        auto opt = [](const std::string& s){ return s.empty() ? std::string("nil") : edn_escape(s); };
        std::string out = " :show " + opt(c.show_text) + " :hide " + opt(c.hide_text);
        out += std::string(" :open ") + (c.start_open ? "true" : "false");
        out += std::string(" :show-top ") + (c.show_top ? "true" : "false");
        out += std::string(" :show-bottom ") + (c.show_bottom ? "true" : "false");
        out += " :attributes " + attributes_edn(c.attributes);
        return out;
    }
    std::string operator()(const footnote& f) const { return " :number " + std::to_string(f.number); }
    std::string operator()(const footnote_block& b) const {
        return " :title " + (b.title.empty() ? std::string("nil") : edn_escape(b.title));
    }
};

// indentWidth < 0 selects the compact form.
void write_node(std::ostringstream& os, const node& n, int indentWidth, int depth){
    os << "{:type :" << node_kind_name(node_kind(n))
       << " :span [" << n.span.start << ' ' << n.span.end << ']'
       << std::visit(payload_writer{}, n.data);
    if(!n.children.empty()){
        os << " :children [";
        bool first = true;
        for(const auto& ch : n.children){
            if(!ch) continue;
            if(indentWidth >= 0){
                os << '\n' << std::string(static_cast<size_t>((depth+1)*indentWidth), ' ');
            } else if(!first){
                os << ' ';
            }
            first = false;
            write_node(os, *ch, indentWidth, depth+1);
        }
        os << ']';
    }
    os << '}';
}

std::string diagnostic_edn(const Diagnostic& d){
    std::ostringstream os;
    os << "{:code " << edn_escape(d.code)
       << " :kind :" << diagnostic_kind_name(d.kind)
       << " :severity :" << severity_name(d.severity)
       << " :span [" << d.span.start << ' ' << d.span.end << ']'
       << " :rule " << edn_escape(d.rule)
       << " :message " << edn_escape(d.message);
    if(!d.hint.empty()) os << " :hint " << edn_escape(d.hint);
    os << '}';
    return os.str();
}

} // namespace

std::string to_edn(const node& n){
    std::ostringstream os;
    write_node(os, n, -1, 0);
    return os.str();
}

std::string to_pretty_edn(const node& n, int indentWidth){
    std::ostringstream os;
    write_node(os, n, indentWidth < 0 ? 0 : indentWidth, 0);
    return os.str();
}

std::string to_edn(const std::vector<Diagnostic>& diagnostics){
    std::string out = "[";
    bool first = true;
    for(const auto& d : diagnostics){
        if(!first) out += ' ';
        first = false;
        out += diagnostic_edn(d);
    }
    out += ']';
    return out;
}

std::string to_edn(const ParseOutcome& outcome){
    return "{:tree " + to_edn(outcome.root()) + " :diagnostics " + to_edn(outcome.diagnostics()) + "}";
}

} // namespace wikitext
