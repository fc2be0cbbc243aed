// Syntax tree produced by the tree builder
#pragma once
#include "wikitext/span.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace wikitext {

struct node;
using node_ptr = std::shared_ptr<node>;

// Ordered key/value pairs (block attributes, include variables).
using attribute_list = std::vector<std::pair<std::string, std::string>>;

enum class FormatKind { bold, italics, underline, strikethrough, superscript, subscript, monospace, color };
enum class LinkKind { page, url, anchor, email };
enum class ContainerKind { span, deletion };
// unexpanded: no includer was run; the others mirror the preprocessor placeholders.
enum class IncludeStatus { unexpanded, missing, cycle, depth };

struct document {};
struct paragraph {};
struct heading { int level = 1; };
struct list { bool ordered = false; int depth = 1; };
struct list_item {};
struct table {};
struct table_row {};
struct table_cell { bool header = false; };
struct format
{
    FormatKind kind = FormatKind::bold;
    std::string color; // ##color|text## only
};
struct link
{
    LinkKind kind = LinkKind::page;
    std::string target;
    std::optional<std::string> label;
    bool new_tab = false;
};
struct text { std::string value; };
struct include_placeholder
{
    std::string target;
    IncludeStatus status = IncludeStatus::unexpanded;
    attribute_list variables;
};
struct raw { std::string value; };
struct unrecognized { std::string name; std::string source; };
struct line_break {};
struct horizontal_rule {};
struct blockquote { int depth = 1; };
struct div_block
{
    std::string name;  // "div" or the legacy alignment marker ("<", ">", "=", "==")
    std::string align; // empty, "left", "right", "center" or "justify"
    attribute_list attributes;
    bool paragraphs = true; // false for [[div_]]: lines are inline children
};
struct code_block { std::string language; std::string contents; };
// Inline [[span]] / [[span_]] / [[del]] wrapper.
struct container
{
    ContainerKind kind = ContainerKind::span;
    attribute_list attributes;
};
struct collapsible
{
    attribute_list attributes;
    std::string show_text;
    std::string hide_text;
    bool start_open = false;
    bool show_top = true;    // hide link above the contents
    bool show_bottom = false; // hide link below the contents
};
// Numbered in order of appearance, starting at 1.
struct footnote { int number = 1; };
struct footnote_block { std::string title; };

using node_data = std::variant<document, paragraph, heading, list, list_item, table, table_row, table_cell,
                               format, link, text, include_placeholder, raw, unrecognized, line_break,
                               horizontal_rule, blockquote, div_block, code_block, container, collapsible,
                               footnote, footnote_block>;

// Mirrors the node_data alternative order.
enum class NodeKind {
    document,
    paragraph,
    heading,
    list,
    list_item,
    table,
    table_row,
    table_cell,
    format,
    link,
    text,
    include_placeholder,
    raw,
    unrecognized,
    line_break,
    horizontal_rule,
    blockquote,
    div,
    code_block,
    container,
    collapsible,
    footnote,
    footnote_block
};

struct node
{
    node_data data;
    Span span;
    std::vector<node_ptr> children;
};

inline node_ptr make_node(node_data d, Span s) { return std::make_shared<node>(node{std::move(d), s, {}}); }

inline NodeKind node_kind(const node& n) { return static_cast<NodeKind>(n.data.index()); }

// Stable kebab-case tag ("table-cell", "include-placeholder", ...).
const char* node_kind_name(NodeKind k);
const std::vector<NodeKind>& all_node_kinds();

const char* format_kind_name(FormatKind k);
const char* link_kind_name(LinkKind k);
const char* container_kind_name(ContainerKind k);
const char* include_status_name(IncludeStatus s);

template <typename T>
bool is(const node& n) { return std::holds_alternative<T>(n.data); }

// Accessor; throws std::bad_variant_access on a kind mismatch.
template <typename T>
const T& as(const node& n) { return std::get<T>(n.data); }

// Concatenated text/raw content of a subtree.
std::string plain_text(const node& n);

// Depth-first pre-order walk.
template <typename F>
void walk(const node& n, F&& fn)
{
    fn(n);
    for (const auto& ch : n.children)
        if (ch)
            walk(*ch, fn);
}

} // namespace wikitext
