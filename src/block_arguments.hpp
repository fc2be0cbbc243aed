// Argument parsing for [[block ...]] headers and include directives
#pragma once
#include "wikitext/ast.hpp"
#include "wikitext/include.hpp"
#include <optional>
#include <string_view>

namespace wikitext::detail {

// `key="value" key2=value2`; nullopt when the text is not an attribute list.
std::optional<attribute_list> parse_attributes(std::string_view text);

// yes/no, true/false, on/off, 1/0 in any case; nullopt otherwise.
std::optional<bool> parse_boolean(std::string_view text);

// Arguments following the word "include"; nullopt when malformed.
std::optional<IncludeRef> parse_include_call(std::string_view text);

} // namespace wikitext::detail
