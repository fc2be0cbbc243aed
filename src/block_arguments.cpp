#include "block_arguments.hpp"
#include "pegtl/arguments.hpp"
#include "strings.hpp"
#include <string>
#include <tao/pegtl.hpp>

using namespace tao::pegtl;

namespace wikitext::detail {

namespace {

namespace a = pegtl_front::arguments;

std::pair<std::string, std::string> split_pair(std::string_view s){
    size_t eq = s.find('=');
    std::string_view key = trim(s.substr(0, eq));
    std::string_view value = eq==std::string_view::npos ? std::string_view{} : trim(s.substr(eq+1));
    if(value.size()>=2 && (value.front()=='"' || value.front()=='\'') && value.back()==value.front())
        value = value.substr(1, value.size()-2);
    return { std::string(key), std::string(value) };
}

struct attribute_state { attribute_list attrs; };

template<typename Rule>
struct attribute_action : nothing<Rule> {};

template<>
struct attribute_action< a::attribute > {
    template<typename Input>
    static void apply(const Input& in, attribute_state& st){
        st.attrs.push_back(split_pair(std::string_view(in.begin(), in.size())));
    }
};

struct include_state { IncludeRef ref; };

template<typename Rule>
struct include_action : nothing<Rule> {};

template<>
struct include_action< a::page_ref > {
    template<typename Input>
    static void apply(const Input& in, include_state& st){
        st.ref.page = PageRef::parse(std::string_view(in.begin(), in.size()));
    }
};

template<>
struct include_action< a::var_pair > {
    template<typename Input>
    static void apply(const Input& in, include_state& st){
        st.ref.variables.push_back(split_pair(std::string_view(in.begin(), in.size())));
    }
};

} // namespace

std::optional<attribute_list> parse_attributes(std::string_view text){
    attribute_state st;
    try {
        memory_input<> in(text.data(), text.data() + text.size(), "attributes");
        if(!tao::pegtl::parse< a::attribute_list, attribute_action >(in, st)) return std::nullopt;
    } catch (const tao::pegtl::parse_error&) {
        return std::nullopt;
    }
    return st.attrs;
}

std::optional<bool> parse_boolean(std::string_view text){
    static const char* const truthy[] = {"true", "yes", "on", "1"};
    static const char* const falsy[] = {"false", "no", "off", "0"};
    text = trim(text);
    for(const char* t : truthy) if(iequals(text, t)) return true;
    for(const char* f : falsy) if(iequals(text, f)) return false;
    return std::nullopt;
}

std::optional<IncludeRef> parse_include_call(std::string_view text){
    include_state st;
    try {
        memory_input<> in(text.data(), text.data() + text.size(), "include");
        if(!tao::pegtl::parse< a::include_call, include_action >(in, st)) return std::nullopt;
    } catch (const tao::pegtl::parse_error&) {
        return std::nullopt;
    }
    if(st.ref.page.page.empty()) return std::nullopt;
    return st.ref;
}

} // namespace wikitext::detail
