// Small string helpers shared by the preprocessor and the parser
#pragma once
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace wikitext::detail {

inline bool is_blank(char c){ return c==' ' || c=='\t'; }
inline bool is_space(char c){ return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\f' || c=='\v'; }

inline std::string_view trim(std::string_view s){
    while(!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while(!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

inline std::string to_lower(std::string_view s){
    std::string out(s);
    for(char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool iequals(std::string_view a, std::string_view b){
    if(a.size()!=b.size()) return false;
    for(size_t i=0;i<a.size();++i)
        if(std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    return true;
}

// "name rest of header" -> {"name", "rest of header"}
inline std::pair<std::string_view, std::string_view> split_header(std::string_view header){
    header = trim(header);
    size_t i=0;
    while(i<header.size() && !is_space(header[i])) ++i;
    return { header.substr(0,i), trim(header.substr(i)) };
}

} // namespace wikitext::detail
