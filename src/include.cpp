#include "wikitext/include.hpp"
#include "wikitext/debug.hpp"
#include "wikitext/preprocess.hpp"
#include "block_arguments.hpp"
#include "strings.hpp"
#include <cstdio>

namespace wikitext {

PageRef PageRef::parse(std::string_view s){
    s = detail::trim(s);
    PageRef r;
    if(s.size()>1 && s.front()==':'){
        size_t colon = s.find(':', 1);
        if(colon!=std::string_view::npos && colon>1 && colon+1<s.size()){
            r.site = std::string(s.substr(1, colon-1));
            r.page = std::string(s.substr(colon+1));
            return r;
        }
    }
    r.page = std::string(s);
    return r;
}

std::string PageRef::to_string() const {
    if(site.empty()) return page;
    return ":" + site + ":" + page;
}

std::string PageRef::key() const { return detail::to_lower(to_string()); }

ResolveResult NullIncluder::include_page(const IncludeRef& ref){
    return ResolveResult::not_found("no includer for " + ref.page.to_string());
}

ResolveResult FunctionIncluder::include_page(const IncludeRef& ref){
    if(!fn_) return ResolveResult::not_found("no resolver function");
    return fn_(ref);
}

std::string substitute_variables(std::string_view text, const attribute_list& variables){
    std::string out;
    out.reserve(text.size());
    size_t i=0;
    while(i<text.size()){
        if(text[i]=='{' && i+1<text.size() && text[i+1]=='$'){
            size_t close = text.find('}', i+2);
            if(close!=std::string_view::npos){
                std::string_view name = text.substr(i+2, close-(i+2));
                const std::string* value = nullptr;
                for(const auto& kv : variables) if(kv.first==name){ value=&kv.second; break; }
                if(value){
                    out += *value;
                    i = close+1;
                    continue;
                }
            }
        }
        out += text[i++];
    }
    return out;
}

namespace {

struct include_expander {
    Includer& includer;
    size_t max_depth;
    IncludeReport report;
    std::vector<std::string> chain; // active resolution chain (page keys)
    bool trace = detail::debug_enabled("WIKITEXT_DEBUG_INCLUDE");

    bool in_chain(const std::string& key) const {
        for(const auto& k : chain) if(k==key) return true;
        return false;
    }

    // Offset just past "[[ include" when a directive starts at `p`, else npos.
    static size_t directive_body(std::string_view text, size_t p){
        size_t i = p+2;
        while(i<text.size() && detail::is_blank(text[i])) ++i;
        static const std::string_view word = "include";
        if(text.size()-i < word.size() || !detail::iequals(text.substr(i, word.size()), word)) return std::string_view::npos;
        i += word.size();
        if(i>=text.size() || !detail::is_space(text[i])) return std::string_view::npos;
        return i;
    }

    std::string expand(std::string_view text, size_t depth){
        std::string out;
        out.reserve(text.size());
        size_t i=0;
        while(i<text.size()){
            size_t p = text.find("[[", i);
            if(p==std::string_view::npos){ out.append(text.substr(i)); break; }
            out.append(text.substr(i, p-i));
            size_t body = directive_body(text, p);
            size_t close = body==std::string_view::npos ? body : text.find("]]", body);
            if(close==std::string_view::npos){
                out.append("[[");
                i = p+2;
                continue;
            }
            auto call = detail::parse_include_call(text.substr(body, close-body));
            if(!call){
                if(trace) std::fprintf(stderr, "[dbg][include] malformed directive at %zu left verbatim\n", p);
                out.append(text.substr(p, close+2-p));
                i = close+2;
                continue;
            }
            out += resolve(*call, depth);
            i = close+2;
        }
        return out;
    }

    std::string resolve(const IncludeRef& ref, size_t depth){
        std::string name = ref.page.to_string();
        std::string key = ref.page.key();
        if(in_chain(key)){
            ++report.cycles;
            if(trace) std::fprintf(stderr, "[dbg][include] cycle on %s at depth %zu\n", name.c_str(), depth);
            return "[[include-cycle " + name + "]]";
        }
        if(depth>=max_depth){
            ++report.depth_exceeded;
            if(trace) std::fprintf(stderr, "[dbg][include] depth limit %zu reached for %s\n", max_depth, name.c_str());
            return "[[include-depth " + name + "]]";
        }
        report.requested.push_back(ref.page);
        ResolveResult res = includer.include_page(ref);
        if(!res.found){
            ++report.missing;
            if(trace) std::fprintf(stderr, "[dbg][include] missing %s: %s\n", name.c_str(), res.error.c_str());
            return "[[include-missing " + name + "]]";
        }
        ++report.expanded;
        if(trace) std::fprintf(stderr, "[dbg][include] fetched %s (%zu bytes) depth=%zu\n", name.c_str(), res.text.size(), depth);
        strip_bom(res.text);
        std::string body = substitute_variables(res.text, ref.variables);
        chain.push_back(key);
        std::string expanded = expand(body, depth+1);
        chain.pop_back();
        return expanded;
    }
};

} // namespace

IncludeReport expand_includes(std::string& text, Includer& includer, size_t max_depth, std::string_view root_page){
    include_expander ex{includer, max_depth, {}, {}};
    if(!detail::trim(root_page).empty()) ex.chain.push_back(PageRef::parse(root_page).key());
    text = ex.expand(text, 0);
    return ex.report;
}

} // namespace wikitext
