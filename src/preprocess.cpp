#include "wikitext/preprocess.hpp"
#include "wikitext/debug.hpp"
#include "strings.hpp"
#include <cstdio>

namespace wikitext {

namespace {

// [!-- ... --], shortest match; an unterminated opener stays as text.
void remove_comments(std::string& s){
    size_t from = 0;
    while(true){
        size_t open = s.find("[!--", from);
        if(open==std::string::npos) return;
        size_t close = s.find("--]", open+4);
        if(close==std::string::npos) return;
        s.erase(open, close+3-open);
        from = open;
    }
}

void normalize_newlines(std::string& s){
    std::string out;
    out.reserve(s.size());
    for(size_t i=0;i<s.size();++i){
        if(s[i]=='\r'){
            out += '\n';
            if(i+1<s.size() && s[i+1]=='\n') ++i;
        } else {
            out += s[i];
        }
    }
    s.swap(out);
}

void empty_blank_lines(std::string& s){
    std::string out;
    out.reserve(s.size());
    size_t start = 0;
    while(start<=s.size()){
        size_t nl = s.find('\n', start);
        size_t end = nl==std::string::npos ? s.size() : nl;
        bool blank = true;
        for(size_t i=start;i<end;++i) if(!detail::is_blank(s[i])){ blank=false; break; }
        if(!blank) out.append(s, start, end-start);
        if(nl==std::string::npos) break;
        out += '\n';
        start = nl+1;
    }
    s.swap(out);
}

void join_continued_lines(std::string& s){
    std::string out;
    out.reserve(s.size());
    for(size_t i=0;i<s.size();++i){
        if(s[i]=='\\' && i+1<s.size() && s[i+1]=='\n'){ ++i; continue; }
        out += s[i];
    }
    s.swap(out);
}

void expand_tabs(std::string& s){
    std::string out;
    out.reserve(s.size());
    for(char c : s){
        if(c=='\t') out.append(4, ' ');
        else out += c;
    }
    s.swap(out);
}

// Three or more consecutive newlines become a single blank line.
void compress_newlines(std::string& s){
    std::string out;
    out.reserve(s.size());
    size_t i=0;
    while(i<s.size()){
        if(s[i]!='\n'){ out += s[i++]; continue; }
        size_t run = 0;
        while(i<s.size() && s[i]=='\n'){ ++run; ++i; }
        out.append(run>=3 ? 2 : run, '\n');
    }
    s.swap(out);
}

void trim_newlines(std::string& s){
    size_t b = s.find_first_not_of('\n');
    if(b==std::string::npos){ s.clear(); return; }
    size_t e = s.find_last_not_of('\n');
    s = s.substr(b, e-b+1);
}

} // namespace

void strip_bom(std::string& text){
    if(text.size()>=3 && static_cast<unsigned char>(text[0])==0xEF && static_cast<unsigned char>(text[1])==0xBB && static_cast<unsigned char>(text[2])==0xBF)
        text.erase(0, 3);
}

void substitute_misc(std::string& text){
    remove_comments(text);
    normalize_newlines(text);
    empty_blank_lines(text);
    join_continued_lines(text);
    expand_tabs(text);
    compress_newlines(text);
    trim_newlines(text);
}

void preprocess(std::string& text, const PreprocessOptions& opts){
    const bool trace = detail::debug_enabled("WIKITEXT_DEBUG_PREPROC");
    size_t before = text.size();
    strip_bom(text);
    substitute_misc(text);
    if(opts.typography) substitute_typography(text);
    if(trace) std::fprintf(stderr, "[dbg][preproc] %zu -> %zu bytes (typography=%d)\n", before, text.size(), opts.typography ? 1 : 0);
}

IncludeReport preprocess(std::string& text, Includer& includer, const PreprocessOptions& opts){
    IncludeReport report = expand_includes(text, includer, opts.max_include_depth, opts.page_name);
    preprocess(text, opts);
    return report;
}

} // namespace wikitext
