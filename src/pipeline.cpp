#include "wikitext/pipeline.hpp"
#include "wikitext/debug.hpp"
#include "wikitext/lexer.hpp"
#include <cstdio>
#include <cstdlib>

namespace wikitext {

namespace {

bool env_size(const char* name, size_t& out){
    const char* v = std::getenv(name);
    if(!v || !*v) return false;
    char* endp = nullptr;
    unsigned long long n = std::strtoull(v, &endp, 10);
    if(endp==v || *endp!='\0'){
        std::fprintf(stderr, "[wikitext] ignoring %s=%s (not a number)\n", name, v);
        return false;
    }
    out = static_cast<size_t>(n);
    return true;
}

PipelineResult finish(std::string text, IncludeReport includes, const PipelineOptions& opts){
    Tokenization tz = tokenize(text);
    ParseOutcome outcome = parse(tz, opts.parse);
    return PipelineResult{std::move(text), std::move(outcome), std::move(includes)};
}

} // namespace

PipelineOptions options_from_env(){
    PipelineOptions opts;
    if(const char* v = std::getenv("WIKITEXT_TYPOGRAPHY")){
        if(*v) opts.preprocess.typography = detail::env_flag_enabled("WIKITEXT_TYPOGRAPHY");
    }
    size_t n = 0;
    if(env_size("WIKITEXT_MAX_INCLUDE_DEPTH", n)) opts.preprocess.max_include_depth = n;
    if(env_size("WIKITEXT_MAX_NESTING", n) && n>0) opts.parse.max_nesting = n;
    return opts;
}

PipelineResult run_pipeline(std::string text, const PipelineOptions& opts){
    preprocess(text, opts.preprocess);
    return finish(std::move(text), IncludeReport{}, opts);
}

PipelineResult run_pipeline(std::string text, Includer& includer, const PipelineOptions& opts){
    IncludeReport report = preprocess(text, includer, opts.preprocess);
    return finish(std::move(text), std::move(report), opts);
}

} // namespace wikitext
