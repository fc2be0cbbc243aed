#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "wikitext/wikitext.hpp"

using namespace wikitext;

static bool read_file(const std::string& path, std::string& out){
    if(path=="-"){ std::stringstream ss; ss<<std::cin.rdbuf(); out=ss.str(); return true; }
    std::ifstream ifs(path, std::ios::binary); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out=ss.str(); return true;
}

// Resolves "page" to <dir>/page.txt (":site:page" to <dir>/site/page.txt).
class DirectoryIncluder : public Includer {
public:
    explicit DirectoryIncluder(std::string dir): dir_(std::move(dir)){}
    ResolveResult include_page(const IncludeRef& ref) override {
        std::string path = dir_ + "/" + (ref.page.site.empty() ? "" : ref.page.site + "/") + ref.page.page + ".txt";
        std::string text;
        if(!read_file(path, text)) return ResolveResult::not_found("cannot open " + path);
        return ResolveResult::ok(std::move(text));
    }
private:
    std::string dir_;
};

static void usage(){
    std::cerr << "usage: wikitext_driver [--preprocess|--tokens|--tree|--pretty|--json] [--no-typography]\n"
                 "                       [--include-dir DIR] [--page NAME] <file|->\n";
}

int main(int argc, char** argv){
    std::string mode = "--pretty";
    std::string file, include_dir;
    PipelineOptions opts = options_from_env();
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--preprocess" || a=="--tokens" || a=="--tree" || a=="--pretty" || a=="--json") mode = a;
        else if(a=="--no-typography") opts.preprocess.typography = false;
        else if(a=="--include-dir" && i+1<argc) include_dir = argv[++i];
        else if(a=="--page" && i+1<argc) opts.preprocess.page_name = argv[++i];
        else if(a=="-h" || a=="--help"){ usage(); return 0; }
        else if(file.empty()) file = a;
        else { usage(); return 1; }
    }
    if(file.empty()){ usage(); return 1; }
    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read " << file << "\n"; return 1; }

    DirectoryIncluder dir_includer(include_dir);
    NullIncluder none;
    Includer& includer = include_dir.empty() ? static_cast<Includer&>(none) : static_cast<Includer&>(dir_includer);
    PipelineResult res = include_dir.empty() ? run_pipeline(src, opts) : run_pipeline(src, includer, opts);

    if(mode=="--preprocess"){
        std::cout << res.text;
    } else if(mode=="--tokens"){
        Tokenization tz = tokenize(res.text);
        for(const auto& t : tz.tokens){
            std::cout << token_kind_name(t.kind) << " [" << t.span.start << "," << t.span.end << ")";
            if(t.level) std::cout << " level=" << t.level;
            std::cout << " " << edn_escape(std::string(t.slice)) << "\n";
        }
    } else if(mode=="--tree"){
        std::cout << to_edn(res.outcome) << "\n";
    } else if(mode=="--json"){
        std::cout << diagnostics_to_json(res.outcome, res.text) << "\n";
    } else {
        std::cout << to_pretty_edn(res.outcome.root()) << "\n";
        LineIndex index(res.text);
        for(const auto& d : res.outcome.diagnostics()){
            std::cerr << "warning[" << d.code << "] " << index.line(d.span.start) << ":" << index.col(d.span.start)
                      << ": " << d.message;
            if(!d.hint.empty()) std::cerr << " (hint: " << d.hint << ")";
            std::cerr << "\n";
        }
    }
    maybe_print_json(res.outcome, res.text);
    return 0;
}
