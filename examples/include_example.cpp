// Includes example: resolve pages from an in-memory map, including a cycle and a missing page.
#include <iostream>
#include <map>
#include <string>
#include "wikitext/wikitext.hpp"

using namespace wikitext;

int main(){
    std::map<std::string, std::string> pages = {
        {"component:license", "**License:** {$license}\n[[include component:footer]]"},
        {"component:footer", "//footer// [[include component:license]]"},
    };
    FunctionIncluder includer([&](const IncludeRef& ref){
        auto it = pages.find(ref.page.page);
        if(it==pages.end()) return ResolveResult::not_found();
        return ResolveResult::ok(it->second);
    });

    std::string src =
        "+ SCP-0000\n"
        "\n"
        "[[include component:license license=CC-BY-SA 3.0]]\n"
        "\n"
        "[[include component:missing]]\n";

    PipelineResult res = run_pipeline(src, includer);
    std::cout << res.text << "\n\n";
    std::cout << to_pretty_edn(res.outcome.root()) << "\n";
    std::cout << "requested " << res.includes.requested.size() << " pages, "
              << res.includes.cycles << " cycle(s), " << res.includes.missing << " missing\n";
    for(const auto& d : res.outcome.diagnostics())
        std::cout << d.code << " " << d.message << "\n";
    return 0;
}
