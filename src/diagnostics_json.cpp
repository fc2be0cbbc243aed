#include "wikitext/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace wikitext {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostics_to_json(const std::vector<Diagnostic>& diagnostics, std::string_view text){
    const bool positions = !text.empty();
    LineIndex index(text);
    std::ostringstream os;
    os<<"{\"success\":true,\"warnings\":[";
    for(size_t i=0;i<diagnostics.size(); ++i){
        const auto &d=diagnostics[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"kind\":"<<json_escape(diagnostic_kind_name(d.kind))
            <<",\"severity\":"<<json_escape(severity_name(d.severity))
            <<",\"rule\":"<<json_escape(d.rule)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"span\":["<<d.span.start<<","<<d.span.end<<"]";
        if(positions){
            os<<",\"line\":"<<index.line(d.span.start)
              <<",\"col\":"<<index.col(d.span.start);
        }
        os<<"}";
    }
    os<<"]}";
    return os.str();
}

std::string diagnostics_to_json(const ParseOutcome& outcome, std::string_view text){
    return diagnostics_to_json(outcome.diagnostics(), text);
}

void maybe_print_json(const ParseOutcome& outcome, std::string_view text){
    if(const char* env = std::getenv("WIKITEXT_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=diagnostics_to_json(outcome, text);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace wikitext
