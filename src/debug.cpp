#include "wikitext/debug.hpp"
#include <cstdlib>

namespace wikitext::detail {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}

bool debug_enabled(const char* channel_env){
    return env_flag_enabled("WIKITEXT_DEBUG") || (channel_env && env_flag_enabled(channel_env));
}

} // namespace wikitext::detail
