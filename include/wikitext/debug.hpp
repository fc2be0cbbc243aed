// Environment-gated tracing to stderr
#pragma once

namespace wikitext {
namespace detail {

// Feature flags sourced from environment ("1", "t", "T", "y", "Y" enable).
bool env_flag_enabled(const char* name);

// True when WIKITEXT_DEBUG or the channel variable (e.g. WIKITEXT_DEBUG_PARSE) is set.
bool debug_enabled(const char* channel_env);

} // namespace detail
} // namespace wikitext
