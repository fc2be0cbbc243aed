// Include directives and the caller-supplied resolution capability
#pragma once
#include "wikitext/ast.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace wikitext {

// Reference to a page, optionally on another site (":site:page").
struct PageRef {
    std::string site; // empty for the current site
    std::string page;

    static PageRef parse(std::string_view s);
    std::string to_string() const;
    // Case-insensitive identity used for cycle tracking.
    std::string key() const;
};

struct IncludeRef {
    PageRef page;
    attribute_list variables;
};

struct ResolveResult {
    bool found = false;
    std::string text;
    std::string error; // resolver-provided reason when !found

    static ResolveResult ok(std::string text){ return ResolveResult{true, std::move(text), {}}; }
    static ResolveResult not_found(std::string error = "no such page"){ return ResolveResult{false, {}, std::move(error)}; }
};

// Maps include targets to replacement text. Called synchronously; the
// preprocessor tracks cycles itself and never assumes idempotence.
class Includer {
public:
    virtual ~Includer() = default;
    virtual ResolveResult include_page(const IncludeRef& ref) = 0;
};

// Resolves nothing: every include becomes a missing placeholder.
class NullIncluder : public Includer {
public:
    ResolveResult include_page(const IncludeRef& ref) override;
};

class FunctionIncluder : public Includer {
public:
    using Fn = std::function<ResolveResult(const IncludeRef&)>;
    explicit FunctionIncluder(Fn fn): fn_(std::move(fn)){}
    ResolveResult include_page(const IncludeRef& ref) override;
private:
    Fn fn_;
};

struct IncludeReport {
    std::vector<PageRef> requested; // pages handed to the includer, in call order
    size_t expanded = 0;
    size_t missing = 0;
    size_t cycles = 0;
    size_t depth_exceeded = 0;
};

// Expand every [[include ...]] directive in place. Failures become inert
// [[include-missing|include-cycle|include-depth <page>]] placeholders.
// `root_page`, when non-empty, seeds the active chain so a page including
// itself is caught without a resolver call.
IncludeReport expand_includes(std::string& text, Includer& includer, size_t max_depth = 16,
                              std::string_view root_page = {});

// Replace {$name} occurrences with variable values; unknown names stay verbatim.
std::string substitute_variables(std::string_view text, const attribute_list& variables);

} // namespace wikitext
