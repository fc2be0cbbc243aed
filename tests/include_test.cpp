#include <gtest/gtest.h>
#include "wikitext/include.hpp"
#include "wikitext/preprocess.hpp"
#include <map>
#include <string>

using namespace wikitext;

namespace {

// Map-backed resolver that records how often each page was requested.
struct MapIncluder : Includer {
    std::map<std::string, std::string> pages;
    std::map<std::string, int> calls;
    std::vector<IncludeRef> seen;

    ResolveResult include_page(const IncludeRef& ref) override {
        seen.push_back(ref);
        ++calls[ref.page.to_string()];
        auto it = pages.find(ref.page.to_string());
        if(it==pages.end()) return ResolveResult::not_found();
        return ResolveResult::ok(it->second);
    }
};

} // namespace

TEST(Include, ExpandsInPlace){
    MapIncluder inc;
    inc.pages["inner"] = "INNER";
    std::string text = "before [[include inner]] after";
    IncludeReport r = preprocess(text, inc);
    EXPECT_EQ(text, "before INNER after");
    EXPECT_EQ(text.find("INNER"), 7u);
    EXPECT_EQ(r.expanded, 1u);
    ASSERT_EQ(r.requested.size(), 1u);
    EXPECT_EQ(r.requested[0].page, "inner");
}

TEST(Include, SelfIncludeResolvedOnce){
    MapIncluder inc;
    inc.pages["self"] = "loop [[include self]]";
    std::string text = "[[include self]]";
    IncludeReport r = preprocess(text, inc);
    EXPECT_EQ(text, "loop [[include-cycle self]]");
    EXPECT_EQ(inc.calls["self"], 1);
    EXPECT_EQ(r.cycles, 1u);
}

TEST(Include, RootPageSeedsCycleTracking){
    MapIncluder inc;
    inc.pages["self"] = "never fetched";
    PreprocessOptions opts;
    opts.page_name = "Self";
    std::string text = "x [[include self]]";
    IncludeReport r = preprocess(text, inc, opts);
    EXPECT_EQ(text, "x [[include-cycle self]]");
    EXPECT_TRUE(inc.calls.empty());
    EXPECT_EQ(r.cycles, 1u);
}

TEST(Include, MutualCycleTerminates){
    MapIncluder inc;
    inc.pages["a"] = "A [[include b]]";
    inc.pages["b"] = "B [[include a]]";
    std::string text = "[[include a]]";
    preprocess(text, inc);
    EXPECT_EQ(text, "A B [[include-cycle a]]");
    EXPECT_EQ(inc.calls["a"], 1);
    EXPECT_EQ(inc.calls["b"], 1);
}

TEST(Include, RepeatedSiblingIncludesAreNotCycles){
    MapIncluder inc;
    inc.pages["x"] = "X";
    std::string text = "[[include x]] [[include x]]";
    IncludeReport r = preprocess(text, inc);
    EXPECT_EQ(text, "X X");
    EXPECT_EQ(inc.calls["x"], 2);
    EXPECT_EQ(r.cycles, 0u);
}

TEST(Include, MissingPageBecomesPlaceholder){
    NullIncluder inc;
    std::string text = "[[include nothing]]";
    IncludeReport r = preprocess(text, inc);
    EXPECT_EQ(text, "[[include-missing nothing]]");
    EXPECT_EQ(r.missing, 1u);
    EXPECT_EQ(r.expanded, 0u);
}

TEST(Include, DepthLimit){
    MapIncluder inc;
    inc.pages["p1"] = "L1 [[include p2]]";
    inc.pages["p2"] = "L2 [[include p3]]";
    inc.pages["p3"] = "L3";
    PreprocessOptions opts;
    opts.max_include_depth = 2;
    std::string text = "[[include p1]]";
    IncludeReport r = preprocess(text, inc, opts);
    EXPECT_EQ(text, "L1 L2 [[include-depth p3]]");
    EXPECT_EQ(r.depth_exceeded, 1u);
    EXPECT_EQ(r.requested.size(), 2u);
    EXPECT_EQ(inc.calls.count("p3"), 0u);
}

TEST(Include, VariablesSubstituted){
    MapIncluder inc;
    inc.pages["greet"] = "Hello {$name}, {$unknown}!";
    std::string text = "[[include greet name=World]]";
    preprocess(text, inc);
    EXPECT_EQ(text, "Hello World, {$unknown}!");

    std::string piped = "[[include greet | name = Piped | other = x]]";
    preprocess(piped, inc);
    EXPECT_EQ(piped, "Hello Piped, {$unknown}!");
    ASSERT_EQ(inc.seen.back().variables.size(), 2u);
    EXPECT_EQ(inc.seen.back().variables[1].first, "other");
    EXPECT_EQ(inc.seen.back().variables[1].second, "x");
}

TEST(Include, SiteQualifiedReference){
    MapIncluder inc;
    inc.pages[":other-site:page"] = "remote";
    std::string text = "[[include :other-site:page]]";
    preprocess(text, inc);
    EXPECT_EQ(text, "remote");
    ASSERT_EQ(inc.seen.size(), 1u);
    EXPECT_EQ(inc.seen[0].page.site, "other-site");
    EXPECT_EQ(inc.seen[0].page.page, "page");
}

TEST(Include, DirectiveNameIsCaseInsensitive){
    MapIncluder inc;
    inc.pages["Inner"] = "ok";
    std::string text = "[[INCLUDE Inner]]";
    preprocess(text, inc);
    EXPECT_EQ(text, "ok");
}

TEST(Include, MalformedDirectivesLeftVerbatim){
    MapIncluder inc;
    for(std::string s : {"[[include]]", "[[include   ]]", "[[included x]]", "[[include page junk]]", "[[include x"}){
        std::string text = s;
        IncludeReport r = preprocess(text, inc);
        EXPECT_EQ(text, s);
        EXPECT_TRUE(r.requested.empty()) << s;
    }
    EXPECT_TRUE(inc.seen.empty());
}

TEST(Include, IncludedTextIsPreprocessed){
    MapIncluder inc;
    inc.pages["body"] = "\xEF\xBB\xBF" "a\r\nb";
    std::string text = "x [[include body]]";
    preprocess(text, inc);
    EXPECT_EQ(text, "x a\nb");
}

TEST(Include, FunctionIncluderForwardsCalls){
    int calls = 0;
    FunctionIncluder inc([&](const IncludeRef& ref){
        ++calls;
        return ResolveResult::ok("[" + ref.page.page + "]");
    });
    std::string text = "[[include one]] and [[include two]]";
    IncludeReport r = expand_includes(text, inc);
    EXPECT_EQ(text, "[one] and [two]");
    EXPECT_EQ(calls, 2);
    ASSERT_EQ(r.requested.size(), 2u);
    EXPECT_EQ(r.requested[0].page, "one");
    EXPECT_EQ(r.requested[1].page, "two");
}

TEST(PageRef, ParsesSiteAndPage){
    PageRef r = PageRef::parse(":site:page");
    EXPECT_EQ(r.site, "site");
    EXPECT_EQ(r.page, "page");
    EXPECT_EQ(r.to_string(), ":site:page");

    PageRef local = PageRef::parse(" Page-Name ");
    EXPECT_TRUE(local.site.empty());
    EXPECT_EQ(local.page, "Page-Name");
    EXPECT_EQ(local.key(), "page-name");

    EXPECT_EQ(PageRef::parse(":broken").page, ":broken");
}

TEST(SubstituteVariables, ReplacesKnownNamesOnly){
    attribute_list vars{{"a", "1"}, {"b", "two"}};
    EXPECT_EQ(substitute_variables("{$a}+{$b}={$c}", vars), "1+two={$c}");
    EXPECT_EQ(substitute_variables("{$a", vars), "{$a");
}
