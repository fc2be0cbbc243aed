#include <gtest/gtest.h>
#include "wikitext/preprocess.hpp"
#include <string>

using namespace wikitext;

namespace {

std::string misc(std::string s){
    substitute_misc(s);
    return s;
}

std::string typography(std::string s){
    substitute_typography(s);
    return s;
}

const std::string LDQ = "\xE2\x80\x9C";
const std::string RDQ = "\xE2\x80\x9D";
const std::string LOW = "\xE2\x80\x9E";
const std::string LSQ = "\xE2\x80\x98";
const std::string RSQ = "\xE2\x80\x99";
const std::string LG = "\xC2\xAB";
const std::string RG = "\xC2\xBB";
const std::string ELL = "\xE2\x80\xA6";

} // namespace

TEST(PreprocessMisc, TabsBecomeFourSpaces){
    EXPECT_EQ(misc("\tapple\n\tbanana\tcherry\n"), "    apple\n    banana    cherry");
}

TEST(PreprocessMisc, LineEndingsNormalized){
    EXPECT_EQ(misc("newlines:\r\n* apple\r* banana\r\ncherry\n\r* durian"),
              "newlines:\n* apple\n* banana\ncherry\n\n* durian");
}

TEST(PreprocessMisc, NewlineRunsCompressed){
    EXPECT_EQ(misc("apple\n\n\n\nbanana\n\n\ncherry"), "apple\n\nbanana\n\ncherry");
    EXPECT_EQ(misc("a\r\n\r\n\r\nb"), "a\n\nb");
    EXPECT_EQ(misc("a\n\nb"), "a\n\nb");
}

TEST(PreprocessMisc, BackslashJoinsLines){
    EXPECT_EQ(misc("concat:\napple banana \\\nCherry\\\nPineapple \\ grape\nblueberry\n"),
              "concat:\napple banana CherryPineapple \\ grape\nblueberry");
}

TEST(PreprocessMisc, WhitespaceOnlyLinesEmptied){
    EXPECT_EQ(misc("<\n        \n      \n  \n      \n>"), "<\n\n>");
    EXPECT_EQ(misc("a\n \t \nb"), "a\n\nb");
}

TEST(PreprocessMisc, LeadingAndTrailingNewlinesTrimmed){
    EXPECT_EQ(misc("\n\nabc\n\n"), "abc");
    EXPECT_EQ(misc("\n\n\n"), "");
    EXPECT_EQ(misc(""), "");
}

TEST(PreprocessMisc, CommentsRemoved){
    EXPECT_EQ(misc("apple [!-- hidden --] banana"), "apple  banana");
    EXPECT_EQ(misc("a[!-- x\ny --]b"), "ab");
    EXPECT_EQ(misc("a[!-- one --]b[!-- two --]c"), "abc");
}

TEST(PreprocessMisc, UnterminatedCommentKept){
    EXPECT_EQ(misc("a [!-- b"), "a [!-- b");
}

TEST(PreprocessTypography, DoubleQuotesAndEllipsis){
    EXPECT_EQ(typography("John laughed. ``You'll never defeat me!''\n``That's where you're wrong...''"),
              "John laughed. " + LDQ + "You'll never defeat me!" + RDQ + "\n" + LDQ + "That's where you're wrong" + ELL + RDQ);
}

TEST(PreprocessTypography, LowAndSingleQuotes){
    EXPECT_EQ(typography(",,low''"), LOW + "low" + RDQ);
    EXPECT_EQ(typography("`single'"), LSQ + "single" + RSQ);
}

TEST(PreprocessTypography, QuotePairsDoNotSpanLines){
    EXPECT_EQ(typography("``open\nclose''"), "``open\nclose''");
    EXPECT_EQ(typography("``open only"), "``open only");
}

TEST(PreprocessTypography, Guillemets){
    EXPECT_EQ(typography("<< [[[SCP-4338]]] | SCP-4339 | [[[SCP-4340]]] >>"),
              LG + " [[[SCP-4338]]] | SCP-4339 | [[[SCP-4340]]] " + RG);
}

TEST(PreprocessTypography, QuoteMarkersKept){
    EXPECT_EQ(typography(">> nested quote\n>>> deeper"), ">> nested quote\n>>> deeper");
}

TEST(PreprocessTypography, IndentedChevronsConverted){
    EXPECT_EQ(typography("  >> x"), "  " + RG + " x");
    EXPECT_EQ(typography("> >> also"), "> " + RG + " also");
}

TEST(PreprocessTypography, SpacedEllipsis){
    EXPECT_EQ(typography("**ENTITY MAKES DRAMATIC MOTION** . . . "), "**ENTITY MAKES DRAMATIC MOTION** " + ELL + " ");
}

TEST(Preprocess, StripsByteOrderMark){
    std::string s = "\xEF\xBB\xBFhello";
    preprocess(s);
    EXPECT_EQ(s, "hello");
}

TEST(Preprocess, RunsMiscThenTypography){
    std::string s = "``q''\r\n\r\n\r\n\r\nnext...";
    preprocess(s);
    EXPECT_EQ(s, LDQ + "q" + RDQ + "\n\nnext" + ELL);
}

TEST(Preprocess, TypographyCanBeDisabled){
    PreprocessOptions opts;
    opts.typography = false;
    std::string s = "a...b <<c>>\r\n";
    preprocess(s, opts);
    EXPECT_EQ(s, "a...b <<c>>");
}
