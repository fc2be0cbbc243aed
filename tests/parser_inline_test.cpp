#include <gtest/gtest.h>
#include "tree_helpers.hpp"
#include "wikitext/ast.hpp"

using namespace wikitext;
using namespace wikitext_test;

namespace {

const node& only_paragraph(const ParseOutcome& out){
    EXPECT_EQ(out.root().children.size(), 1u);
    const node& p = child(out.root(), 0);
    EXPECT_EQ(kind_of(p), NodeKind::paragraph);
    return p;
}

} // namespace

TEST(ParserInline, BoldFollowedByText){
    ParseOutcome out = parse_text("**bold** text");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 2u);
    const node& b = child(p, 0);
    EXPECT_EQ(as<format>(b).kind, FormatKind::bold);
    EXPECT_EQ(b.span, (Span{0, 8}));
    ASSERT_EQ(b.children.size(), 1u);
    EXPECT_EQ(text_of(child(b, 0)), "bold");
    EXPECT_EQ(child(b, 0).span, (Span{2, 6}));
    EXPECT_EQ(text_of(child(p, 1)), " text");
    EXPECT_EQ(child(p, 1).span, (Span{8, 13}));
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, UnclosedBoldAutoClosed){
    ParseOutcome out = parse_text("**unclosed");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    const node& b = child(p, 0);
    EXPECT_EQ(as<format>(b).kind, FormatKind::bold);
    EXPECT_EQ(text_of(child(b, 0)), "unclosed");
    EXPECT_EQ(b.span, (Span{0, 10}));
    ASSERT_EQ(out.diagnostics().size(), 1u);
    const Diagnostic& d = out.diagnostics()[0];
    EXPECT_EQ(d.kind, DiagnosticKind::unclosed_block_auto_closed);
    EXPECT_EQ(d.code, "W1002");
    EXPECT_EQ(d.span, (Span{0, 2}));
}

TEST(ParserInline, StrayCloserIsText){
    ParseOutcome out = parse_text("text**");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(text_of(child(p, 0)), "text**");
    ASSERT_EQ(out.diagnostics().size(), 1u);
    EXPECT_EQ(out.diagnostics()[0].kind, DiagnosticKind::unmatched_closing_marker);
    EXPECT_EQ(out.diagnostics()[0].code, "W1001");
    EXPECT_EQ(out.diagnostics()[0].span, (Span{4, 6}));
}

TEST(ParserInline, NestedFormatting){
    ParseOutcome out = parse_text("**//both//**");
    const node& b = child(only_paragraph(out), 0);
    EXPECT_EQ(as<format>(b).kind, FormatKind::bold);
    const node& i = child(b, 0);
    EXPECT_EQ(as<format>(i).kind, FormatKind::italics);
    EXPECT_EQ(text_of(child(i, 0)), "both");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, CrossedSpansAutoCloseInner){
    ParseOutcome out = parse_text("//a **b// c**");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 2u);
    const node& it = child(p, 0);
    EXPECT_EQ(as<format>(it).kind, FormatKind::italics);
    ASSERT_EQ(it.children.size(), 2u);
    EXPECT_EQ(text_of(child(it, 0)), "a ");
    EXPECT_EQ(as<format>(child(it, 1)).kind, FormatKind::bold);
    EXPECT_EQ(text_of(child(p, 1)), " c**");

    ASSERT_EQ(out.diagnostics().size(), 2u);
    EXPECT_EQ(out.diagnostics()[0].kind, DiagnosticKind::unclosed_block_auto_closed);
    EXPECT_EQ(out.diagnostics()[0].span, (Span{4, 6}));
    EXPECT_EQ(out.diagnostics()[1].kind, DiagnosticKind::unmatched_closing_marker);
    EXPECT_EQ(out.diagnostics()[1].span, (Span{11, 13}));
}

TEST(ParserInline, SpaceFlankedMarkerIsLiteral){
    ParseOutcome out = parse_text("a ** b");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(text_of(child(p, 0)), "a ** b");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, OtherToggles){
    ParseOutcome out = parse_text("__u__ ^^s^^ ,,b,, --x--");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 7u);
    EXPECT_EQ(as<format>(child(p, 0)).kind, FormatKind::underline);
    EXPECT_EQ(as<format>(child(p, 2)).kind, FormatKind::superscript);
    EXPECT_EQ(as<format>(child(p, 4)).kind, FormatKind::subscript);
    EXPECT_EQ(as<format>(child(p, 6)).kind, FormatKind::strikethrough);
}

TEST(ParserInline, IntrawordDashesAreText){
    ParseOutcome out = parse_text("well--known");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(text_of(child(p, 0)), "well--known");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, Monospace){
    ParseOutcome out = parse_text("{{code **x**}}");
    const node& m = child(only_paragraph(out), 0);
    EXPECT_EQ(as<format>(m).kind, FormatKind::monospace);
    ASSERT_EQ(m.children.size(), 2u);
    EXPECT_EQ(text_of(child(m, 0)), "code ");
    EXPECT_EQ(as<format>(child(m, 1)).kind, FormatKind::bold);
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, StrayMonospaceCloser){
    ParseOutcome out = parse_text("a }}");
    EXPECT_EQ(text_of(child(only_paragraph(out), 0)), "a }}");
    EXPECT_EQ(out.count(DiagnosticKind::unmatched_closing_marker), 1u);
}

TEST(ParserInline, RawText){
    ParseOutcome out = parse_text("@@**not bold**@@ and @<&nbsp;>@");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(as<raw>(child(p, 0)).value, "**not bold**");
    EXPECT_EQ(text_of(child(p, 1)), " and ");
    EXPECT_EQ(as<raw>(child(p, 2)).value, "&nbsp;");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, UnclosedRawDegrades){
    ParseOutcome out = parse_text("@@x");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(text_of(child(p, 0)), "@@x");
    EXPECT_EQ(out.count(DiagnosticKind::malformed_construct_degraded), 1u);
}

TEST(ParserInline, StrayRawCloser){
    ParseOutcome out = parse_text("x>@");
    EXPECT_EQ(text_of(child(only_paragraph(out), 0)), "x>@");
    EXPECT_EQ(out.count(DiagnosticKind::unmatched_closing_marker), 1u);
}

TEST(ParserInline, SpanContinuesAcrossLines){
    ParseOutcome out = parse_text("**a\nb**");
    const node& b = child(only_paragraph(out), 0);
    ASSERT_EQ(b.children.size(), 3u);
    EXPECT_EQ(text_of(child(b, 0)), "a");
    EXPECT_EQ(kind_of(child(b, 1)), NodeKind::line_break);
    EXPECT_EQ(text_of(child(b, 2)), "b");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, SpanClosedAtParagraphEnd){
    ParseOutcome out = parse_text("**a\n\nb");
    const node& doc = out.root();
    ASSERT_EQ(doc.children.size(), 2u);
    EXPECT_EQ(kind_of(child(child(doc, 0), 0)), NodeKind::format);
    EXPECT_EQ(text_of(child(child(doc, 1), 0)), "b");
    EXPECT_EQ(out.count(DiagnosticKind::unclosed_block_auto_closed), 1u);
}

TEST(ParserInline, AdjacentTextMerged){
    ParseOutcome out = parse_text("a_b c;d");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(text_of(child(p, 0)), "a_b c;d");
    EXPECT_EQ(child(p, 0).span, (Span{0, 7}));
}

TEST(ParserInline, NestingDepthCapped){
    ParseOptions opts;
    opts.max_nesting = 3;
    ParseOutcome out = parse_text("**//__^^x", opts);
    EXPECT_EQ(out.count(DiagnosticKind::malformed_construct_degraded), 1u);
    EXPECT_EQ(out.count(DiagnosticKind::unclosed_block_auto_closed), 3u);
}

TEST(ParserInline, MarkersOutsideLineStartAreText){
    ParseOutcome out = parse_text("a | b ]] ]");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(text_of(child(p, 0)), "a | b ]] ]");
}

TEST(ParserInline, SpanContainer){
    ParseOutcome out = parse_text("a [[span class=\"x\"]]b **c**[[/span]] d");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(text_of(child(p, 0)), "a ");
    const node& s = child(p, 1);
    const container& c = as<container>(s);
    EXPECT_EQ(c.kind, ContainerKind::span);
    ASSERT_EQ(c.attributes.size(), 1u);
    EXPECT_EQ(c.attributes[0], (std::pair<std::string, std::string>{"class", "x"}));
    EXPECT_EQ(s.span, (Span{2, 36}));
    ASSERT_EQ(s.children.size(), 2u);
    EXPECT_EQ(text_of(child(s, 0)), "b ");
    EXPECT_EQ(as<format>(child(s, 1)).kind, FormatKind::bold);
    EXPECT_EQ(text_of(child(p, 2)), " d");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, SpanUnderscoreDropsEdgeBreaks){
    ParseOutcome plain = parse_text("[[span]]\nx\n[[/span]]");
    const node& s = child(only_paragraph(plain), 0);
    ASSERT_EQ(s.children.size(), 3u);
    EXPECT_EQ(kind_of(child(s, 0)), NodeKind::line_break);
    EXPECT_FALSE(plain.has_diagnostics());

    ParseOutcome bare = parse_text("[[span_]]\nx\n[[/span_]]");
    const node& b = child(only_paragraph(bare), 0);
    ASSERT_EQ(b.children.size(), 1u);
    EXPECT_EQ(text_of(child(b, 0)), "x");
    EXPECT_FALSE(bare.has_diagnostics());
}

TEST(ParserInline, UnclosedSpanAutoClosed){
    ParseOutcome out = parse_text("[[span]]x");
    ASSERT_EQ(out.diagnostics().size(), 1u);
    EXPECT_EQ(out.diagnostics()[0].kind, DiagnosticKind::unclosed_block_auto_closed);
    EXPECT_EQ(out.diagnostics()[0].span, (Span{0, 8}));
    EXPECT_NE(out.diagnostics()[0].message.find("[[span]]"), std::string::npos);
}

TEST(ParserInline, DeletionClosedByAlias){
    ParseOutcome out = parse_text("[[del]]gone[[/deletion]]");
    const node& d = child(only_paragraph(out), 0);
    EXPECT_EQ(as<container>(d).kind, ContainerKind::deletion);
    EXPECT_EQ(text_of(child(d, 0)), "gone");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, ToggleCloseCrossesContainer){
    ParseOutcome out = parse_text("**a [[span]]b** c[[/span]]");
    EXPECT_EQ(out.count(DiagnosticKind::unclosed_block_auto_closed), 1u);
    EXPECT_EQ(out.count(DiagnosticKind::unmatched_closing_marker), 1u);
    const node& p = only_paragraph(out);
    EXPECT_EQ(as<format>(child(p, 0)).kind, FormatKind::bold);
}

TEST(ParserInline, ColorSpan){
    ParseOutcome out = parse_text("##blue|some text## after");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 2u);
    const node& c = child(p, 0);
    EXPECT_EQ(as<format>(c).kind, FormatKind::color);
    EXPECT_EQ(as<format>(c).color, "blue");
    EXPECT_EQ(c.span, (Span{0, 18}));
    ASSERT_EQ(c.children.size(), 1u);
    EXPECT_EQ(text_of(child(c, 0)), "some text");
    EXPECT_EQ(text_of(child(p, 1)), " after");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, ColorWithoutNameDegrades){
    ParseOutcome out = parse_text("a ## b");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 1u);
    EXPECT_EQ(text_of(child(p, 0)), "a ## b");
    EXPECT_EQ(out.count(DiagnosticKind::malformed_construct_degraded), 1u);
}

TEST(ParserInline, UnclosedColorAutoClosed){
    ParseOutcome out = parse_text("##red|x");
    EXPECT_EQ(as<format>(child(only_paragraph(out), 0)).color, "red");
    EXPECT_EQ(out.count(DiagnosticKind::unclosed_block_auto_closed), 1u);
}

TEST(ParserInline, EmailLink){
    ParseOutcome out = parse_text("mail me@example.com now");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 3u);
    const wikitext::link& l = as<wikitext::link>(child(p, 1));
    EXPECT_EQ(l.kind, LinkKind::email);
    EXPECT_EQ(l.target, "me@example.com");
    EXPECT_EQ(child(p, 1).span, (Span{5, 19}));
    EXPECT_EQ(text_of(child(p, 2)), " now");

    ParseOutcome bare = parse_text("user@localhost");
    EXPECT_EQ(text_of(child(only_paragraph(bare), 0)), "user@localhost");
}

TEST(ParserInline, FootnotesNumberedInOrder){
    ParseOutcome out = parse_text("Claim.[[footnote]]Source **one**.[[/footnote]] More[[footnote]]two[[/footnote]]");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 4u);
    EXPECT_EQ(as<footnote>(child(p, 1)).number, 1);
    EXPECT_EQ(child(p, 1).children.size(), 3u);
    EXPECT_EQ(as<footnote>(child(p, 3)).number, 2);
    EXPECT_EQ(plain_text(child(p, 3)), "two");
    EXPECT_FALSE(out.has_diagnostics());
}

TEST(ParserInline, NestedFootnoteDegrades){
    ParseOutcome out = parse_text("[[footnote]]a[[footnote]]b[[/footnote]]");
    const node& f = child(only_paragraph(out), 0);
    EXPECT_EQ(as<footnote>(f).number, 1);
    EXPECT_EQ(plain_text(f), "a[[footnote]]b");
    EXPECT_EQ(out.count(DiagnosticKind::malformed_construct_degraded), 1u);
    EXPECT_EQ(out.count(DiagnosticKind::unmatched_closing_marker), 0u);
}

TEST(ParserInline, InlineFootnoteBlock){
    ParseOutcome out = parse_text("see [[footnoteblock]] here");
    const node& p = only_paragraph(out);
    ASSERT_EQ(p.children.size(), 3u);
    EXPECT_EQ(kind_of(child(p, 1)), NodeKind::footnote_block);
    EXPECT_TRUE(as<footnote_block>(child(p, 1)).title.empty());
}

TEST(ParserInline, LongUnclosedOpenerRunsStayCorrect){
    const size_t n = 20000;
    std::string links, blocks, raws;
    for(size_t i=0;i<n;++i){ links += "[[[ "; blocks += "[[ "; raws += "@< "; }
    for(const std::string* src : {&links, &blocks, &raws}){
        ParseOutcome out = parse_text(*src);
        const node& p = only_paragraph(out);
        ASSERT_EQ(p.children.size(), 1u);
        EXPECT_EQ(text_of(child(p, 0)), *src);
        EXPECT_EQ(out.count(DiagnosticKind::malformed_construct_degraded), n);
    }
}
