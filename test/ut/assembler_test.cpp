//=============================================================================
// Assembler Unit Tests
//=============================================================================

#include <boost/ut.hpp>
#include <mdtypst/assembler.h>

using namespace boost::ut;
using namespace mdtypst;

suite assembler_tests = [] {
    "replacements splice into exact ranges"_test = [] {
        std::string doc = "A $x$ B $$y$$ C";
        auto out = assemble(doc, {{{2, 5}, "[1]"}, {{8, 13}, "[2]"}});
        expect(out.has_value());
        expect(*out == "A [1] B [2] C");
    };

    "no replacements returns the input"_test = [] {
        auto out = assemble("unchanged $", {});
        expect(*out == "unchanged $");
    };

    "adjacent ranges and document edges"_test = [] {
        auto out = assemble("abcdef", {{{0, 2}, "X"}, {{2, 4}, "Y"}, {{4, 6}, "Z"}});
        expect(*out == "XYZ");
    };

    "markup containing delimiters is not rescanned"_test = [] {
        auto out = assemble("$a$", {{{0, 3}, "$$b$$"}});
        expect(*out == "$$b$$");
    };

    "invalid ranges are rejected"_test = [] {
        expect(!assemble("abc", {{{1, 5}, "x"}}).has_value());
        expect(!assemble("abcdef", {{{0, 3}, "x"}, {{2, 4}, "y"}}).has_value());
        expect(!assemble("abcdef", {{{3, 4}, "x"}, {{0, 1}, "y"}}).has_value());
        expect(!assemble("abc", {{{2, 1}, "x"}}).has_value());
    };

    "markup by span kind"_test = [] {
        expect(wrapMarkup(SpanKind::Inline, "<svg/>") == "<span class=\"typst-inline\"><svg/></span>");
        expect(wrapMarkup(SpanKind::Display, "<svg/>") == "<div class=\"typst-display\"><svg/></div>");
        expect(wrapMarkup(SpanKind::TaggedBlock, "<svg/>") == "<div class=\"typst-display\"><svg/></div>");
    };

    "error markup escapes message and source"_test = [] {
        auto out = errorMarkup("$a < b$", "unknown \"x\" & more");
        expect(out == "<span class=\"typst-error\" title=\"unknown &quot;x&quot; &amp; more\">$a &lt; b$</span>");
    };
};
