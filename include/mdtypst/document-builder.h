#pragma once

#include <mdtypst/config.h>
#include <mdtypst/span.h>
#include <cstddef>
#include <string>
#include <string_view>

namespace mdtypst {

struct BuiltDocument {
    std::string sourceText;
    SpanKind kind = SpanKind::Inline;
    size_t preambleLines = 0;  // lines before the wrapped content
    bool empty = false;        // nothing to typeset
};

// `text` without leading and trailing whitespace.
std::string_view trimWhitespace(std::string_view text);

// Wrap span content the way the compiler expects it for the span kind.
// Math is trimmed and put between `$ ` and ` $`; the closing `$` moves to its
// own line when the last content line may end in a `//` comment.
std::string wrapContent(SpanKind kind, std::string_view rawContent);

// preamble + "\n" + wrapped content
BuiltDocument buildDocument(const Span& span, const Config& config);

} // namespace mdtypst
