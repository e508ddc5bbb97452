#pragma once

#include <mdtypst/result.hpp>
#include <mdtypst/span.h>
#include <string>
#include <string_view>
#include <vector>

namespace mdtypst {

struct Replacement {
    ByteRange range;
    std::string markup;
};

/**
 * Splice replacement markup into the original document.
 *
 * Replacements must be sorted by start, disjoint and inside the document;
 * anything else is an error and nothing is produced. Text outside the ranges
 * is copied byte for byte and inserted markup is never examined again.
 */
Result<std::string> assemble(std::string_view original, const std::vector<Replacement>& replacements);

// <span class="typst-inline">svg</span> or <div class="typst-display">svg</div>
std::string wrapMarkup(SpanKind kind, std::string_view svg);

// <span class="typst-error" title="message">raw</span>, both escaped
std::string errorMarkup(std::string_view raw, std::string_view message);

std::string htmlEscape(std::string_view text);

} // namespace mdtypst
