#pragma once

#include <mdtypst/diagnostic.h>
#include <mdtypst/span.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdtypst {

struct Extraction {
    std::vector<Span> spans;           // ordered, non-overlapping
    std::vector<DocumentDiagnostic> anomalies;
};

/**
 * BlockExtractor - finds math and tagged blocks in Markdown source
 *
 * One forward pass over the document. Recognized spans:
 *   $...$        inline math (no blank line inside)
 *   $$...$$      display math
 *   ```<tag>     fenced block whose info string starts with the code tag
 *
 * Never triggers inside fenced code, inline code spans, escaped characters,
 * HTML tags, or containers produced by a previous run. Inside math a
 * backslash escapes the next byte, and braces or a Typst code escape
 * (#[ #( #{) open a bracket depth; delimiters only close at depth 0.
 *
 * Byte ranges refer to the text passed to extract().
 */
class BlockExtractor {
public:
    explicit BlockExtractor(std::string codeTag);

    Extraction extract(std::string_view document) const;

    const std::string& codeTag() const noexcept { return _codeTag; }

private:
    std::string _codeTag;
};

} // namespace mdtypst
