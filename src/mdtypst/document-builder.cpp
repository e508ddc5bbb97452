#include <mdtypst/document-builder.h>
#include <algorithm>

namespace mdtypst {

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trimWhitespace(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::string wrapContent(SpanKind kind, std::string_view rawContent) {
    switch (kind) {
    case SpanKind::Inline:
    case SpanKind::Display: {
        // inner whitespace is kept: `//` comments end at newlines, strings keep spaces
        std::string_view content = trimWhitespace(rawContent);
        size_t lastLine = content.rfind('\n');
        lastLine = lastLine == std::string_view::npos ? 0 : lastLine + 1;
        bool openComment = content.find("//", lastLine) != std::string_view::npos;
        return "$ " + std::string(content) + (openComment ? "\n$" : " $");
    }
    case SpanKind::TaggedBlock:
        return std::string(rawContent);
    }
    return std::string(rawContent);
}

BuiltDocument buildDocument(const Span& span, const Config& config) {
    const std::string& preamble = config.preambleFor(span.kind);

    BuiltDocument doc;
    doc.kind = span.kind;
    doc.empty = std::all_of(span.rawContent.begin(), span.rawContent.end(), isSpace);
    doc.preambleLines = static_cast<size_t>(std::count(preamble.begin(), preamble.end(), '\n')) + 1;
    doc.sourceText = preamble + "\n" + wrapContent(span.kind, span.rawContent);
    return doc;
}

} // namespace mdtypst
