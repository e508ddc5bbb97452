#include <mdtypst/block-extractor.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <optional>

namespace mdtypst {

namespace {

constexpr std::string_view CONTAINER_SPAN = "<span class=\"typst-";
constexpr std::string_view CONTAINER_DIV = "<div class=\"typst-";

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool isOpenBracket(char c) { return c == '[' || c == '(' || c == '{'; }

char closerFor(char open) {
    switch (open) {
    case '[': return ']';
    case '(': return ')';
    default:  return '}';
    }
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

// First word of a fence info string: "typst,ignore" and "typst {x}" give "typst"
std::string_view firstWord(std::string_view info) {
    size_t end = 0;
    while (end < info.size() && !isSpace(info[end]) && info[end] != ',' && info[end] != '{') {
        ++end;
    }
    return info.substr(0, end);
}

struct Fence {
    char ch = '`';
    size_t length = 0;
    std::string_view info;
    size_t lineEnd = 0;
};

//=============================================================================
// Scanner - one pass over a document
//=============================================================================
class Scanner {
public:
    Scanner(std::string_view doc, const std::string& codeTag)
        : _doc(doc), _codeTag(codeTag), _lines(doc) {}

    Extraction run() {
        size_t pos = 0;
        const size_t n = _doc.size();
        while (pos < n) {
            if (atLineStart(pos)) {
                if (auto fence = openingFence(pos)) {
                    pos = scanFence(pos, *fence);
                    continue;
                }
            }

            switch (_doc[pos]) {
            case '\\':
                // \$ and \` are literal
                pos += (pos + 1 < n && std::ispunct(static_cast<unsigned char>(_doc[pos + 1]))) ? 2 : 1;
                break;
            case '`':
                pos = skipCodeSpan(pos);
                break;
            case '<':
                pos = skipHtml(pos);
                break;
            case '$':
                pos = scanDollar(pos);
                break;
            default:
                ++pos;
                break;
            }
        }
        return std::move(_out);
    }

private:
    bool atLineStart(size_t pos) const { return pos == 0 || _doc[pos - 1] == '\n'; }

    size_t lineEnd(size_t pos) const {
        size_t end = _doc.find('\n', pos);
        return end == std::string_view::npos ? _doc.size() : end;
    }

    // True if the line after the newline at `newline` is blank (or absent).
    bool blankLineFollows(size_t newline) const {
        size_t j = newline + 1;
        while (j < _doc.size() && (_doc[j] == ' ' || _doc[j] == '\t' || _doc[j] == '\r')) ++j;
        return j >= _doc.size() || _doc[j] == '\n';
    }

    void anomaly(size_t offset, SpanKind kind, std::string message) {
        DocumentDiagnostic d;
        d.spanKind = kind;
        d.documentPosition = _lines.position(offset);
        d.diagnostic = Diagnostic::warning(DiagnosticKind::ExtractionAnomaly, std::move(message));
        _out.anomalies.push_back(std::move(d));
    }

    void emit(SpanKind kind, size_t start, size_t end, size_t contentStart, size_t contentEnd) {
        Span span;
        span.kind = kind;
        span.range = ByteRange{start, end};
        span.rawContent = std::string(_doc.substr(contentStart, contentEnd - contentStart));
        _out.spans.push_back(std::move(span));
    }

    //-------------------------------------------------------------------------
    // Fenced code
    //-------------------------------------------------------------------------

    std::optional<Fence> openingFence(size_t lineStart) const {
        size_t i = lineStart;
        size_t indent = 0;
        while (i < _doc.size() && _doc[i] == ' ' && indent < 4) {
            ++i;
            ++indent;
        }
        if (indent > 3 || i >= _doc.size()) return std::nullopt;

        char ch = _doc[i];
        if (ch != '`' && ch != '~') return std::nullopt;

        size_t runStart = i;
        while (i < _doc.size() && _doc[i] == ch) ++i;
        size_t length = i - runStart;
        if (length < 3) return std::nullopt;

        size_t end = lineEnd(i);
        std::string_view info = trim(_doc.substr(i, end - i));
        if (ch == '`' && info.find('`') != std::string_view::npos) return std::nullopt;

        return Fence{ch, length, info, end};
    }

    bool closesFence(size_t lineStart, const Fence& fence) const {
        size_t i = lineStart;
        size_t indent = 0;
        while (i < _doc.size() && _doc[i] == ' ' && indent < 4) {
            ++i;
            ++indent;
        }
        if (indent > 3) return false;

        size_t runStart = i;
        while (i < _doc.size() && _doc[i] == fence.ch) ++i;
        if (i - runStart < fence.length) return false;

        size_t end = lineEnd(i);
        return trim(_doc.substr(i, end - i)).empty();
    }

    size_t scanFence(size_t lineStart, const Fence& fence) {
        const size_t n = _doc.size();
        const bool tagged = firstWord(fence.info) == _codeTag;
        const size_t bodyStart = fence.lineEnd < n ? fence.lineEnd + 1 : n;

        for (size_t j = bodyStart; j < n;) {
            size_t end = lineEnd(j);
            if (closesFence(j, fence)) {
                if (tagged) {
                    emit(SpanKind::TaggedBlock, lineStart, end, bodyStart, j);
                }
                return end;
            }
            j = end < n ? end + 1 : n;
        }

        // CommonMark: an unclosed fence runs to the end of the document
        if (tagged) {
            anomaly(lineStart, SpanKind::TaggedBlock,
                    "unterminated ```" + _codeTag + " block, left as text");
        }
        return n;
    }

    //-------------------------------------------------------------------------
    // Inline constructs
    //-------------------------------------------------------------------------

    size_t skipCodeSpan(size_t pos) const {
        const size_t n = _doc.size();
        size_t i = pos;
        while (i < n && _doc[i] == '`') ++i;
        const size_t run = i - pos;

        while (i < n) {
            char c = _doc[i];
            if (c == '\n' && blankLineFollows(i)) break;
            if (c != '`') {
                ++i;
                continue;
            }
            size_t closeStart = i;
            while (i < n && _doc[i] == '`') ++i;
            if (i - closeStart == run) return i;
        }
        // no matching run: the backticks are literal
        return pos + run;
    }

    // Skip a container produced by an earlier run, nested tags included.
    std::optional<size_t> skipContainer(size_t pos, std::string_view tag) const {
        const std::string open = "<" + std::string(tag);
        const std::string close = "</" + std::string(tag) + ">";
        int depth = 0;
        size_t i = pos;
        while (i < _doc.size()) {
            size_t lt = _doc.find('<', i);
            if (lt == std::string_view::npos) break;
            if (_doc.compare(lt, close.size(), close) == 0) {
                if (--depth == 0) return lt + close.size();
                i = lt + close.size();
                continue;
            }
            if (_doc.compare(lt, open.size(), open) == 0) {
                size_t after = lt + open.size();
                if (after < _doc.size() && (_doc[after] == ' ' || _doc[after] == '>')) {
                    ++depth;
                }
            }
            i = lt + 1;
        }
        return std::nullopt;
    }

    size_t skipHtml(size_t pos) const {
        if (_doc.compare(pos, CONTAINER_SPAN.size(), CONTAINER_SPAN) == 0) {
            if (auto end = skipContainer(pos, "span")) return *end;
        } else if (_doc.compare(pos, CONTAINER_DIV.size(), CONTAINER_DIV) == 0) {
            if (auto end = skipContainer(pos, "div")) return *end;
        }

        if (_doc.compare(pos, 4, "<!--") == 0) {
            size_t end = _doc.find("-->", pos + 4);
            return end == std::string_view::npos ? pos + 1 : end + 3;
        }

        if (auto end = htmlTagEnd(pos)) return *end;
        return pos + 1;
    }

    // Whitespace inside a tag, which may span lines but not a blank line.
    size_t skipTagSpace(size_t i) const {
        while (i < _doc.size() && isSpace(_doc[i])) {
            if (_doc[i] == '\n' && blankLineFollows(i)) break;
            ++i;
        }
        return i;
    }

    // End of a CommonMark open tag `<name attr="v" ...>` or closing tag
    // `</name>` starting at `pos`; nullopt when the text is not a tag.
    std::optional<size_t> htmlTagEnd(size_t pos) const {
        const size_t n = _doc.size();
        auto isNameChar = [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
        };
        auto isAttrStart = [](char c) {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == ':';
        };
        auto isAttrChar = [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '.' || c == '-';
        };

        size_t i = pos + 1;
        const bool closing = i < n && _doc[i] == '/';
        if (closing) ++i;
        if (i >= n || !std::isalpha(static_cast<unsigned char>(_doc[i]))) return std::nullopt;
        while (i < n && isNameChar(_doc[i])) ++i;

        if (closing) {
            i = skipTagSpace(i);
            if (i < n && _doc[i] == '>') return i + 1;
            return std::nullopt;
        }

        while (i < n) {
            size_t afterSpace = skipTagSpace(i);
            if (afterSpace >= n) return std::nullopt;
            if (_doc[afterSpace] == '>') return afterSpace + 1;
            if (_doc[afterSpace] == '/') {
                if (afterSpace + 1 < n && _doc[afterSpace + 1] == '>') return afterSpace + 2;
                return std::nullopt;
            }
            // attributes are separated from the name and each other by whitespace
            if (afterSpace == i || !isAttrStart(_doc[afterSpace])) return std::nullopt;

            i = afterSpace;
            while (i < n && isAttrChar(_doc[i])) ++i;

            size_t eq = skipTagSpace(i);
            if (eq >= n || _doc[eq] != '=') continue;
            size_t v = skipTagSpace(eq + 1);
            if (v >= n) return std::nullopt;
            if (_doc[v] == '"' || _doc[v] == '\'') {
                size_t close = _doc.find(_doc[v], v + 1);
                if (close == std::string_view::npos) return std::nullopt;
                i = close + 1;
            } else {
                size_t start = v;
                while (v < n && !isSpace(_doc[v]) && std::string_view("\"'=<>`").find(_doc[v]) == std::string_view::npos) {
                    ++v;
                }
                if (v == start) return std::nullopt;
                i = v;
            }
        }
        return std::nullopt;
    }

    //-------------------------------------------------------------------------
    // Math
    //-------------------------------------------------------------------------

    // Position of the closing delimiter, or nullopt at a blank line / EOF.
    std::optional<size_t> findMathClose(size_t from, bool display) const {
        const size_t n = _doc.size();
        std::vector<char> brackets;

        for (size_t i = from; i < n;) {
            char c = _doc[i];

            if (c == '\\') {
                i += 2;
                continue;
            }
            if (c == '\n' && blankLineFollows(i)) {
                return std::nullopt;
            }
            if (c == '#' && i + 1 < n && isOpenBracket(_doc[i + 1])) {
                brackets.push_back(closerFor(_doc[i + 1]));
                i += 2;
                continue;
            }
            if (!brackets.empty()) {
                if (isOpenBracket(c)) {
                    brackets.push_back(closerFor(c));
                } else if (c == ']' || c == ')' || c == '}') {
                    // unwind to the matching opener, tolerating stray closers
                    for (size_t k = brackets.size(); k > 0; --k) {
                        if (brackets[k - 1] == c) {
                            brackets.resize(k - 1);
                            break;
                        }
                    }
                }
                ++i;
                continue;
            }
            if (c == '{') {
                brackets.push_back('}');
                ++i;
                continue;
            }
            if (c == '$') {
                if (display) {
                    if (i + 1 < n && _doc[i + 1] == '$') return i;
                } else {
                    bool afterSpace = i == from || isSpace(_doc[i - 1]);
                    bool beforeDigit = i + 1 < n && std::isdigit(static_cast<unsigned char>(_doc[i + 1]));
                    if (!afterSpace && !beforeDigit) return i;
                }
            }
            ++i;
        }
        return std::nullopt;
    }

    size_t scanDollar(size_t pos) {
        const size_t n = _doc.size();

        if (pos + 1 < n && _doc[pos + 1] == '$') {
            const size_t contentStart = pos + 2;
            if (auto close = findMathClose(contentStart, true)) {
                emit(SpanKind::Display, pos, *close + 2, contentStart, *close);
                return *close + 2;
            }
            anomaly(pos, SpanKind::Display, "unterminated $$ display math, left as text");
            return pos + 2;
        }

        const size_t contentStart = pos + 1;
        if (contentStart >= n || isSpace(_doc[contentStart])) return pos + 1;

        if (auto close = findMathClose(contentStart, false)) {
            emit(SpanKind::Inline, pos, *close + 1, contentStart, *close);
            return *close + 1;
        }
        ydebug("BlockExtractor: lone $ at offset {} treated as text", pos);
        return pos + 1;
    }

    std::string_view _doc;
    const std::string& _codeTag;
    LineIndex _lines;
    Extraction _out;
};

} // namespace

//=============================================================================
// BlockExtractor
//=============================================================================

BlockExtractor::BlockExtractor(std::string codeTag) : _codeTag(std::move(codeTag)) {}

Extraction BlockExtractor::extract(std::string_view document) const {
    Scanner scanner(document, _codeTag);
    return scanner.run();
}

} // namespace mdtypst
