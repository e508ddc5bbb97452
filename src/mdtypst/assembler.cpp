#include <mdtypst/assembler.h>

namespace mdtypst {

Result<std::string> assemble(std::string_view original, const std::vector<Replacement>& replacements) {
    size_t total = original.size();
    size_t cursor = 0;
    for (const auto& r : replacements) {
        if (r.range.start > r.range.end || r.range.end > original.size()) {
            return Err<std::string>("replacement [" + std::to_string(r.range.start) + ", " +
                                    std::to_string(r.range.end) + ") is outside the document");
        }
        if (r.range.start < cursor) {
            return Err<std::string>("replacement at " + std::to_string(r.range.start) +
                                    " overlaps or precedes the previous one");
        }
        cursor = r.range.end;
        total += r.markup.size();
        total -= r.range.size();
    }

    std::string out;
    out.reserve(total);
    cursor = 0;
    for (const auto& r : replacements) {
        out.append(original.substr(cursor, r.range.start - cursor));
        out.append(r.markup);
        cursor = r.range.end;
    }
    out.append(original.substr(cursor));
    return Ok(std::move(out));
}

std::string wrapMarkup(SpanKind kind, std::string_view svg) {
    std::string out;
    switch (kind) {
    case SpanKind::Inline:
        out.reserve(svg.size() + 40);
        out += "<span class=\"typst-inline\">";
        out += svg;
        out += "</span>";
        break;
    case SpanKind::Display:
    case SpanKind::TaggedBlock:
        out.reserve(svg.size() + 40);
        out += "<div class=\"typst-display\">";
        out += svg;
        out += "</div>";
        break;
    }
    return out;
}

std::string errorMarkup(std::string_view raw, std::string_view message) {
    return "<span class=\"typst-error\" title=\"" + htmlEscape(message) + "\">" + htmlEscape(raw) + "</span>";
}

std::string htmlEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out += c;
        }
    }
    return out;
}

} // namespace mdtypst
