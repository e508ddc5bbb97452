#include <mdtypst/diagnostic.h>
#include <algorithm>

namespace mdtypst {

const char* severityName(Severity severity) {
    switch (severity) {
    case Severity::Warning: return "warning";
    case Severity::Error:   return "error";
    }
    return "unknown";
}

const char* diagnosticKindName(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::ExtractionAnomaly:  return "extraction-anomaly";
    case DiagnosticKind::CompilerDiagnostic: return "compiler";
    case DiagnosticKind::PackageUnavailable: return "package-unavailable";
    case DiagnosticKind::FontResolutionMiss: return "font-miss";
    case DiagnosticKind::CompilerFailure:    return "compiler-failure";
    }
    return "unknown";
}

std::string Diagnostic::format() const {
    std::string out = severityName(severity);
    out += '[';
    out += diagnosticKindName(kind);
    out += ']';
    if (position) {
        out += ' ';
        out += std::to_string(position->line);
        out += ':';
        out += std::to_string(position->column);
    }
    out += ": ";
    out += message;
    for (const auto& hint : hints) {
        out += " (hint: ";
        out += hint;
        out += ')';
    }
    return out;
}

Diagnostic Diagnostic::warning(DiagnosticKind kind, std::string message) {
    Diagnostic d;
    d.severity = Severity::Warning;
    d.kind = kind;
    d.message = std::move(message);
    return d;
}

Diagnostic Diagnostic::error(DiagnosticKind kind, std::string message) {
    Diagnostic d;
    d.severity = Severity::Error;
    d.kind = kind;
    d.message = std::move(message);
    return d;
}

std::string DocumentDiagnostic::format() const {
    std::string out;
    if (!documentName.empty()) {
        out += documentName;
        out += ':';
    }
    out += std::to_string(documentPosition.line);
    out += ':';
    out += std::to_string(documentPosition.column);
    if (spanKind) {
        out += " (";
        out += spanKindName(*spanKind);
        out += ')';
    }
    out += ": ";
    out += diagnostic.format();
    return out;
}

//=============================================================================
// LineIndex
//=============================================================================

LineIndex::LineIndex(std::string_view text) : _size(text.size()) {
    _lineStarts.push_back(0);
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') _lineStarts.push_back(i + 1);
    }
}

SourcePosition LineIndex::position(size_t offset) const {
    offset = std::min(offset, _size);
    auto it = std::upper_bound(_lineStarts.begin(), _lineStarts.end(), offset);
    size_t line = static_cast<size_t>(it - _lineStarts.begin());
    return SourcePosition{line, offset - _lineStarts[line - 1] + 1};
}

} // namespace mdtypst
