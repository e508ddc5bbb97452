#pragma once

#include <mdtypst/span.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdtypst {

enum class Severity : uint8_t { Warning, Error };

enum class DiagnosticKind : uint8_t {
    ExtractionAnomaly,   // unterminated span, degraded to plain text
    CompilerDiagnostic,  // reported by the typesetting compiler
    PackageUnavailable,  // cache dir unset, network or archive failure
    FontResolutionMiss,  // requested family not found, compiler falls back
    CompilerFailure      // compiler could not run or produced nothing
};

const char* severityName(Severity severity);
const char* diagnosticKindName(DiagnosticKind kind);

// 1-based line and column
struct SourcePosition {
    size_t line = 0;
    size_t column = 0;
};

struct Diagnostic {
    Severity severity = Severity::Error;
    DiagnosticKind kind = DiagnosticKind::CompilerDiagnostic;
    std::string message;
    std::optional<SourcePosition> position;
    std::vector<std::string> hints;

    bool isError() const { return severity == Severity::Error; }

    // "error[package-unavailable] 3:7: message (hint: ...)"
    std::string format() const;

    static Diagnostic warning(DiagnosticKind kind, std::string message);
    static Diagnostic error(DiagnosticKind kind, std::string message);
};

// A diagnostic located in a document being processed.
struct DocumentDiagnostic {
    std::string documentName;
    std::optional<SpanKind> spanKind;
    SourcePosition documentPosition;
    Diagnostic diagnostic;

    std::string format() const;
};

using DiagnosticHandler = std::function<void(const DocumentDiagnostic&)>;

/**
 * Maps byte offsets of a text to line/column positions.
 * Columns count bytes, like the compiler's own diagnostics.
 */
class LineIndex {
public:
    explicit LineIndex(std::string_view text);

    SourcePosition position(size_t offset) const;
    size_t lineCount() const { return _lineStarts.size(); }

private:
    std::vector<size_t> _lineStarts;
    size_t _size = 0;
};

} // namespace mdtypst
