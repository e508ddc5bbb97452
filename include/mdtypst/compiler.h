#pragma once

#include <mdtypst/compilation-environment.h>
#include <mdtypst/config.h>
#include <mdtypst/diagnostic.h>
#include <mdtypst/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdtypst {

struct CompileOutput {
    std::optional<std::string> svg;  // absent when compilation failed
    std::vector<Diagnostic> diagnostics;
};

/**
 * Compiler - turns the main source of a World into SVG
 *
 * Every resolution the compiler needs (packages, fonts, date) goes through
 * the World. An Err result means the compiler could not be run at all;
 * problems with the source itself are error diagnostics in CompileOutput.
 */
class Compiler {
public:
    using Ptr = std::shared_ptr<Compiler>;

    // Compiler driving the `typst` command line tool named by config.compiler.
    static Result<Ptr> create(const Config& config) noexcept;

    virtual ~Compiler() = default;

    virtual Result<CompileOutput> compile(World& world) = 0;

protected:
    Compiler() = default;
};

/**
 * Parse diagnostics printed with `--diagnostic-format short`.
 *
 * Lines of the main source up to `preambleLines` belong to the preamble and
 * are reported without a position; later lines are rebased so line 1 is the
 * first line of the span content. `kind` decides the column shift of the
 * "$ " math wrapper.
 */
std::vector<Diagnostic> parseCompilerOutput(std::string_view output, size_t preambleLines,
                                            SpanKind kind);

// Family names named by `font:` settings in Typst source, in order.
std::vector<std::string> findFontFamilies(std::string_view source);

} // namespace mdtypst
