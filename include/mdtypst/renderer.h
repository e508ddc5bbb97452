#pragma once

#include <mdtypst/compilation-environment.h>
#include <mdtypst/compiler.h>
#include <mdtypst/config.h>
#include <mdtypst/diagnostic.h>
#include <mdtypst/document-builder.h>
#include <mdtypst/memo.h>
#include <mdtypst/result.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mdtypst {

struct RenderResult {
    std::optional<std::string> svg;
    std::vector<Diagnostic> diagnostics;

    bool ok() const { return svg.has_value(); }

    // Message of the first error diagnostic, empty when there is none
    std::string errorMessage() const;
};

/**
 * Renderer - built document to SVG through a Compiler
 *
 * Byte-identical documents are compiled once per run; later requests get the
 * stored result, diagnostics included. Any error diagnostic means no SVG.
 */
class Renderer {
public:
    using Ptr = std::shared_ptr<Renderer>;

    // Full stack from configuration: fonts, package cache, typst CLI.
    static Result<Ptr> create(const Config& config) noexcept;

    static Result<Ptr> create(Compiler::Ptr compiler, CompilationEnvironment::Ptr env) noexcept;

    ~Renderer() = default;

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    RenderResult render(const BuiltDocument& doc);

    // Number of times the compiler actually ran
    size_t compilations() const noexcept { return _compilations.load(); }

    const CompilationEnvironment::Ptr& environment() const { return _env; }

private:
    Renderer(Compiler::Ptr compiler, CompilationEnvironment::Ptr env) noexcept
        : _compiler(std::move(compiler)), _env(std::move(env)) {}

    RenderResult compile(const BuiltDocument& doc);

    Compiler::Ptr _compiler;
    CompilationEnvironment::Ptr _env;
    Memo<std::string, RenderResult> _renders;
    std::atomic<size_t> _compilations{0};
};

} // namespace mdtypst
