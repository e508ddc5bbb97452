#pragma once

#include <mdtypst/block-extractor.h>
#include <mdtypst/config.h>
#include <mdtypst/diagnostic.h>
#include <mdtypst/renderer.h>
#include <mdtypst/result.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace mdtypst {

/**
 * Processor - one Markdown document in, the same document with rendered
 * spans out
 *
 * extract -> build -> render (worker pool) -> recolor -> assemble.
 * A span that fails keeps its source text (or an error container, see
 * FailurePolicy); the document itself always completes. Every diagnostic is
 * passed to the handler with the document name and position.
 */
class Processor {
public:
    using Ptr = std::shared_ptr<Processor>;

    static Result<Ptr> create(const Config& config, Renderer::Ptr renderer,
                              DiagnosticHandler handler = {}) noexcept;

    ~Processor() = default;

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    std::string process(std::string_view document, const std::string& documentName);

    const Config& config() const { return _config; }
    const Renderer::Ptr& renderer() const { return _renderer; }

    // Default handler: warnings and errors go to the log.
    static void logDiagnostic(const DocumentDiagnostic& diag);

private:
    Processor(const Config& config, Renderer::Ptr renderer, DiagnosticHandler handler) noexcept;

    RenderResult renderSpan(const Span& span);

    Config _config;
    Renderer::Ptr _renderer;
    DiagnosticHandler _handler;
    BlockExtractor _extractor;
};

} // namespace mdtypst
