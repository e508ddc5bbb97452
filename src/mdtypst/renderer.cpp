#include <mdtypst/renderer.h>
#include <mdtypst/font-book.h>
#include <mdtypst/package-cache.h>
#include <mdtypst/package-fetcher.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace mdtypst {

std::string RenderResult::errorMessage() const {
    for (const auto& d : diagnostics) {
        if (d.isError()) return d.message;
    }
    return {};
}

Result<Renderer::Ptr> Renderer::create(const Config& config) noexcept {
    auto fonts = FontBook::create(config);
    if (!fonts) return Err<Ptr>("Failed to create font book", fonts);

    PackageFetcher::Ptr fetcher;
    if (!config.registry.empty()) {
        auto res = PackageFetcher::create(config.registry);
        if (!res) return Err<Ptr>("Failed to create package fetcher", res);
        fetcher = *res;
    }

    auto packages = PackageCache::create(config.cacheDir, fetcher);
    if (!packages) return Err<Ptr>("Failed to create package cache", packages);

    auto env = CompilationEnvironment::create(config, *fonts, *packages);
    if (!env) return Err<Ptr>("Failed to create compilation environment", env);

    auto compiler = Compiler::create(config);
    if (!compiler) return Err<Ptr>("Failed to create compiler", compiler);

    return create(*compiler, *env);
}

Result<Renderer::Ptr> Renderer::create(Compiler::Ptr compiler, CompilationEnvironment::Ptr env) noexcept {
    if (!compiler || !env) {
        return Err<Ptr>("Renderer requires a compiler and an environment");
    }
    return Ok(Ptr(new Renderer(std::move(compiler), std::move(env))));
}

RenderResult Renderer::render(const BuiltDocument& doc) {
    if (doc.empty) {
        return RenderResult{std::string(), {}};
    }
    // kind decides how diagnostic positions are rebased
    std::string key = std::string(spanKindName(doc.kind)) + '\0' + doc.sourceText;
    return _renders.getOrLoad(key, [&] { return compile(doc); });
}

RenderResult Renderer::compile(const BuiltDocument& doc) {
    _compilations++;
    World world(*_env, doc);

    RenderResult result;
    auto output = _compiler->compile(world);
    if (!output) {
        result.diagnostics.push_back(Diagnostic::error(DiagnosticKind::CompilerFailure, error_msg(output)));
        return result;
    }

    result.diagnostics = std::move(output->diagnostics);
    bool failed = std::any_of(result.diagnostics.begin(), result.diagnostics.end(),
                              [](const Diagnostic& d) { return d.isError(); });
    if (failed) return result;

    if (!output->svg) {
        result.diagnostics.push_back(
            Diagnostic::error(DiagnosticKind::CompilerFailure, "compiler returned no output"));
        return result;
    }
    result.svg = std::move(output->svg);
    return result;
}

} // namespace mdtypst
