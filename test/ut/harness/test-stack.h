#pragma once

//=============================================================================
// TestStack - renderer wired to a FakeCompiler and a CountingFetcher
//
// System fonts are disabled so tests do not depend on the machine.
//=============================================================================

#include "counting-fetcher.h"
#include "fake-compiler.h"
#include <mdtypst/compilation-environment.h>
#include <mdtypst/font-book.h>
#include <mdtypst/package-cache.h>
#include <mdtypst/renderer.h>
#include <filesystem>
#include <memory>
#include <optional>

namespace mdtypst::test {

struct TestStack {
    Config config;
    std::shared_ptr<CountingFetcher> fetcher;
    std::shared_ptr<FakeCompiler> compiler;
    PackageCache::Ptr cache;
    CompilationEnvironment::Ptr env;
    Renderer::Ptr renderer;

    bool ok() const { return renderer != nullptr; }
};

inline Config testConfig() {
    Config config;
    config.systemFonts = false;
    config.workers = 4;
    return config;
}

inline TestStack makeStack(Config config, std::optional<std::filesystem::path> cacheDir,
                           std::shared_ptr<FakeCompiler> compiler = nullptr) {
    TestStack stack;
    config.cacheDir = cacheDir;
    stack.config = config;
    stack.fetcher = std::make_shared<CountingFetcher>();
    stack.compiler = compiler ? compiler : std::make_shared<FakeCompiler>();

    auto fonts = FontBook::create(config);
    if (!fonts) return stack;
    auto cache = PackageCache::create(cacheDir, stack.fetcher);
    if (!cache) return stack;
    stack.cache = *cache;
    auto env = CompilationEnvironment::create(config, *fonts, stack.cache);
    if (!env) return stack;
    stack.env = *env;
    auto renderer = Renderer::create(stack.compiler, stack.env);
    if (!renderer) return stack;
    stack.renderer = *renderer;
    return stack;
}

} // namespace mdtypst::test
