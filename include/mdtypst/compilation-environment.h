#pragma once

#include <mdtypst/config.h>
#include <mdtypst/document-builder.h>
#include <mdtypst/font-book.h>
#include <mdtypst/memo.h>
#include <mdtypst/package-cache.h>
#include <mdtypst/package-key.h>
#include <mdtypst/result.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace mdtypst {

/**
 * @brief Everything the compiler may ask for while typesetting, shared by all
 * spans of one run.
 *
 * Fonts come from the FontBook, package files from the PackageCache. File
 * reads are memoized per (package, path). now() is fixed when the environment
 * is created so every span sees the same date.
 */
class CompilationEnvironment {
public:
    using Ptr = std::shared_ptr<CompilationEnvironment>;
    using Clock = std::chrono::system_clock;
    using FileBytes = std::shared_ptr<const std::string>;

    static Result<Ptr> create(const Config& config, FontBook::Ptr fonts,
                              PackageCache::Ptr packages) noexcept;

    ~CompilationEnvironment() = default;

    CompilationEnvironment(const CompilationEnvironment&) = delete;
    CompilationEnvironment& operator=(const CompilationEnvironment&) = delete;

    Result<FontFace> font(const std::string& family);
    Result<FileBytes> file(const PackagePath& path);
    Result<std::filesystem::path> packageRoot(const PackageKey& key);

    Clock::time_point now() const noexcept { return _now; }

    const Config& config() const { return _config; }
    const FontBook::Ptr& fontBook() const { return _fonts; }
    const PackageCache::Ptr& packageCache() const { return _packages; }

private:
    CompilationEnvironment(Config config, FontBook::Ptr fonts, PackageCache::Ptr packages) noexcept;

    Result<FileBytes> readPackageFile(const PackagePath& path);

    Config _config;
    FontBook::Ptr _fonts;
    PackageCache::Ptr _packages;
    Clock::time_point _now;
    Memo<PackagePath, Result<FileBytes>, PackagePathHash> _files;
};

/**
 * @brief The compiler's view of one render: the environment plus the main
 * source of the built document.
 */
class World {
public:
    World(CompilationEnvironment& env, const BuiltDocument& doc) : _env(env), _doc(doc) {}

    const std::string& mainSource() const { return _doc.sourceText; }
    const BuiltDocument& document() const { return _doc; }

    Result<FontFace> font(const std::string& family) { return _env.font(family); }
    Result<CompilationEnvironment::FileBytes> file(const PackagePath& path) { return _env.file(path); }
    Result<std::filesystem::path> packageRoot(const PackageKey& key) { return _env.packageRoot(key); }

    CompilationEnvironment::Clock::time_point today() const { return _env.now(); }

    CompilationEnvironment& environment() { return _env; }

private:
    CompilationEnvironment& _env;
    const BuiltDocument& _doc;
};

} // namespace mdtypst
