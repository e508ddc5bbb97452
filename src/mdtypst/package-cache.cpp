#include <mdtypst/package-cache.h>
#include <mdtypst/archive.h>
#include <ytrace/ytrace.hpp>
#include <unistd.h>

namespace mdtypst {

PackageCache::PackageCache(std::optional<std::filesystem::path> cacheDir,
                           PackageFetcher::Ptr fetcher) noexcept
    : _cacheDir(std::move(cacheDir)), _fetcher(std::move(fetcher)) {}

Result<void> PackageCache::init() noexcept {
    if (!_cacheDir) {
        ydebug("PackageCache: no cache directory, package imports will fail");
        return Ok();
    }
    std::error_code ec;
    std::filesystem::create_directories(*_cacheDir, ec);
    if (ec) {
        return Err<void>("cannot create package cache " + _cacheDir->string() + ": " + ec.message());
    }
    yinfo("PackageCache: using {}", _cacheDir->string());
    return Ok();
}

Result<PackageCache::Ptr> PackageCache::create(std::optional<std::filesystem::path> cacheDir,
                                               PackageFetcher::Ptr fetcher) noexcept {
    auto impl = Ptr(new PackageCache(std::move(cacheDir), std::move(fetcher)));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize PackageCache", res);
    }
    return Ok(std::move(impl));
}

Result<std::filesystem::path> PackageCache::resolve(const PackageKey& key) {
    return _entries.getOrLoad(key, [&] { return populate(key); });
}

Result<std::filesystem::path> PackageCache::populate(const PackageKey& key) {
    using Path = std::filesystem::path;

    if (!_cacheDir) {
        return Err<Path>("cannot use package " + key.toString() +
                         ": no package cache directory configured");
    }

    const Path finalDir = *_cacheDir / key.subdir();
    std::error_code ec;
    if (std::filesystem::is_directory(finalDir, ec)) {
        ydebug("PackageCache: {} found at {}", key.toString(), finalDir.string());
        return Ok(finalDir);
    }

    if (!_fetcher) {
        return Err<Path>("cannot download package " + key.toString() + ": no registry configured");
    }

    _downloads++;
    auto archive = _fetcher->fetch(key);
    if (!archive) {
        return Err<Path>("package " + key.toString() + " is unavailable", archive);
    }

    // Extract beside the final location, then publish with one rename
    const Path parent = finalDir.parent_path();
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return Err<Path>("cannot create " + parent.string() + ": " + ec.message());
    }
    const Path tempDir = parent / (".tmp-" + key.version + "-" + std::to_string(::getpid()) + "-" +
                                   std::to_string(_tempCounter++));
    std::filesystem::remove_all(tempDir, ec);
    std::filesystem::create_directories(tempDir, ec);
    if (ec) {
        return Err<Path>("cannot create " + tempDir.string() + ": " + ec.message());
    }

    if (auto res = extractTarGz(*archive, tempDir); !res) {
        std::filesystem::remove_all(tempDir, ec);
        return Err<Path>("failed to unpack package " + key.toString(), res);
    }

    std::filesystem::rename(tempDir, finalDir, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove_all(tempDir, ignored);
        // another process published the same version first
        if (std::filesystem::is_directory(finalDir, ignored)) {
            ydebug("PackageCache: {} was populated concurrently", key.toString());
            return Ok(finalDir);
        }
        return Err<Path>("cannot publish package " + key.toString() + ": " + ec.message());
    }

    yinfo("PackageCache: installed {} into {}", key.toString(), finalDir.string());
    return Ok(finalDir);
}

} // namespace mdtypst
