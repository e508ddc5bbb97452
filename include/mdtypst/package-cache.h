#pragma once

#include <mdtypst/memo.h>
#include <mdtypst/package-fetcher.h>
#include <mdtypst/package-key.h>
#include <mdtypst/result.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace mdtypst {

/**
 * @brief Local store of package trees, laid out as cacheDir/ns/name/version.
 *
 * resolve() returns the directory of a fully extracted package, downloading
 * it on first use. Population is serialized per key inside the process and
 * published with a rename, so no reader ever sees a partial tree. Results
 * (including failures) are kept for the lifetime of the cache object.
 */
class PackageCache {
public:
    using Ptr = std::shared_ptr<PackageCache>;

    static Result<Ptr> create(std::optional<std::filesystem::path> cacheDir,
                              PackageFetcher::Ptr fetcher) noexcept;

    ~PackageCache() = default;

    PackageCache(const PackageCache&) = delete;
    PackageCache& operator=(const PackageCache&) = delete;

    Result<std::filesystem::path> resolve(const PackageKey& key);

    const std::optional<std::filesystem::path>& cacheDir() const { return _cacheDir; }

    // Number of archives downloaded by this instance
    size_t downloads() const noexcept { return _downloads.load(); }

private:
    PackageCache(std::optional<std::filesystem::path> cacheDir, PackageFetcher::Ptr fetcher) noexcept;
    Result<void> init() noexcept;

    Result<std::filesystem::path> populate(const PackageKey& key);

    std::optional<std::filesystem::path> _cacheDir;
    PackageFetcher::Ptr _fetcher;
    Memo<PackageKey, Result<std::filesystem::path>, PackageKeyHash> _entries;
    std::atomic<size_t> _downloads{0};
    std::atomic<uint64_t> _tempCounter{0};
};

} // namespace mdtypst
