#pragma once

#include <mdtypst/package-key.h>
#include <mdtypst/result.hpp>
#include <memory>
#include <string>

namespace mdtypst {

//=============================================================================
// PackageFetcher - downloads package archives from the registry
//
// The registry serves {registry}/{namespace}/{name}-{version}.tar.gz.
// The default implementation uses cpr (libcurl); tests substitute their own.
//=============================================================================
class PackageFetcher {
public:
    using Ptr = std::shared_ptr<PackageFetcher>;

    // HTTP(S) fetcher against the given registry base URL
    static Result<Ptr> create(const std::string& registry);

    virtual ~PackageFetcher() = default;

    // Raw (still compressed) archive bytes
    virtual Result<std::string> fetch(const PackageKey& key) = 0;

    virtual std::string archiveUrl(const PackageKey& key) const = 0;

protected:
    PackageFetcher() = default;
};

} // namespace mdtypst
