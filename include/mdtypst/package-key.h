#pragma once

#include <mdtypst/result.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mdtypst {

/**
 * @brief Identifies one immutable package version, "@namespace/name:version".
 */
struct PackageKey {
    std::string ns;
    std::string name;
    std::string version;  // major.minor.patch

    static Result<PackageKey> parse(std::string_view reference);

    // "@namespace/name:version"
    std::string toString() const;

    // namespace/name/version, the cache layout shared with the compiler
    std::filesystem::path subdir() const;

    bool operator==(const PackageKey& other) const {
        return ns == other.ns && name == other.name && version == other.version;
    }
    bool operator!=(const PackageKey& other) const { return !(*this == other); }
};

struct PackageKeyHash {
    size_t operator()(const PackageKey& key) const {
        size_t h = 0;
        h ^= std::hash<std::string>{}(key.ns);
        h ^= std::hash<std::string>{}(key.name) << 1;
        h ^= std::hash<std::string>{}(key.version) << 2;
        return h;
    }
};

/**
 * @brief A file inside a package, e.g. {@preview/cetz:0.2.2, "src/lib.typ"}.
 */
struct PackagePath {
    PackageKey package;
    std::string path;  // relative to the package root, '/'-separated

    bool operator==(const PackagePath& other) const {
        return package == other.package && path == other.path;
    }
};

struct PackagePathHash {
    size_t operator()(const PackagePath& p) const {
        return PackageKeyHash{}(p.package) ^ (std::hash<std::string>{}(p.path) << 3);
    }
};

// Every distinct "@ns/name:version" string literal in Typst source, in order.
std::vector<PackageKey> findPackageReferences(std::string_view source);

} // namespace mdtypst
