#include <mdtypst/package-key.h>
#include <algorithm>
#include <cctype>
#include <regex>

namespace mdtypst {

static bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

static bool isIdent(std::string_view s) {
    return !s.empty() && std::isalpha(static_cast<unsigned char>(s.front())) &&
           std::all_of(s.begin(), s.end(), isIdentChar);
}

// major.minor.patch, each a decimal number
static bool isVersion(std::string_view s) {
    int parts = 0;
    size_t i = 0;
    while (i <= s.size()) {
        size_t dot = s.find('.', i);
        if (dot == std::string_view::npos) dot = s.size();
        std::string_view part = s.substr(i, dot - i);
        if (part.empty() || part.size() > 9 ||
            !std::all_of(part.begin(), part.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return false;
        }
        ++parts;
        i = dot + 1;
    }
    return parts == 3;
}

Result<PackageKey> PackageKey::parse(std::string_view reference) {
    std::string text(reference);
    if (reference.empty() || reference.front() != '@') {
        return Err<PackageKey>("package reference must start with @: " + text);
    }
    reference.remove_prefix(1);

    size_t slash = reference.find('/');
    if (slash == std::string_view::npos) {
        return Err<PackageKey>("package reference is missing a namespace: " + text);
    }
    size_t colon = reference.find(':', slash);
    if (colon == std::string_view::npos) {
        return Err<PackageKey>("package reference is missing a version: " + text);
    }

    PackageKey key;
    key.ns = std::string(reference.substr(0, slash));
    key.name = std::string(reference.substr(slash + 1, colon - slash - 1));
    key.version = std::string(reference.substr(colon + 1));

    if (!isIdent(key.ns)) return Err<PackageKey>("invalid package namespace: " + text);
    if (!isIdent(key.name)) return Err<PackageKey>("invalid package name: " + text);
    if (!isVersion(key.version)) return Err<PackageKey>("invalid package version: " + text);
    return Ok(std::move(key));
}

std::string PackageKey::toString() const {
    return "@" + ns + "/" + name + ":" + version;
}

std::filesystem::path PackageKey::subdir() const {
    return std::filesystem::path(ns) / name / version;
}

std::vector<PackageKey> findPackageReferences(std::string_view source) {
    static const std::regex pattern(R"re("(@[A-Za-z][A-Za-z0-9_-]*/[A-Za-z][A-Za-z0-9_-]*:[0-9.]+)")re");

    std::vector<PackageKey> keys;
    auto begin = std::cregex_iterator(source.data(), source.data() + source.size(), pattern);
    for (auto it = begin; it != std::cregex_iterator(); ++it) {
        auto key = PackageKey::parse((*it)[1].str());
        if (!key) continue;
        if (std::find(keys.begin(), keys.end(), *key) == keys.end()) {
            keys.push_back(std::move(*key));
        }
    }
    return keys;
}

} // namespace mdtypst
