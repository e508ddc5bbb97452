#include <mdtypst/compilation-environment.h>
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <sstream>

namespace mdtypst {

CompilationEnvironment::CompilationEnvironment(Config config, FontBook::Ptr fonts,
                                               PackageCache::Ptr packages) noexcept
    : _config(std::move(config)),
      _fonts(std::move(fonts)),
      _packages(std::move(packages)),
      _now(Clock::now()) {}

Result<CompilationEnvironment::Ptr> CompilationEnvironment::create(const Config& config,
                                                                   FontBook::Ptr fonts,
                                                                   PackageCache::Ptr packages) noexcept {
    if (!fonts) {
        return Err<Ptr>("CompilationEnvironment requires a FontBook");
    }
    if (!packages) {
        return Err<Ptr>("CompilationEnvironment requires a PackageCache");
    }
    return Ok(Ptr(new CompilationEnvironment(config, std::move(fonts), std::move(packages))));
}

Result<FontFace> CompilationEnvironment::font(const std::string& family) {
    auto face = _fonts->find(family);
    if (!face) {
        return Err<FontFace>("unknown font family \"" + family + "\"");
    }
    return Ok(std::move(*face));
}

Result<std::filesystem::path> CompilationEnvironment::packageRoot(const PackageKey& key) {
    return _packages->resolve(key);
}

Result<CompilationEnvironment::FileBytes> CompilationEnvironment::file(const PackagePath& path) {
    return _files.getOrLoad(path, [&] { return readPackageFile(path); });
}

Result<CompilationEnvironment::FileBytes> CompilationEnvironment::readPackageFile(const PackagePath& path) {
    const std::string where = path.package.toString() + "/" + path.path;

    std::filesystem::path rel(path.path);
    if (rel.is_absolute()) {
        return Err<FileBytes>("absolute path in package: " + where);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return Err<FileBytes>("path escapes its package: " + where);
        }
    }

    auto root = packageRoot(path.package);
    if (!root) {
        return Err<FileBytes>("cannot read " + where, root);
    }

    std::ifstream in(*root / rel, std::ios::binary);
    if (!in.is_open()) {
        return Err<FileBytes>("file not found: " + where);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    ydebug("CompilationEnvironment: loaded {}", where);
    return Ok(std::make_shared<const std::string>(ss.str()));
}

} // namespace mdtypst
