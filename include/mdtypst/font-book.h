#pragma once

#include <mdtypst/config.h>
#include <mdtypst/memo.h>
#include <mdtypst/result.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mdtypst {

enum class FontSource : uint8_t {
    Configured,  // fonts listed in the configuration
    Embedded,    // fonts compiled into the typesetting compiler
    System       // discovered through fontconfig
};

const char* fontSourceName(FontSource source);

struct FontFace {
    std::string family;
    std::string style;
    std::filesystem::path path;  // empty for embedded faces
    int index = 0;               // face index inside collections
    FontSource source = FontSource::System;
};

/**
 * @brief Every face available to the compiler, in resolution order.
 *
 * Order: configured font files/directories, then the compiler's embedded
 * fonts (when enabled), then system fonts. find() returns the first face whose
 * family matches (case-insensitive) and memoizes the answer.
 */
class FontBook {
public:
    using Ptr = std::shared_ptr<FontBook>;

    static Result<Ptr> create(const Config& config) noexcept;

    ~FontBook() = default;

    FontBook(const FontBook&) = delete;
    FontBook& operator=(const FontBook&) = delete;

    std::optional<FontFace> find(const std::string& family);

    const std::vector<FontFace>& faces() const { return _faces; }

    // Directories to hand to the compiler for configured fonts.
    const std::vector<std::filesystem::path>& fontPaths() const { return _fontPaths; }

    // Families the compiler ships with.
    static const std::vector<std::string>& embeddedFamilies();

private:
    FontBook() = default;
    Result<void> init(const Config& config) noexcept;

    Result<void> loadConfigured(const std::vector<std::string>& paths);
    void loadEmbedded();
    Result<void> loadSystem();

    std::vector<FontFace> _faces;
    std::vector<std::filesystem::path> _fontPaths;
    Memo<std::string, std::optional<FontFace>> _lookups;
};

} // namespace mdtypst
