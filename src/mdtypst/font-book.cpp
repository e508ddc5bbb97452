#include <mdtypst/font-book.h>
#include <ytrace/ytrace.hpp>
#include <fontconfig/fontconfig.h>
#include <algorithm>
#include <cctype>

namespace mdtypst {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// One FontFace per family name a pattern declares
void collectFaces(FcFontSet* set, FontSource source, std::vector<FontFace>& out) {
    if (!set) return;
    for (int i = 0; i < set->nfont; ++i) {
        FcPattern* pattern = set->fonts[i];

        FcChar8* file = nullptr;
        if (FcPatternGetString(pattern, FC_FILE, 0, &file) != FcResultMatch) continue;

        FcChar8* style = nullptr;
        FcPatternGetString(pattern, FC_STYLE, 0, &style);
        int index = 0;
        FcPatternGetInteger(pattern, FC_INDEX, 0, &index);

        FcChar8* family = nullptr;
        for (int n = 0; FcPatternGetString(pattern, FC_FAMILY, n, &family) == FcResultMatch; ++n) {
            FontFace face;
            face.family = reinterpret_cast<const char*>(family);
            face.style = style ? reinterpret_cast<const char*>(style) : "";
            face.path = reinterpret_cast<const char*>(file);
            face.index = index;
            face.source = source;
            out.push_back(std::move(face));
        }
    }
}

} // namespace

const char* fontSourceName(FontSource source) {
    switch (source) {
    case FontSource::Configured: return "configured";
    case FontSource::Embedded: return "embedded";
    case FontSource::System: return "system";
    }
    return "unknown";
}

const std::vector<std::string>& FontBook::embeddedFamilies() {
    static const std::vector<std::string> families = {
        "New Computer Modern",
        "New Computer Modern Math",
        "Libertinus Serif",
        "DejaVu Sans Mono",
    };
    return families;
}

Result<FontBook::Ptr> FontBook::create(const Config& config) noexcept {
    auto book = Ptr(new FontBook());
    if (auto res = book->init(config); !res) {
        return Err<Ptr>("Failed to initialize FontBook", res);
    }
    return Ok(std::move(book));
}

Result<void> FontBook::init(const Config& config) noexcept {
    if (auto res = loadConfigured(config.fonts); !res) return res;
    if (config.embeddedFonts) loadEmbedded();
    if (config.systemFonts) {
        if (auto res = loadSystem(); !res) return res;
    }
    yinfo("FontBook: {} faces ({} font paths)", _faces.size(), _fontPaths.size());
    return Ok();
}

Result<void> FontBook::loadConfigured(const std::vector<std::string>& paths) {
    if (paths.empty()) return Ok();

    FcConfig* config = FcConfigCreate();
    if (!config) {
        return Err<void>("fontconfig: failed to create configuration");
    }

    for (const auto& entry : paths) {
        std::filesystem::path path(entry);
        std::error_code ec;
        const auto* fcPath = reinterpret_cast<const FcChar8*>(entry.c_str());
        if (std::filesystem::is_directory(path, ec)) {
            if (!FcConfigAppFontAddDir(config, fcPath)) {
                ywarn("FontBook: could not scan font directory {}", entry);
                continue;
            }
            _fontPaths.push_back(path);
        } else if (std::filesystem::is_regular_file(path, ec)) {
            if (!FcConfigAppFontAddFile(config, fcPath)) {
                ywarn("FontBook: {} is not a usable font file", entry);
                continue;
            }
            _fontPaths.push_back(path.parent_path().empty() ? std::filesystem::path(".")
                                                            : path.parent_path());
        } else {
            ywarn("FontBook: font path {} does not exist", entry);
        }
    }

    size_t before = _faces.size();
    collectFaces(FcConfigGetFonts(config, FcSetApplication), FontSource::Configured, _faces);
    FcConfigDestroy(config);
    ydebug("FontBook: {} configured faces", _faces.size() - before);
    return Ok();
}

void FontBook::loadEmbedded() {
    for (const auto& family : embeddedFamilies()) {
        FontFace face;
        face.family = family;
        face.style = "Regular";
        face.source = FontSource::Embedded;
        _faces.push_back(std::move(face));
    }
}

Result<void> FontBook::loadSystem() {
    FcConfig* config = FcInitLoadConfigAndFonts();
    if (!config) {
        return Err<void>("fontconfig: failed to load the system configuration");
    }
    size_t before = _faces.size();
    collectFaces(FcConfigGetFonts(config, FcSetSystem), FontSource::System, _faces);
    FcConfigDestroy(config);
    ydebug("FontBook: {} system faces", _faces.size() - before);
    return Ok();
}

std::optional<FontFace> FontBook::find(const std::string& family) {
    const std::string wanted = lowercase(family);
    return _lookups.getOrLoad(wanted, [&]() -> std::optional<FontFace> {
        for (const auto& face : _faces) {
            if (lowercase(face.family) == wanted) return face;
        }
        return std::nullopt;
    });
}

} // namespace mdtypst
