#pragma once

#include <mdtypst/result.hpp>
#include <mdtypst/span.h>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mdtypst {

enum class ColorMode : uint8_t {
    Auto,   // pure black becomes currentColor
    Static  // SVG passes through untouched
};

// What a span that failed to render turns into.
enum class FailurePolicy : uint8_t {
    Preserve,  // original source text
    Annotate   // visible error container around the source text
};

Result<ColorMode> parseColorMode(const std::string& value);
Result<FailurePolicy> parseFailurePolicy(const std::string& value);

struct Config {
    static constexpr const char* DEFAULT_PREAMBLE =
        "#set page(width: auto, height: auto, margin: 0.5em)";
    static constexpr const char* DEFAULT_CODE_TAG = "typst";
    static constexpr const char* DEFAULT_COMPILER = "typst";
    static constexpr const char* DEFAULT_REGISTRY = "https://packages.typst.org";

    // Environment variable prefix, e.g. MDTYPST_CACHE
    static constexpr const char* ENV_PREFIX = "MDTYPST_";

    std::vector<std::string> fonts;
    std::string preamble = DEFAULT_PREAMBLE;
    std::optional<std::string> inlinePreamble;
    std::optional<std::string> displayPreamble;
    std::optional<std::filesystem::path> cacheDir;
    ColorMode colorMode = ColorMode::Auto;
    std::string codeTag = DEFAULT_CODE_TAG;

    FailurePolicy failurePolicy = FailurePolicy::Preserve;
    std::string compiler = DEFAULT_COMPILER;
    std::string registry = DEFAULT_REGISTRY;
    uint32_t workers = 0;  // 0 = one per CPU core
    bool systemFonts = true;
    bool embeddedFonts = true;

    const std::string& preambleFor(SpanKind kind) const;
    uint32_t effectiveWorkers() const;
};

/**
 * Load configuration in precedence order (later wins):
 *   defaults < YAML file < overrides node < MDTYPST_* environment.
 *
 * @param configPath explicit YAML file; empty means the XDG path if it exists
 * @param overrides  typically the book's [preprocessor.typst-math] table
 */
Result<Config> loadConfig(const std::string& configPath = "",
                          const YAML::Node& overrides = YAML::Node());

// Apply the keys of one YAML map onto an existing config.
Result<void> applyYaml(Config& config, const YAML::Node& node);

// Apply MDTYPST_<KEY> environment variables.
Result<void> applyEnvOverrides(Config& config);

// $XDG_CONFIG_HOME/mdtypst/config.yaml
std::filesystem::path xdgConfigPath();

} // namespace mdtypst
