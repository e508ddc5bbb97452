#include <mdtypst/config.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace mdtypst {

// ─── Helpers ─────────────────────────────────────────────────────────────────

// "inline-preamble" and "inline_preamble" name the same key
static std::string normalizeKey(std::string key) {
    std::replace(key.begin(), key.end(), '-', '_');
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static Result<bool> parseBool(const std::string& key, const std::string& value) {
    std::string v = lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return Ok(true);
    if (v == "false" || v == "0" || v == "no" || v == "off") return Ok(false);
    return Err<bool>("invalid boolean for " + key + ": " + value);
}

static Result<uint32_t> parseCount(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        long n = std::stol(value, &pos);
        if (pos != value.size() || n < 0) {
            return Err<uint32_t>("invalid count for " + key + ": " + value);
        }
        return Ok(static_cast<uint32_t>(n));
    } catch (const std::exception&) {
        return Err<uint32_t>("invalid count for " + key + ": " + value);
    }
}

// Parse colon-separated string into vector
static std::vector<std::string> parsePathList(const std::string& pathStr) {
    std::vector<std::string> result;
    std::istringstream ss(pathStr);
    std::string item;
    while (std::getline(ss, item, ':')) {
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

// Keys mdbook itself puts into every preprocessor table
static bool isHostKey(const std::string& key) {
    return key == "command" || key == "renderer" || key == "renderers" ||
           key == "before" || key == "after" || key == "optional";
}

// Set one scalar-valued key. Lists are handled by the caller.
static Result<void> setScalar(Config& config, const std::string& key, const std::string& value) {
    if (key == "preamble") {
        config.preamble = value;
    } else if (key == "inline_preamble") {
        config.inlinePreamble = value;
    } else if (key == "display_preamble") {
        config.displayPreamble = value;
    } else if (key == "fonts") {
        config.fonts = parsePathList(value);
    } else if (key == "cache" || key == "cache_dir") {
        if (value.empty()) {
            config.cacheDir.reset();
        } else {
            config.cacheDir = std::filesystem::path(value);
        }
    } else if (key == "color_mode" || key == "color") {
        auto mode = parseColorMode(value);
        if (!mode) return Err<void>("config key " + key, mode);
        config.colorMode = *mode;
    } else if (key == "code_tag") {
        if (value.empty()) return Err<void>("code_tag must not be empty");
        config.codeTag = value;
    } else if (key == "on_error") {
        auto policy = parseFailurePolicy(value);
        if (!policy) return Err<void>("config key " + key, policy);
        config.failurePolicy = *policy;
    } else if (key == "compiler") {
        config.compiler = value;
    } else if (key == "registry") {
        config.registry = value;
        while (!config.registry.empty() && config.registry.back() == '/') {
            config.registry.pop_back();
        }
    } else if (key == "workers") {
        auto n = parseCount(key, value);
        if (!n) return Err<void>("config", n);
        config.workers = *n;
    } else if (key == "system_fonts") {
        auto b = parseBool(key, value);
        if (!b) return Err<void>("config", b);
        config.systemFonts = *b;
    } else if (key == "embedded_fonts") {
        auto b = parseBool(key, value);
        if (!b) return Err<void>("config", b);
        config.embeddedFonts = *b;
    } else if (!isHostKey(key)) {
        ywarn("Config: ignoring unknown key '{}'", key);
    }
    return Ok();
}

// ─── Enumerations ────────────────────────────────────────────────────────────

Result<ColorMode> parseColorMode(const std::string& value) {
    std::string v = lower(value);
    if (v == "auto") return Ok(ColorMode::Auto);
    if (v == "static") return Ok(ColorMode::Static);
    return Err<ColorMode>("unknown color mode '" + value + "' (expected auto or static)");
}

Result<FailurePolicy> parseFailurePolicy(const std::string& value) {
    std::string v = lower(value);
    if (v == "preserve") return Ok(FailurePolicy::Preserve);
    if (v == "annotate") return Ok(FailurePolicy::Annotate);
    return Err<FailurePolicy>("unknown failure policy '" + value +
                              "' (expected preserve or annotate)");
}

// ─── Config ──────────────────────────────────────────────────────────────────

const std::string& Config::preambleFor(SpanKind kind) const {
    switch (kind) {
    case SpanKind::Inline:
        return inlinePreamble ? *inlinePreamble : preamble;
    case SpanKind::Display:
    case SpanKind::TaggedBlock:
        return displayPreamble ? *displayPreamble : preamble;
    }
    return preamble;
}

uint32_t Config::effectiveWorkers() const {
    if (workers > 0) return workers;
    return std::max(1u, std::thread::hardware_concurrency());
}

// ─── Loading ─────────────────────────────────────────────────────────────────

Result<void> applyYaml(Config& config, const YAML::Node& node) {
    if (!node || node.IsNull()) return Ok();
    if (!node.IsMap()) return Err<void>("config root must be a map");

    try {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = normalizeKey(it->first.as<std::string>());
            const YAML::Node& val = it->second;
            if (isHostKey(key)) continue;

            if (val.IsSequence()) {
                if (key != "fonts") {
                    return Err<void>("config key " + key + " does not take a list");
                }
                config.fonts.clear();
                for (const auto& item : val) {
                    config.fonts.push_back(item.as<std::string>());
                }
            } else if (val.IsScalar()) {
                if (auto res = setScalar(config, key, val.as<std::string>()); !res) {
                    return res;
                }
            } else if (val.IsNull()) {
                // explicit null resets optional keys
                if (key == "inline_preamble") config.inlinePreamble.reset();
                else if (key == "display_preamble") config.displayPreamble.reset();
                else if (key == "cache" || key == "cache_dir") config.cacheDir.reset();
            } else {
                return Err<void>("config key " + key + " has an unsupported value");
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("YAML error: ") + e.what());
    }
    return Ok();
}

Result<void> applyEnvOverrides(Config& config) {
    static const char* keys[] = {
        "preamble", "inline_preamble", "display_preamble", "fonts", "cache",
        "color_mode", "code_tag", "on_error", "compiler", "registry", "workers",
        "system_fonts", "embedded_fonts",
    };

    for (const char* key : keys) {
        std::string envVar = Config::ENV_PREFIX;
        for (const char* c = key; *c; ++c) {
            envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(*c)));
        }
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;

        ydebug("Config override from env: {}={}", envVar, val);
        if (auto res = setScalar(config, key, val); !res) {
            return Err<void>("environment " + envVar, res);
        }
    }
    return Ok();
}

static Result<void> loadFile(Config& config, const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        return applyYaml(config, fileConfig);
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

Result<Config> loadConfig(const std::string& configPath, const YAML::Node& overrides) {
    Config config;

    std::string effectivePath = configPath;
    if (effectivePath.empty()) {
        auto xdgPath = xdgConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(config, effectivePath); !res) {
            // an explicitly requested file must load
            if (!configPath.empty()) {
                return Err<Config>("Failed to load config " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    if (auto res = applyYaml(config, overrides); !res) {
        return Err<Config>("Invalid preprocessor configuration", res);
    }

    if (auto res = applyEnvOverrides(config); !res) {
        return Err<Config>("Invalid environment override", res);
    }

    return Ok(std::move(config));
}

std::filesystem::path xdgConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "mdtypst" / "config.yaml";
}

} // namespace mdtypst
