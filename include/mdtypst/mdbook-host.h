#pragma once

#include <mdtypst/config.h>
#include <mdtypst/processor.h>
#include <mdtypst/result.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>
#include <string_view>

namespace mdtypst {

// Name of the preprocessor table in book.toml: [preprocessor.typst-math]
constexpr const char* PREPROCESSOR_NAME = "typst-math";

// `supports <renderer>`: only HTML output can show inline SVG.
bool supportsRenderer(const std::string& renderer);

// Structural copy of a JSON value as a YAML node (null stays undefined).
YAML::Node jsonToYaml(const nlohmann::json& value);

// The [preprocessor.typst-math] table of an mdbook context, as YAML.
YAML::Node bookSettings(const nlohmann::json& context);

/**
 * Run the processor over every chapter of an mdbook book object, following
 * sub_items recursively. Accepts both "sections" and "items" layouts.
 *
 * @return number of chapters processed
 */
Result<size_t> processBook(nlohmann::json& book, Processor& processor);

/**
 * Full preprocessor run: parse `[context, book]`, load configuration (file,
 * then book table, then environment), process, and return the book as JSON.
 */
Result<std::string> runPreprocessor(std::string_view input, const std::string& configPath);

// Standalone rendering of one Markdown document.
Result<std::string> renderDocument(std::string_view markdown, const std::string& name,
                                   const std::string& configPath);

} // namespace mdtypst
