#include <mdtypst/mdbook-host.h>
#include <mdtypst/renderer.h>
#include <ytrace/ytrace.hpp>

namespace mdtypst {

namespace {

Result<Processor::Ptr> createProcessor(const Config& config) {
    auto renderer = Renderer::create(config);
    if (!renderer) return Err<Processor::Ptr>("Failed to create renderer", renderer);
    return Processor::create(config, *renderer);
}

Result<size_t> processItems(nlohmann::json& items, Processor& processor) {
    if (!items.is_array()) {
        return Err<size_t>("book items must be an array");
    }
    size_t count = 0;
    for (auto& item : items) {
        // "Separator" and {"PartTitle": ...} carry no content
        if (!item.is_object() || !item.contains("Chapter")) continue;
        auto& chapter = item["Chapter"];

        std::string name;
        if (chapter.contains("path") && chapter["path"].is_string()) {
            name = chapter["path"].get<std::string>();
        } else if (chapter.contains("name") && chapter["name"].is_string()) {
            name = chapter["name"].get<std::string>();
        }

        if (chapter.contains("content") && chapter["content"].is_string()) {
            const std::string content = chapter["content"].get<std::string>();
            chapter["content"] = processor.process(content, name);
            ++count;
        } else {
            ywarn("mdbook: chapter '{}' has no content", name);
        }

        if (chapter.contains("sub_items")) {
            auto sub = processItems(chapter["sub_items"], processor);
            if (!sub) return Err<size_t>("in chapter '" + name + "'", sub);
            count += *sub;
        }
    }
    return Ok(count);
}

} // namespace

bool supportsRenderer(const std::string& renderer) {
    return renderer == "html";
}

YAML::Node jsonToYaml(const nlohmann::json& value) {
    switch (value.type()) {
    case nlohmann::json::value_t::object: {
        YAML::Node node(YAML::NodeType::Map);
        for (auto it = value.begin(); it != value.end(); ++it) {
            node[it.key()] = jsonToYaml(it.value());
        }
        return node;
    }
    case nlohmann::json::value_t::array: {
        YAML::Node node(YAML::NodeType::Sequence);
        for (const auto& child : value) {
            node.push_back(jsonToYaml(child));
        }
        return node;
    }
    case nlohmann::json::value_t::string:
        return YAML::Node(value.get<std::string>());
    case nlohmann::json::value_t::boolean:
        return YAML::Node(value.get<bool>());
    case nlohmann::json::value_t::number_integer:
        return YAML::Node(value.get<int64_t>());
    case nlohmann::json::value_t::number_unsigned:
        return YAML::Node(value.get<uint64_t>());
    case nlohmann::json::value_t::number_float:
        return YAML::Node(value.get<double>());
    default:
        return YAML::Node();
    }
}

YAML::Node bookSettings(const nlohmann::json& context) {
    if (!context.is_object()) return YAML::Node();
    auto config = context.find("config");
    if (config == context.end() || !config->is_object()) return YAML::Node();
    auto preprocessors = config->find("preprocessor");
    if (preprocessors == config->end() || !preprocessors->is_object()) return YAML::Node();
    auto table = preprocessors->find(PREPROCESSOR_NAME);
    if (table == preprocessors->end()) return YAML::Node();
    return jsonToYaml(*table);
}

Result<size_t> processBook(nlohmann::json& book, Processor& processor) {
    if (!book.is_object()) {
        return Err<size_t>("book must be a JSON object");
    }
    for (const char* key : {"sections", "items"}) {
        if (book.contains(key)) {
            return processItems(book[key], processor);
        }
    }
    return Err<size_t>("book has neither 'sections' nor 'items'");
}

Result<std::string> runPreprocessor(std::string_view input, const std::string& configPath) {
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(input.begin(), input.end());
    } catch (const nlohmann::json::exception& e) {
        return Err<std::string>(std::string("invalid mdbook input: ") + e.what());
    }
    if (!payload.is_array() || payload.size() != 2) {
        return Err<std::string>("mdbook input must be a [context, book] array");
    }

    const auto& context = payload[0];
    if (context.contains("mdbook_version") && context["mdbook_version"].is_string()) {
        ydebug("mdbook: protocol from mdbook {}", context["mdbook_version"].get<std::string>());
    }

    auto config = loadConfig(configPath, bookSettings(context));
    if (!config) return Err<std::string>("configuration error", config);

    auto processor = createProcessor(*config);
    if (!processor) return Err<std::string>("cannot start", processor);

    auto& book = payload[1];
    auto chapters = processBook(book, **processor);
    if (!chapters) return Err<std::string>("malformed book", chapters);
    yinfo("mdbook: processed {} chapters", *chapters);

    try {
        return Ok(book.dump());
    } catch (const nlohmann::json::exception& e) {
        return Err<std::string>(std::string("cannot serialize book: ") + e.what());
    }
}

Result<std::string> renderDocument(std::string_view markdown, const std::string& name,
                                   const std::string& configPath) {
    auto config = loadConfig(configPath);
    if (!config) return Err<std::string>("configuration error", config);

    auto processor = createProcessor(*config);
    if (!processor) return Err<std::string>("cannot start", processor);

    return Ok((*processor)->process(markdown, name));
}

} // namespace mdtypst
