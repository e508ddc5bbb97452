//=============================================================================
// mdbook Host Unit Tests
//
// Covers: renderer support, book table conversion, chapter traversal
//=============================================================================

#include <boost/ut.hpp>
#include <mdtypst/mdbook-host.h>
#include "harness/test-stack.h"

using namespace boost::ut;
using namespace mdtypst;

namespace {

nlohmann::json chapter(const std::string& name, const std::string& content,
                       nlohmann::json subItems = nlohmann::json::array()) {
    return {{"Chapter",
             {{"name", name},
              {"content", content},
              {"number", nullptr},
              {"sub_items", std::move(subItems)},
              {"path", name + ".md"},
              {"source_path", name + ".md"},
              {"parent_names", nlohmann::json::array()}}}};
}

} // namespace

suite mdbook_host_tests = [] {
    "only html is supported"_test = [] {
        expect(supportsRenderer("html"));
        expect(!supportsRenderer("markdown"));
        expect(!supportsRenderer("pdf"));
    };

    "book table becomes configuration"_test = [] {
        auto context = nlohmann::json::parse(R"({
            "root": "/book",
            "renderer": "html",
            "mdbook_version": "0.4.40",
            "config": {
                "book": {"title": "Test"},
                "preprocessor": {
                    "typst-math": {
                        "command": "mdbook-typst-math",
                        "inline-preamble": "#set text(size: 9pt)",
                        "fonts": ["fonts"],
                        "workers": 2,
                        "system_fonts": false
                    }
                }
            }
        })");
        auto settings = bookSettings(context);
        expect(settings.IsMap());

        Config config;
        auto res = applyYaml(config, settings);
        expect(res.has_value()) << error_msg(res);
        expect(config.inlinePreamble == std::optional<std::string>("#set text(size: 9pt)"));
        expect(config.fonts == std::vector<std::string>{"fonts"});
        expect(config.workers == 2_u);
        expect(!config.systemFonts);
    };

    "missing table yields no settings"_test = [] {
        auto context = nlohmann::json::parse(R"({"config": {"book": {}}})");
        expect(!bookSettings(context).IsDefined() || bookSettings(context).IsNull());
    };

    "json values convert structurally"_test = [] {
        auto node = jsonToYaml(nlohmann::json::parse(R"({"a": [1, "two", true], "b": {"c": 1.5}})"));
        expect(node["a"].IsSequence());
        expect(node["a"][0].as<int>() == 1_i);
        expect(node["a"][1].as<std::string>() == "two");
        expect(node["a"][2].as<bool>());
        expect(node["b"]["c"].as<double>() == 1.5_d);
    };

    "every chapter is processed, nested ones included"_test = [] {
        auto stack = mdtypst::test::makeStack(mdtypst::test::testConfig(), std::nullopt);
        auto processor = *Processor::create(stack.config, stack.renderer, [](const DocumentDiagnostic&) {});

        nlohmann::json book = {
            {"sections",
             {chapter("intro", "Intro $a$"),
              "Separator",
              {{"PartTitle", "Part"}},
              chapter("parent", "Parent $$b$$", nlohmann::json::array({chapter("child", "Child $c$ and $d$")}))}},
            {"__non_exhaustive", nullptr}};

        auto processed = processBook(book, *processor);
        expect(processed.has_value()) << error_msg(processed);
        expect(*processed == 3_u);

        auto intro = book["sections"][0]["Chapter"]["content"].get<std::string>();
        expect(intro.find("<span class=\"typst-inline\">") != std::string::npos);

        auto child = book["sections"][3]["Chapter"]["sub_items"][0]["Chapter"]["content"].get<std::string>();
        expect(child.find("Child <span class=\"typst-inline\">") == 0_u);
        expect(book["sections"][1] == "Separator");
    };

    "newer books use items"_test = [] {
        auto stack = mdtypst::test::makeStack(mdtypst::test::testConfig(), std::nullopt);
        auto processor = *Processor::create(stack.config, stack.renderer, [](const DocumentDiagnostic&) {});

        nlohmann::json book = {{"items", nlohmann::json::array({chapter("one", "$x$")})}};
        auto processed = processBook(book, *processor);
        expect(processed.has_value());
        expect(*processed == 1_u);
    };

    "malformed books are errors"_test = [] {
        auto stack = mdtypst::test::makeStack(mdtypst::test::testConfig(), std::nullopt);
        auto processor = *Processor::create(stack.config, stack.renderer, [](const DocumentDiagnostic&) {});

        nlohmann::json notObject = nlohmann::json::array();
        expect(!processBook(notObject, *processor).has_value());
        nlohmann::json noSections = {{"title", "x"}};
        expect(!processBook(noSections, *processor).has_value());
    };

    "invalid preprocessor input is rejected"_test = [] {
        expect(!runPreprocessor("not json", "").has_value());
        expect(!runPreprocessor("{\"only\": \"object\"}", "").has_value());
    };
};
