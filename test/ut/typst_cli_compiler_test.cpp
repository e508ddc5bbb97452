//=============================================================================
// TypstCliCompiler Unit Tests
//
// The compiler binary is a shell script standing in for `typst`: it records
// its arguments and writes canned pages and diagnostics.
//=============================================================================

#include <boost/ut.hpp>
#include <mdtypst/compiler.h>
#include <mdtypst/document-builder.h>
#include <mdtypst/renderer.h>
#include "harness/archive-builder.h"
#include "harness/scratch-dir.h"
#include "harness/test-stack.h"
#include <algorithm>
#include <sstream>

using namespace boost::ut;
using namespace mdtypst;
using mdtypst::test::ArchiveBuilder;
using mdtypst::test::ScratchDir;

namespace {

// Executable /bin/sh script at <dir>/bin/typst
std::string writeScript(const ScratchDir& dir, const std::string& body) {
    auto path = dir.write("bin/typst", "#!/bin/sh\n" + body);
    std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
    return path.string();
}

std::string quoted(const std::filesystem::path& path) {
    return "'" + path.string() + "'";
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

// Renderer driving the script named by config.compiler
Renderer::Ptr cliRenderer(const mdtypst::test::TestStack& stack) {
    auto compiler = Compiler::create(stack.config);
    if (!compiler || !stack.env) return nullptr;
    auto renderer = Renderer::create(*compiler, stack.env);
    return renderer ? *renderer : nullptr;
}

size_t countKind(const RenderResult& result, DiagnosticKind kind) {
    return static_cast<size_t>(std::count_if(result.diagnostics.begin(), result.diagnostics.end(),
                                             [&](const Diagnostic& d) { return d.kind == kind; }));
}

const std::string WRITE_PAGE = "printf '<svg/>' > page-1.svg\n";

} // namespace

suite typst_cli_compiler_tests = [] {
    "pages are joined in page order with parsed warnings"_test = [] {
        ScratchDir dir;
        auto config = mdtypst::test::testConfig();
        config.compiler = writeScript(dir,
            "printf '%s\\n' \"$@\" > " + quoted(dir.path() / "argv.txt") + "\n"
            "cp main.typ " + quoted(dir.path() / "main.copy") + "\n"
            "printf '<svg id=\"p2\"/>' > page-2.svg\n"
            "printf '<svg id=\"p1\"/>' > page-1.svg\n"
            "echo 'main.typ:2:7: warning: unused variable'\n"
            "echo 'main.typ:2:7: hint: remove it'\n");
        auto stack = mdtypst::test::makeStack(config, dir.path() / "cache");
        auto renderer = cliRenderer(stack);
        expect(renderer != nullptr);

        auto doc = buildDocument(Span{SpanKind::Display, {}, "x + y"}, stack.config);
        auto result = renderer->render(doc);
        expect(result.ok()) << result.errorMessage();
        expect(result.svg == std::optional<std::string>("<svg id=\"p1\"/>\n<svg id=\"p2\"/>"));

        expect(result.diagnostics.size() == 1_u);
        const auto& warning = result.diagnostics[0];
        expect(!warning.isError());
        expect(warning.message == "unused variable");
        expect(warning.position.has_value());
        expect(warning.position->line == 1_u);
        expect(warning.position->column == 5_u);
        expect(warning.hints == std::vector<std::string>{"remove it"});

        expect(ScratchDir::read(dir.path() / "main.copy") == doc.sourceText);

        auto argv = lines(ScratchDir::read(dir.path() / "argv.txt"));
        auto has = [&](const std::string& arg) {
            return std::find(argv.begin(), argv.end(), arg) != argv.end();
        };
        expect(!argv.empty() && argv.front() == "compile");
        expect(has("--diagnostic-format") && has("short"));
        expect(has("--format") && has("svg"));
        expect(has("--creation-timestamp"));
        expect(has("--ignore-system-fonts"));
        expect(!has("--ignore-embedded-fonts"));
        expect(argv.size() >= 2_u && argv[argv.size() - 2] == "main.typ");
        expect(argv.back() == "page-{0p}.svg");

        auto cache = std::find(argv.begin(), argv.end(), "--package-path");
        expect(cache != argv.end() && cache + 1 != argv.end());
        expect(*(cache + 1) == std::filesystem::absolute(dir.path() / "cache").string());
    };

    "compiler errors fail the span"_test = [] {
        ScratchDir dir;
        auto config = mdtypst::test::testConfig();
        config.compiler = writeScript(dir,
            "echo 'main.typ:3:2: error: unknown variable: foo'\n"
            "exit 1\n");
        auto stack = mdtypst::test::makeStack(config, std::nullopt);
        auto renderer = cliRenderer(stack);
        expect(renderer != nullptr);

        auto doc = buildDocument(Span{SpanKind::TaggedBlock, {}, "#let a = 1\n#foo\n"}, stack.config);
        auto result = renderer->render(doc);
        expect(!result.ok());
        expect(!result.svg.has_value());
        expect(result.diagnostics.size() == 1_u);
        expect(result.diagnostics[0].kind == DiagnosticKind::CompilerDiagnostic);
        expect(result.diagnostics[0].position->line == 2_u);
        expect(result.diagnostics[0].position->column == 2_u);
    };

    "a silent nonzero exit is a compiler failure"_test = [] {
        ScratchDir dir;
        auto config = mdtypst::test::testConfig();
        config.compiler = writeScript(dir, "exit 3\n");
        auto stack = mdtypst::test::makeStack(config, std::nullopt);
        auto renderer = cliRenderer(stack);
        expect(renderer != nullptr);

        auto result = renderer->render(buildDocument(Span{SpanKind::Inline, {}, "x"}, stack.config));
        expect(!result.ok());
        expect(countKind(result, DiagnosticKind::CompilerFailure) == 1_u);
        expect(result.errorMessage().find("status 3") != std::string::npos);
    };

    "success without pages is a compiler failure"_test = [] {
        ScratchDir dir;
        auto config = mdtypst::test::testConfig();
        config.compiler = writeScript(dir, "exit 0\n");
        auto stack = mdtypst::test::makeStack(config, std::nullopt);
        auto renderer = cliRenderer(stack);

        auto result = renderer->render(buildDocument(Span{SpanKind::Inline, {}, "x"}, stack.config));
        expect(!result.ok());
        expect(result.errorMessage().find("no SVG output") != std::string::npos);
    };

    "a missing binary cannot be executed"_test = [] {
        ScratchDir dir;
        auto config = mdtypst::test::testConfig();
        config.compiler = (dir.path() / "no-such-typst").string();
        auto stack = mdtypst::test::makeStack(config, std::nullopt);
        auto renderer = cliRenderer(stack);
        expect(renderer != nullptr);

        auto result = renderer->render(buildDocument(Span{SpanKind::Inline, {}, "x"}, stack.config));
        expect(!result.ok());
        expect(countKind(result, DiagnosticKind::CompilerFailure) == 1_u);
        expect(result.errorMessage().find("could not execute") != std::string::npos);
    };

    "packages imported by packages are resolved first"_test = [] {
        ScratchDir dir;
        const auto cacheDir = dir.path() / "cache";
        auto config = mdtypst::test::testConfig();
        config.compiler = writeScript(dir,
            "test -f " + quoted(cacheDir / "preview/inner/0.2.0/lib.typ") +
            " || { echo 'error: inner package missing'; exit 1; }\n" + WRITE_PAGE);
        auto stack = mdtypst::test::makeStack(config, cacheDir);
        stack.fetcher->add("@preview/outer:1.0.0",
                           ArchiveBuilder()
                               .file("typst.toml", "[package]\nname = \"outer\"\n")
                               .file("src/lib.typ", "#import \"@preview/inner:0.2.0\": helper\n#let outer = helper\n")
                               .tarGz());
        stack.fetcher->add("@preview/inner:0.2.0",
                           ArchiveBuilder().file("lib.typ", "#let helper = 1\n").tarGz());
        auto renderer = cliRenderer(stack);
        expect(renderer != nullptr);

        auto doc = buildDocument(
            Span{SpanKind::TaggedBlock, {}, "#import \"@preview/outer:1.0.0\": outer\n#outer\n"}, stack.config);
        auto result = renderer->render(doc);
        expect(result.ok()) << result.errorMessage();
        expect(stack.fetcher->fetches() == 2_u);
        expect(std::filesystem::exists(cacheDir / "preview/outer/1.0.0/src/lib.typ"));
    };

    "an unavailable nested package stops before the compiler runs"_test = [] {
        ScratchDir dir;
        const auto marker = dir.path() / "ran";
        auto config = mdtypst::test::testConfig();
        config.compiler = writeScript(dir, "touch " + quoted(marker) + "\n" + WRITE_PAGE);
        auto stack = mdtypst::test::makeStack(config, dir.path() / "cache");
        stack.fetcher->add("@preview/outer:1.0.0",
                           ArchiveBuilder().file("lib.typ", "#import \"@preview/gone:1.0.0\": *\n").tarGz());
        auto renderer = cliRenderer(stack);

        auto doc = buildDocument(
            Span{SpanKind::TaggedBlock, {}, "#import \"@preview/outer:1.0.0\": *\n"}, stack.config);
        auto result = renderer->render(doc);
        expect(!result.ok());
        expect(countKind(result, DiagnosticKind::PackageUnavailable) == 1_u);
        expect(result.errorMessage().find("gone") != std::string::npos);
        expect(!std::filesystem::exists(marker));
    };

    "an unknown font family warns and the span still renders"_test = [] {
        ScratchDir dir;
        auto config = mdtypst::test::testConfig();
        config.compiler = writeScript(dir, WRITE_PAGE);
        config.inlinePreamble = "#set text(font: (\"Nope\", \"New Computer Modern\"))";
        auto stack = mdtypst::test::makeStack(config, std::nullopt);
        auto renderer = cliRenderer(stack);
        expect(renderer != nullptr);

        auto result = renderer->render(buildDocument(Span{SpanKind::Inline, {}, "x"}, stack.config));
        expect(result.ok()) << result.errorMessage();
        expect(result.svg == std::optional<std::string>("<svg/>"));
        expect(countKind(result, DiagnosticKind::FontResolutionMiss) == 1_u);

        const auto& miss = result.diagnostics[0];
        expect(!miss.isError());
        expect(miss.message.find("Nope") != std::string::npos);
    };
};
