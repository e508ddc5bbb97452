//=============================================================================
// mdbook-typst-math - mdbook preprocessor rendering math with Typst
//
//   mdbook-typst-math supports <renderer>   exit 0 if the renderer is handled
//   mdbook-typst-math                       [context, book] JSON on stdin
//   mdbook-typst-math render <file|->       one Markdown file to stdout
//
// stdout carries the mdbook protocol, so logs go to stderr or --log-file.
//=============================================================================

#include <mdtypst/mdbook-host.h>
#include <ytrace/ytrace.hpp>
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

static bool setupLogging(const std::string& logFile, bool verbose) {
    try {
        std::shared_ptr<spdlog::logger> logger;
        if (logFile.empty()) {
            logger = spdlog::stderr_color_mt("mdtypst");
        } else {
            logger = spdlog::basic_logger_mt("mdtypst", logFile);
        }
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "mdbook-typst-math: cannot set up logging: " << e.what() << std::endl;
        return false;
    }

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    if (verbose) {
        yenable_all();
    }
    spdlog::cfg::load_env_levels();
    return true;
}

static std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("mdbook-typst-math - render Typst math in mdbook chapters");
    parser.Prog("mdbook-typst-math");
    parser.RequireCommand(false);
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::Group commands(parser, "commands");
    args::Command supportsCmd(commands, "supports", "Check whether a renderer is supported");
    args::Command renderCmd(commands, "render", "Render one Markdown file to stdout");

    // Global options
    args::ValueFlag<std::string> configFlag(parser, "yaml", "Configuration file", {'c', "config"}, "");
    args::ValueFlag<std::string> logFileFlag(parser, "path", "Write logs to a file", {"log-file"}, "");
    args::Flag verbose(parser, "verbose", "Verbose output", {'v', "verbose"});

    args::Positional<std::string> rendererName(supportsCmd, "renderer", "Renderer name");
    args::Positional<std::string> inputFile(renderCmd, "file", "Markdown file, or - for stdin", "-");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (!setupLogging(args::get(logFileFlag), verbose)) {
        return 1;
    }

    if (supportsCmd) {
        if (!rendererName) {
            std::cerr << "Renderer name required for supports command" << std::endl;
            return 1;
        }
        bool supported = mdtypst::supportsRenderer(args::get(rendererName));
        ydebug("supports {}: {}", args::get(rendererName), supported);
        return supported ? 0 : 1;
    }

    const std::string configPath = args::get(configFlag);

    if (renderCmd) {
        std::string file = args::get(inputFile);
        std::string markdown;
        if (file == "-") {
            markdown = readAll(std::cin);
        } else {
            std::ifstream in(file, std::ios::binary);
            if (!in.is_open()) {
                yerror("Cannot open {}", file);
                return 1;
            }
            markdown = readAll(in);
        }

        auto result = mdtypst::renderDocument(markdown, file == "-" ? "<stdin>" : file, configPath);
        if (!result) {
            yerror("render failed: {}", mdtypst::error_msg(result));
            return 1;
        }
        std::cout << *result;
        return std::cout.good() ? 0 : 1;
    }

    auto result = mdtypst::runPreprocessor(readAll(std::cin), configPath);
    if (!result) {
        yerror("preprocessing failed: {}", mdtypst::error_msg(result));
        return 1;
    }
    std::cout << *result;
    std::cout.flush();
    return std::cout.good() ? 0 : 1;
}
