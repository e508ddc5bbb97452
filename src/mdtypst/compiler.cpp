#include <mdtypst/compiler.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mdtypst {

namespace {

constexpr int EXIT_EXEC_FAILED = 127;
constexpr const char* MAIN_FILE = "main.typ";
constexpr const char* OUTPUT_TEMPLATE = "page-{0p}.svg";

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

// Temporary working directory removed on scope exit
class TempDir {
public:
    static Result<TempDir> create() {
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) base = "/tmp";
        std::string pattern = (base / "mdtypst-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) {
            return Err<TempDir>(std::string("mkdtemp failed: ") + std::strerror(errno));
        }
        return Ok(TempDir(std::filesystem::path(buf.data())));
    }

    TempDir(TempDir&& other) noexcept : _path(std::move(other._path)) { other._path.clear(); }
    TempDir& operator=(TempDir&&) = delete;
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        if (_path.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
        if (ec) ywarn("TempDir: failed to remove {}: {}", _path.string(), ec.message());
    }

    const std::filesystem::path& path() const { return _path; }

private:
    explicit TempDir(std::filesystem::path path) : _path(std::move(path)) {}
    std::filesystem::path _path;
};

struct ProcessOutput {
    int exitCode = -1;
    std::string output;  // stdout and stderr interleaved
};

// Run argv[0] with stdin from /dev/null, collecting stdout+stderr.
Result<ProcessOutput> runProcess(const std::vector<std::string>& argv,
                                 const std::filesystem::path& workDir) {
    // argv must be complete before fork, the child only calls exec-safe functions
    std::vector<const char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(a.c_str());
    args.push_back(nullptr);
    const std::string dir = workDir.string();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Err<ProcessOutput>(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Err<ProcessOutput>(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        if (::chdir(dir.c_str()) != 0) ::_exit(EXIT_EXEC_FAILED);
        ::execvp(args[0], const_cast<char* const*>(args.data()));
        ::_exit(EXIT_EXEC_FAILED);
    }

    ::close(fds[1]);
    ProcessOutput result;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Err<ProcessOutput>(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        return Err<ProcessOutput>(argv[0] + " terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    return Ok(std::move(result));
}

// True when `name` resolves to an executable, directly or through $PATH.
bool executableExists(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (::access((std::filesystem::path(dir) / name).c_str(), X_OK) == 0) return true;
    }
    return false;
}

} // namespace

//=============================================================================
// Output parsing
//=============================================================================

std::vector<Diagnostic> parseCompilerOutput(std::string_view output, size_t preambleLines,
                                            SpanKind kind) {
    static const std::regex located(R"(^(.+):(\d+):(\d+): (error|warning): (.*)$)");
    static const std::regex unlocated(R"(^(error|warning): (.*)$)");

    std::vector<Diagnostic> diagnostics;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string text = trim(line);
        if (text.empty()) continue;

        // hint lines belong to the diagnostic before them
        auto hintPos = text.find("hint: ");
        if (hintPos != std::string::npos &&
            (hintPos == 0 || (hintPos >= 2 && text.compare(hintPos - 2, 2, ": ") == 0))) {
            if (!diagnostics.empty()) diagnostics.back().hints.push_back(text.substr(hintPos + 6));
            continue;
        }

        std::smatch m;
        if (std::regex_match(text, m, located)) {
            Diagnostic diag;
            diag.severity = m[4] == "error" ? Severity::Error : Severity::Warning;
            diag.kind = DiagnosticKind::CompilerDiagnostic;
            diag.message = m[5].str();

            const std::filesystem::path file(m[1].str());
            size_t lineNo = std::stoul(m[2].str());
            size_t column = std::stoul(m[3].str());
            if (file.filename() != MAIN_FILE || m[1].str().front() == '@') {
                diag.message = m[1].str() + ":" + m[2].str() + ":" + m[3].str() + ": " + diag.message;
            } else if (lineNo <= preambleLines) {
                diag.message = "in preamble line " + m[2].str() + ": " + diag.message;
            } else {
                SourcePosition pos{lineNo - preambleLines, column};
                // "$ " in front of the first content line
                if (kind != SpanKind::TaggedBlock && pos.line == 1) {
                    pos.column = column > 2 ? column - 2 : 1;
                }
                diag.position = pos;
            }
            diagnostics.push_back(std::move(diag));
        } else if (std::regex_match(text, m, unlocated)) {
            diagnostics.push_back(m[1] == "error"
                                      ? Diagnostic::error(DiagnosticKind::CompilerDiagnostic, m[2].str())
                                      : Diagnostic::warning(DiagnosticKind::CompilerDiagnostic, m[2].str()));
        } else {
            ydebug("parseCompilerOutput: ignoring '{}'", text);
        }
    }
    return diagnostics;
}

std::vector<std::string> findFontFamilies(std::string_view source) {
    static const std::regex setting(R"re(\bfont\s*:\s*(\([^)]*\)|"[^"]*"))re");
    static const std::regex quoted(R"re("([^"]+)")re");

    std::vector<std::string> families;
    std::string text(source);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), setting); it != std::sregex_iterator(); ++it) {
        const std::string value = (*it)[1];
        for (auto q = std::sregex_iterator(value.begin(), value.end(), quoted); q != std::sregex_iterator(); ++q) {
            std::string family = (*q)[1];
            if (std::find(families.begin(), families.end(), family) == families.end()) {
                families.push_back(std::move(family));
            }
        }
    }
    return families;
}

//=============================================================================
// TypstCliCompiler
//=============================================================================

class TypstCliCompiler : public Compiler {
public:
    explicit TypstCliCompiler(const Config& config) : _config(config) {}

    Result<void> init() noexcept {
        if (_config.compiler.empty()) {
            return Err<void>("no compiler configured");
        }
        if (!executableExists(_config.compiler)) {
            // every span will report the failure, the book still builds
            ywarn("TypstCliCompiler: '{}' not found, spans will be left unrendered", _config.compiler);
        } else {
            yinfo("TypstCliCompiler: using '{}'", _config.compiler);
        }
        return Ok();
    }

    Result<CompileOutput> compile(World& world) override {
        CompileOutput out;
        const BuiltDocument& doc = world.document();

        if (!resolvePackages(world, out)) {
            return Ok(std::move(out));
        }
        checkFonts(world, out);

        auto tmp = TempDir::create();
        if (!tmp) return Err<CompileOutput>("cannot create working directory", tmp);

        {
            std::ofstream main(tmp->path() / MAIN_FILE, std::ios::binary);
            main << world.mainSource();
            if (!main) return Err<CompileOutput>("cannot write " + (tmp->path() / MAIN_FILE).string());
        }

        auto proc = runProcess(buildArgv(world, tmp->path()), tmp->path());
        if (!proc) return Err<CompileOutput>("failed to run " + _config.compiler, proc);

        if (proc->exitCode == EXIT_EXEC_FAILED && proc->output.empty()) {
            return Err<CompileOutput>("could not execute '" + _config.compiler + "'");
        }

        auto diags = parseCompilerOutput(proc->output, doc.preambleLines, doc.kind);
        bool hasError = std::any_of(diags.begin(), diags.end(),
                                    [](const Diagnostic& d) { return d.isError(); });
        for (auto& d : diags) out.diagnostics.push_back(std::move(d));

        if (proc->exitCode != 0) {
            if (!hasError) {
                out.diagnostics.push_back(Diagnostic::error(
                    DiagnosticKind::CompilerFailure,
                    _config.compiler + " exited with status " + std::to_string(proc->exitCode) +
                        (proc->output.empty() ? "" : ": " + trim(proc->output))));
            }
            return Ok(std::move(out));
        }

        auto svg = collectPages(tmp->path());
        if (!svg) {
            out.diagnostics.push_back(Diagnostic::error(DiagnosticKind::CompilerFailure, error_msg(svg)));
            return Ok(std::move(out));
        }
        out.svg = std::move(*svg);
        return Ok(std::move(out));
    }

private:
    // Resolve every package reachable from the main source. False on failure.
    bool resolvePackages(World& world, CompileOutput& out) {
        std::deque<PackageKey> pending;
        std::set<std::string> seen;
        for (auto& key : findPackageReferences(world.mainSource())) {
            if (seen.insert(key.toString()).second) pending.push_back(std::move(key));
        }

        while (!pending.empty()) {
            PackageKey key = std::move(pending.front());
            pending.pop_front();

            auto root = world.packageRoot(key);
            if (!root) {
                out.diagnostics.push_back(
                    Diagnostic::error(DiagnosticKind::PackageUnavailable, error_msg(root)));
                return false;
            }

            std::error_code ec;
            for (auto it = std::filesystem::recursive_directory_iterator(*root, ec);
                 !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                if (!it->is_regular_file(ec) || it->path().extension() != ".typ") continue;
                PackagePath file{key, std::filesystem::relative(it->path(), *root, ec).generic_string()};
                auto bytes = world.file(file);
                if (!bytes) {
                    ywarn("TypstCliCompiler: {}", error_msg(bytes));
                    continue;
                }
                for (auto& dep : findPackageReferences(**bytes)) {
                    if (seen.insert(dep.toString()).second) pending.push_back(std::move(dep));
                }
            }
            if (ec) {
                ywarn("TypstCliCompiler: scanning {} failed: {}", root->string(), ec.message());
            }
        }
        return true;
    }

    void checkFonts(World& world, CompileOutput& out) {
        for (const auto& family : findFontFamilies(world.mainSource())) {
            auto face = world.font(family);
            if (!face) {
                out.diagnostics.push_back(Diagnostic::warning(
                    DiagnosticKind::FontResolutionMiss, error_msg(face) + ", falling back to the default font"));
            } else {
                ydebug("TypstCliCompiler: font '{}' -> {} ({})", family, face->path.string(),
                       fontSourceName(face->source));
            }
        }
    }

    std::vector<std::string> buildArgv(World& world, const std::filesystem::path& dir) const {
        const auto& env = world.environment();
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                           world.today().time_since_epoch()).count();

        std::vector<std::string> argv = {
            _config.compiler, "compile",
            "--root", dir.string(),
            "--diagnostic-format", "short",
            "--format", "svg",
            "--creation-timestamp", std::to_string(seconds),
        };
        for (const auto& path : env.fontBook()->fontPaths()) {
            argv.push_back("--font-path");
            argv.push_back(std::filesystem::absolute(path).string());
        }
        if (const auto& cache = env.packageCache()->cacheDir()) {
            auto abs = std::filesystem::absolute(*cache).string();
            argv.insert(argv.end(), {"--package-path", abs, "--package-cache-path", abs});
        }
        if (!_config.systemFonts) argv.push_back("--ignore-system-fonts");
        if (!_config.embeddedFonts) argv.push_back("--ignore-embedded-fonts");
        argv.push_back(MAIN_FILE);
        argv.push_back(OUTPUT_TEMPLATE);
        return argv;
    }

    // page-*.svg in page order, joined by newlines
    static Result<std::string> collectPages(const std::filesystem::path& dir) {
        std::vector<std::filesystem::path> pages;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            const auto name = entry.path().filename().string();
            if (name.rfind("page-", 0) == 0 && entry.path().extension() == ".svg") {
                pages.push_back(entry.path());
            }
        }
        if (ec) return Err<std::string>("cannot list " + dir.string() + ": " + ec.message());
        if (pages.empty()) return Err<std::string>("compiler produced no SVG output");
        std::sort(pages.begin(), pages.end());

        std::string svg;
        for (const auto& page : pages) {
            std::ifstream in(page, std::ios::binary);
            if (!in.is_open()) return Err<std::string>("cannot read " + page.string());
            std::ostringstream ss;
            ss << in.rdbuf();
            if (!svg.empty()) svg += '\n';
            svg += ss.str();
        }
        return Ok(std::move(svg));
    }

    Config _config;
};

Result<Compiler::Ptr> Compiler::create(const Config& config) noexcept {
    auto compiler = std::make_shared<TypstCliCompiler>(config);
    if (auto res = compiler->init(); !res) {
        return Err<Ptr>("Failed to initialize compiler", res);
    }
    return Ok(Ptr(std::move(compiler)));
}

} // namespace mdtypst
