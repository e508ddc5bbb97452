#include <mdtypst/processor.h>
#include <mdtypst/assembler.h>
#include <mdtypst/color-postprocessor.h>
#include <mdtypst/document-builder.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <system_error>
#include <thread>

namespace mdtypst {

namespace {

// Thread-safe queue of span indices
class WorkQueue {
public:
    void push(size_t index) {
        std::lock_guard<std::mutex> lock(_mutex);
        _queue.push(index);
    }

    bool pop(size_t& index) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_queue.empty()) return false;
        index = _queue.front();
        _queue.pop();
        return true;
    }

private:
    std::queue<size_t> _queue;
    std::mutex _mutex;
};

} // namespace

Processor::Processor(const Config& config, Renderer::Ptr renderer, DiagnosticHandler handler) noexcept
    : _config(config),
      _renderer(std::move(renderer)),
      _handler(handler ? std::move(handler) : DiagnosticHandler(&Processor::logDiagnostic)),
      _extractor(config.codeTag) {}

Result<Processor::Ptr> Processor::create(const Config& config, Renderer::Ptr renderer,
                                         DiagnosticHandler handler) noexcept {
    if (!renderer) {
        return Err<Ptr>("Processor requires a renderer");
    }
    if (config.codeTag.empty()) {
        return Err<Ptr>("code tag must not be empty");
    }
    return Ok(Ptr(new Processor(config, std::move(renderer), std::move(handler))));
}

void Processor::logDiagnostic(const DocumentDiagnostic& diag) {
    if (diag.diagnostic.isError()) {
        yerror("{}", diag.format());
    } else {
        ywarn("{}", diag.format());
    }
}

RenderResult Processor::renderSpan(const Span& span) {
    try {
        auto doc = buildDocument(span, _config);
        auto result = _renderer->render(doc);
        if (result.svg) {
            result.svg = postprocessColors(*result.svg, _config.colorMode);
        }
        return result;
    } catch (const std::exception& e) {
        // std::regex and the filesystem layer may throw on pathological input
        RenderResult failed;
        failed.diagnostics.push_back(Diagnostic::error(DiagnosticKind::CompilerFailure, e.what()));
        return failed;
    }
}

std::string Processor::process(std::string_view document, const std::string& documentName) {
    auto extraction = _extractor.extract(document);
    for (auto& anomaly : extraction.anomalies) {
        anomaly.documentName = documentName;
        _handler(anomaly);
    }

    const auto& spans = extraction.spans;
    if (spans.empty()) {
        return std::string(document);
    }

    std::vector<RenderResult> results(spans.size());

    WorkQueue queue;
    for (size_t i = 0; i < spans.size(); ++i) {
        queue.push(i);
    }

    size_t threadCount = std::min<size_t>(_config.effectiveWorkers(), spans.size());
    threadCount = std::max<size_t>(threadCount, 1);
    ydebug("Processor: {} spans in {} on {} threads", spans.size(), documentName, threadCount);

    auto worker = [&]() {
        size_t index;
        while (queue.pop(index)) {
            // each index is written by exactly one worker
            results[index] = renderSpan(spans[index]);
        }
    };

    std::vector<std::thread> workers;
    for (size_t i = 1; i < threadCount; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& e) {
            ywarn("Processor: could not start worker thread: {}", e.what());
            break;
        }
    }
    worker();
    for (auto& t : workers) {
        t.join();
    }

    LineIndex lines(document);
    std::vector<Replacement> replacements;
    replacements.reserve(spans.size());
    size_t failures = 0;

    for (size_t i = 0; i < spans.size(); ++i) {
        const Span& span = spans[i];
        const RenderResult& result = results[i];

        const SourcePosition start = lines.position(span.range.start);
        for (const auto& diag : result.diagnostics) {
            DocumentDiagnostic located;
            located.documentName = documentName;
            located.spanKind = span.kind;
            located.documentPosition = start;
            // tagged block content starts on the line after the opening fence
            if (diag.position && span.kind == SpanKind::TaggedBlock) {
                located.documentPosition = SourcePosition{start.line + diag.position->line,
                                                          diag.position->column};
            }
            located.diagnostic = diag;
            _handler(located);
        }

        if (result.ok()) {
            replacements.push_back(Replacement{span.range, wrapMarkup(span.kind, *result.svg)});
            continue;
        }

        ++failures;
        switch (_config.failurePolicy) {
        case FailurePolicy::Preserve:
            break;
        case FailurePolicy::Annotate:
            replacements.push_back(Replacement{
                span.range,
                errorMarkup(document.substr(span.range.start, span.range.size()), result.errorMessage())});
            break;
        }
    }

    auto assembled = assemble(document, replacements);
    if (!assembled) {
        yerror("Processor: {}: {}", documentName, error_msg(assembled));
        return std::string(document);
    }

    yinfo("Processor: {}: rendered {}/{} spans", documentName, spans.size() - failures, spans.size());
    return std::move(*assembled);
}

} // namespace mdtypst
