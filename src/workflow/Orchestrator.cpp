#include "workflow/Orchestrator.hpp"
#include "core/Errors.hpp"
#include "core/SourceFile.hpp"
#include "core/TextLines.hpp"
#include "workflow/Report.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace docpatch {

Orchestrator::Orchestrator(DocAnalyzer& analyzer,
                           ICommentProvider& provider,
                           PatchApplicator patcher,
                           ReportOptions report_options,
                           IChangePublisher* publisher)
    : analyzer_(analyzer),
      provider_(provider),
      patcher_(std::move(patcher)),
      report_options_(report_options),
      publisher_(publisher) {}

AnalysisResult Orchestrator::analyze(const std::filesystem::path& directory) {
    spdlog::info("Analyzing {}", directory.string());
    return analyzer_.analyze_directory(directory);
}

std::string Orchestrator::context_for(std::string_view content, const SymbolRecord& symbol) {
    auto lines = text::split_lines(content);
    if (symbol.line == 0 || symbol.line > lines.size()) {
        return {};
    }

    size_t first = symbol.line - 1;
    size_t last = std::min(lines.size(), first + kContextLines + 1);

    std::string context;
    for (size_t i = first; i < last; ++i) {
        context.append(lines[i]);
        if (i + 1 < last) {
            context += '\n';
        }
    }
    return context;
}

std::string Orchestrator::synthesize_one(const SymbolRecord& symbol, std::string_view context) {
    try {
        std::string comment = provider_.synthesize(symbol, symbol.language, context);
        if (!text::trim(comment).empty()) {
            return comment;
        }
        spdlog::warn("Provider returned no text for {}, using rule-based comment", symbol.name);
    } catch (const SynthesisError& e) {
        spdlog::warn("Synthesis failed for {}: {}, using rule-based comment", symbol.name, e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Provider error for {}: {}, using rule-based comment", symbol.name, e.what());
    }

    return fallback_.synthesize(symbol, symbol.language, context);
}

std::map<std::filesystem::path, std::vector<PatchRequest>> Orchestrator::synthesize(
    const AnalysisResult& analysis) {
    std::map<std::filesystem::path, std::vector<PatchRequest>> requests;

    for (const auto& [path, symbols] : analysis) {
        std::string content;
        try {
            content = SourceFile::read(path);
        } catch (const FileReadError& e) {
            spdlog::warn("{}; synthesizing without context", e.what());
        }

        auto& file_requests = requests[path];
        file_requests.reserve(symbols.size());
        for (const auto& symbol : symbols) {
            std::string context = context_for(content, symbol);
            file_requests.push_back({symbol, synthesize_one(symbol, context)});
        }
        spdlog::debug("Synthesized {} comments for {}", file_requests.size(), path.string());
    }

    return requests;
}

RunReport Orchestrator::run(const std::filesystem::path& directory, const RunOptions& options) {
    RunReport report;
    report.analysis = analyze(directory);

    if (report.analysis.empty()) {
        spdlog::info("No undocumented functions or classes found");
        if (options.dry_run) {
            report.summary = "No undocumented functions or classes found.";
        }
        return report;
    }

    report.requests = synthesize(report.analysis);
    for (const auto& [path, file_requests] : report.requests) {
        auto& by_name = report.comments[path];
        for (const auto& request : file_requests) {
            by_name[request.symbol.name] = request.comment;
        }
    }

    if (options.dry_run) {
        report.summary = Report::dry_run_summary(report.analysis, report.comments, report_options_);
        spdlog::info("Dry run complete, {} symbols in {} files would be documented",
                     count_symbols(report.analysis), report.analysis.size());
        return report;
    }

    for (const auto& [path, file_requests] : report.requests) {
        PatchOutcome outcome = patcher_.patch_file(path, file_requests);
        if (outcome.written) {
            report.files_modified.push_back(path);
            report.symbols_documented += outcome.patched.size();
        }
        report.outcomes.push_back(std::move(outcome));
    }

    spdlog::info("Documented {} symbols in {} files",
                 report.symbols_documented, report.files_modified.size());

    if (options.publish && publisher_ && !report.files_modified.empty()) {
        try {
            report.change_url = publisher_->create_documentation_change(
                report.files_modified, report.symbols_documented);
        } catch (const std::exception& e) {
            spdlog::warn("Publishing documentation change failed: {}", e.what());
        }
        if (report.change_url) {
            spdlog::info("Documentation change created: {}", *report.change_url);
        } else {
            spdlog::warn("No documentation change was created");
        }
    }

    return report;
}

} // namespace docpatch
