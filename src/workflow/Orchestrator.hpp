#pragma once

#include "core/DocAnalyzer.hpp"
#include "core/SymbolRecord.hpp"
#include "patch/PatchApplicator.hpp"
#include "synthesis/ICommentProvider.hpp"
#include "synthesis/RuleBasedCommentProvider.hpp"
#include "workflow/Config.hpp"
#include "workflow/IChangePublisher.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docpatch {

struct RunOptions {
    bool dry_run = false;
    bool publish = false;  // Hand modified files to the publisher, if one is set
};

/**
 * @brief Everything a generate run produced
 */
struct RunReport {
    AnalysisResult analysis;
    std::map<std::filesystem::path, std::vector<PatchRequest>> requests;
    CommentMap comments;
    std::vector<PatchOutcome> outcomes;           // Empty on dry runs
    std::vector<std::filesystem::path> files_modified;
    size_t symbols_documented = 0;
    std::string summary;                          // Dry-run summary text
    std::optional<std::string> change_url;
};

/**
 * @brief Sequences analysis, comment synthesis, patching and publishing
 *
 * Collaborators are borrowed and must outlive the orchestrator. The
 * publisher is optional.
 */
class Orchestrator {
public:
    /// Lines after the definition line passed to the provider as context
    static constexpr size_t kContextLines = 10;

    Orchestrator(DocAnalyzer& analyzer,
                 ICommentProvider& provider,
                 PatchApplicator patcher,
                 ReportOptions report_options = {},
                 IChangePublisher* publisher = nullptr);

    AnalysisResult analyze(const std::filesystem::path& directory);

    /**
     * @brief Produce one comment per analyzed symbol
     *
     * Provider failures (exception or empty text) fall back to the
     * rule-based comment for that symbol.
     */
    std::map<std::filesystem::path, std::vector<PatchRequest>> synthesize(const AnalysisResult& analysis);

    /**
     * @brief Run the whole workflow on a directory
     *
     * A dry run stops after synthesis and fills RunReport::summary; no file
     * is written.
     */
    RunReport run(const std::filesystem::path& directory, const RunOptions& options = {});

    /**
     * @brief Text passed to the provider: the definition line and up to
     *        kContextLines following lines
     */
    static std::string context_for(std::string_view content, const SymbolRecord& symbol);

private:
    std::string synthesize_one(const SymbolRecord& symbol, std::string_view context);

    DocAnalyzer& analyzer_;
    ICommentProvider& provider_;
    RuleBasedCommentProvider fallback_;
    PatchApplicator patcher_;
    ReportOptions report_options_;
    IChangePublisher* publisher_;
};

} // namespace docpatch
