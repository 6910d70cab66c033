#pragma once

#include "core/SymbolRecord.hpp"
#include "patch/PatchApplicator.hpp"
#include "workflow/Config.hpp"
#include <string>
#include <vector>

namespace docpatch {

/**
 * @brief Human-readable renderings of analysis and patch results
 */
class Report {
public:
    /**
     * @brief Summary of what a generate run would change
     *
     * Lists each file with a comment for at least one of its symbols, the
     * totals, and a preview of the first comments.
     */
    static std::string dry_run_summary(const AnalysisResult& analysis,
                                       const CommentMap& comments,
                                       const ReportOptions& options = {});

    /**
     * @brief One line per undocumented symbol: file:line kind name
     */
    static std::string analysis_listing(const AnalysisResult& analysis);

    /**
     * @brief Totals of a patch run, plus the symbols left unpatched
     */
    static std::string patch_summary(const std::vector<PatchOutcome>& outcomes);
};

} // namespace docpatch
