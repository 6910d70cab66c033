#include "workflow/Report.hpp"
#include <iomanip>
#include <sstream>

namespace docpatch {

std::string Report::dry_run_summary(const AnalysisResult& analysis,
                                    const CommentMap& comments,
                                    const ReportOptions& options) {
    std::ostringstream out;
    out << "docpatch Dry Run Summary\n"
        << std::string(50, '=') << "\n\n";

    size_t total_files = 0;
    size_t total_symbols = 0;

    for (const auto& [path, symbols] : analysis) {
        auto file_comments = comments.find(path);
        if (file_comments == comments.end()) {
            continue;
        }

        std::vector<const SymbolRecord*> commented;
        for (const auto& symbol : symbols) {
            if (file_comments->second.count(symbol.name)) {
                commented.push_back(&symbol);
            }
        }
        if (commented.empty()) {
            continue;
        }

        ++total_files;
        total_symbols += commented.size();

        out << path.string() << "\n";
        for (const auto* symbol : commented) {
            out << "  - " << to_string(symbol->kind) << ": " << symbol->name << "\n";
        }
        out << "\n";
    }

    out << "Total files to modify: " << total_files << "\n"
        << "Total functions/classes to document: " << total_symbols << "\n"
        << "\n"
        << "Generated comments preview:\n"
        << std::string(30, '-') << "\n";

    size_t previewed_files = 0;
    for (const auto& [path, symbols] : analysis) {
        if (previewed_files >= options.preview_files) {
            break;
        }
        auto file_comments = comments.find(path);
        if (file_comments == comments.end()) {
            continue;
        }

        size_t shown = 0;
        for (const auto& symbol : symbols) {
            if (shown >= options.preview_symbols_per_file) {
                break;
            }
            auto comment = file_comments->second.find(symbol.name);
            if (comment == file_comments->second.end()) {
                continue;
            }
            out << "\n" << symbol.name << ":\n" << comment->second << "\n";
            ++shown;
        }
        if (shown > 0) {
            ++previewed_files;
        }
    }

    return out.str();
}

std::string Report::analysis_listing(const AnalysisResult& analysis) {
    if (analysis.empty()) {
        return "No undocumented functions or classes found.\n";
    }

    std::ostringstream out;
    for (const auto& [path, symbols] : analysis) {
        for (const auto& symbol : symbols) {
            out << path.string() << ":" << symbol.line << "  "
                << std::left << std::setw(8) << to_string(symbol.kind) << " "
                << symbol.name << "\n";
        }
    }
    out << "\n" << count_symbols(analysis) << " undocumented symbols in "
        << analysis.size() << " files\n";
    return out.str();
}

std::string Report::patch_summary(const std::vector<PatchOutcome>& outcomes) {
    size_t files_written = 0;
    size_t patched = 0;
    std::ostringstream skipped;

    for (const auto& outcome : outcomes) {
        if (outcome.written) {
            ++files_written;
        }
        patched += outcome.patched.size();
        for (const auto& entry : outcome.unpatched) {
            skipped << "  - " << outcome.file.string() << ":" << entry.symbol.line << " "
                    << entry.symbol.name << ": " << entry.reason << "\n";
        }
    }

    std::ostringstream summary;
    summary << "Documented " << patched << " symbols in " << files_written << " files\n";
    if (!skipped.str().empty()) {
        summary << "Not documented:\n" << skipped.str();
    }
    return summary.str();
}

} // namespace docpatch
