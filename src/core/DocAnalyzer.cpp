#include "core/DocAnalyzer.hpp"
#include "core/Errors.hpp"
#include "core/SourceFile.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace docpatch {

DocAnalyzer::DocAnalyzer(const LanguageRegistry& registry, IgnoreRuleSet ignore_rules)
    : registry_(registry),
      ignore_rules_(std::move(ignore_rules)),
      tree_engine_(registry),
      regex_engine_() {
    spdlog::debug("DocAnalyzer created");
}

std::vector<SymbolRecord> DocAnalyzer::analyze_file(const std::filesystem::path& filepath) {
    if (ignore_rules_.matches_file(filepath)) {
        spdlog::debug("Ignoring {}", filepath.string());
        return {};
    }
    return analyze_path(filepath);
}

std::vector<SymbolRecord> DocAnalyzer::analyze_path(const std::filesystem::path& filepath) {
    Language lang = LanguageUtils::detect_from_extension(filepath);
    if (!registry_.supports(lang)) {
        spdlog::trace("Skipping unsupported file {}", filepath.string());
        return {};
    }

    std::string content;
    try {
        content = SourceFile::read(filepath);
    } catch (const FileReadError& e) {
        spdlog::warn("{}", e.what());
        return {};
    }

    return analyze_source(content, lang, filepath);
}

std::vector<SymbolRecord> DocAnalyzer::analyze_source(std::string_view content,
                                                      Language lang,
                                                      const std::filesystem::path& filepath) {
    const LanguageSupport* support = registry_.find(lang);
    if (!support) {
        return {};
    }

    if (tree_engine_.can_parse(lang)) {
        auto symbols = tree_engine_.analyze(*support, content, filepath);
        if (symbols) {
            return std::move(*symbols);
        }
        spdlog::warn("Syntax tree analysis failed for {}, using regex analysis",
                     filepath.string());
    }

    return regex_engine_.analyze(*support, content, filepath);
}

AnalysisResult DocAnalyzer::analyze_directory(const std::filesystem::path& directory) {
    AnalysisResult results;

    std::error_code ec;
    if (std::filesystem::is_regular_file(directory, ec)) {
        auto symbols = analyze_file(directory);
        if (!symbols.empty()) {
            results.emplace(directory, std::move(symbols));
        }
        return results;
    }

    if (!std::filesystem::is_directory(directory, ec)) {
        spdlog::warn("Path is not a directory: {}", directory.string());
        return results;
    }

    std::filesystem::recursive_directory_iterator it(
        directory, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::error("Error scanning directory {}: {}", directory.string(), ec.message());
        return results;
    }

    size_t scanned = 0;
    size_t pruned = 0;
    const std::filesystem::recursive_directory_iterator end;

    while (it != end) {
        const auto& entry = *it;
        std::filesystem::path relative = entry.path().lexically_relative(directory);

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (ignore_rules_.matches_directory(relative)) {
                spdlog::debug("Pruning ignored directory {}", relative.string());
                it.disable_recursion_pending();
                ++pruned;
            }
        } else if (entry.is_regular_file(type_ec)) {
            if (!ignore_rules_.matches_file(relative)) {
                ++scanned;
                auto symbols = analyze_path(entry.path());
                if (!symbols.empty()) {
                    results.emplace(entry.path(), std::move(symbols));
                }
            }
        }

        it.increment(ec);
        if (ec) {
            spdlog::warn("Stopped scanning {} early: {}", directory.string(), ec.message());
            break;
        }
    }

    spdlog::info("Analyzed {} files under {} ({} directories pruned), {} with undocumented symbols",
                 scanned, directory.string(), pruned, results.size());
    return results;
}

} // namespace docpatch
