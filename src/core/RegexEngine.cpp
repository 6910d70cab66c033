#include "core/RegexEngine.hpp"
#include "core/DocPresence.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>

namespace docpatch {

std::vector<SymbolRecord> RegexEngine::analyze(const LanguageSupport& support,
                                               std::string_view content,
                                               const std::filesystem::path& filepath) const {
    std::vector<SymbolRecord> undocumented;

    for (const auto& rule : support.regex_rules) {
        auto begin = std::regex_iterator<std::string_view::const_iterator>(
            content.begin(), content.end(), rule.pattern);
        auto end = std::regex_iterator<std::string_view::const_iterator>();

        for (auto it = begin; it != end; ++it) {
            const auto& match = *it;
            std::string name = match[1].str();
            if (name.empty() || support.reserved_words.count(name)) {
                continue;
            }

            auto offset = static_cast<size_t>(match.position(0));
            if (DocPresence::is_documented(content, offset, support.language)) {
                continue;
            }

            SymbolRecord record;
            record.name = std::move(name);
            record.kind = rule.kind;
            record.source_file = filepath;
            record.offset = offset;
            record.line = static_cast<size_t>(
                std::count(content.begin(), content.begin() + offset, '\n')) + 1;
            record.language = support.language;
            undocumented.push_back(std::move(record));
        }
    }

    spdlog::debug("Regex analysis of {} found {} undocumented symbols",
                  filepath.string(), undocumented.size());
    return undocumented;
}

} // namespace docpatch
