#pragma once

#include "core/Language.hpp"
#include "core/LanguageRegistry.hpp"
#include "patch/PatchApplicator.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace docpatch {

using json = nlohmann::json;

/**
 * @brief Limits for the comment preview in the dry-run summary
 */
struct ReportOptions {
    size_t preview_files = 3;
    size_t preview_symbols_per_file = 2;
};

/**
 * @brief Run configuration
 *
 * Every key is optional; absent keys keep the defaults below.
 *
 * @code
 * {
 *   "supported_languages": ["python", "javascript"],
 *   "ignore_patterns": ["build", "docs/generated/*"],
 *   "use_syntax_tree": true,
 *   "disabled_grammars": ["cpp"],
 *   "indent_python_class_docstrings": false,
 *   "atomic_writes": true,
 *   "preview_files": 3,
 *   "preview_symbols_per_file": 2
 * }
 * @endcode
 */
struct Config {
    std::vector<Language> supported_languages;  // Empty means all
    std::vector<std::string> ignore_patterns;
    bool use_syntax_tree = true;
    std::vector<Language> disabled_grammars;
    PatchOptions patch;
    ReportOptions report;

    Config();

    /**
     * @brief Load configuration from a JSON file
     * @throws ConfigError if the file is missing, unreadable or invalid
     */
    static Config load(const std::filesystem::path& filepath);

    /**
     * @brief Build configuration from parsed JSON
     * @throws ConfigError on unknown languages or mistyped values
     */
    static Config from_json(const json& document);

    LanguageRegistry::Options registry_options() const;
};

} // namespace docpatch
