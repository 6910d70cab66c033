#include "workflow/Config.hpp"
#include "core/Errors.hpp"
#include "core/IgnoreRules.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace docpatch {

namespace {

std::vector<Language> parse_languages(const json& document, const char* key) {
    std::vector<Language> languages;
    if (!document.contains(key)) {
        return languages;
    }

    const json& names = document.at(key);
    if (!names.is_array()) {
        throw ConfigError(std::string(key) + " must be an array of language names");
    }

    for (const auto& name : names) {
        if (!name.is_string()) {
            throw ConfigError(std::string(key) + " must be an array of language names");
        }
        Language lang = LanguageUtils::from_string(name.get<std::string>());
        if (lang == Language::UNKNOWN) {
            throw ConfigError("Unknown language in " + std::string(key) + ": " +
                              name.get<std::string>());
        }
        languages.push_back(lang);
    }
    return languages;
}

template <typename T>
void read_value(const json& document, const char* key, T& target) {
    if (!document.contains(key)) {
        return;
    }
    try {
        target = document.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for ") + key + ": " + e.what());
    }
}

}  // namespace

Config::Config() : ignore_patterns(IgnoreRuleSet::default_patterns()) {}

Config Config::load(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + filepath.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed config file " + filepath.string() + ": " + e.what());
    }

    spdlog::debug("Loaded config from {}", filepath.string());
    return from_json(document);
}

Config Config::from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    Config config;
    config.supported_languages = parse_languages(document, "supported_languages");
    config.disabled_grammars = parse_languages(document, "disabled_grammars");

    read_value(document, "ignore_patterns", config.ignore_patterns);
    read_value(document, "use_syntax_tree", config.use_syntax_tree);
    read_value(document, "indent_python_class_docstrings", config.patch.indent_python_class_docstrings);
    read_value(document, "atomic_writes", config.patch.atomic_writes);
    read_value(document, "preview_files", config.report.preview_files);
    read_value(document, "preview_symbols_per_file", config.report.preview_symbols_per_file);

    return config;
}

LanguageRegistry::Options Config::registry_options() const {
    LanguageRegistry::Options options;
    options.use_syntax_tree = use_syntax_tree;
    options.disabled_grammars.insert(disabled_grammars.begin(), disabled_grammars.end());
    options.languages = supported_languages;
    return options;
}

} // namespace docpatch
