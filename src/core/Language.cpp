#include "core/Language.hpp"
#include <algorithm>
#include <cctype>

// Tree-sitter C language parsers
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
}

namespace docpatch {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

}  // namespace

Language LanguageUtils::detect_from_extension(const std::filesystem::path& filepath) {
    if (filepath.empty()) {
        return Language::UNKNOWN;
    }

    std::string ext = to_lower(filepath.extension().string());
    if (ext.empty()) {
        return Language::UNKNOWN;
    }

    for (Language lang : all()) {
        auto extensions = get_extensions(lang);
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            return lang;
        }
    }

    return Language::UNKNOWN;
}

const TSLanguage* LanguageUtils::get_ts_language(Language lang) {
    switch (lang) {
        case Language::CPP:
        case Language::C:
            // C sources go through the C++ grammar
            return tree_sitter_cpp();
        case Language::PYTHON:
            return tree_sitter_python();
        default:
            return nullptr;
    }
}

std::string_view LanguageUtils::to_string(Language lang) {
    switch (lang) {
        case Language::PYTHON:
            return "python";
        case Language::JAVASCRIPT:
            return "javascript";
        case Language::TYPESCRIPT:
            return "typescript";
        case Language::JAVA:
            return "java";
        case Language::CPP:
            return "cpp";
        case Language::C:
            return "c";
        case Language::GO:
            return "go";
        case Language::RUST:
            return "rust";
        case Language::UNKNOWN:
        default:
            return "unknown";
    }
}

Language LanguageUtils::from_string(std::string_view name) {
    std::string lower_name = to_lower(name);

    if (lower_name == "python" || lower_name == "py") {
        return Language::PYTHON;
    }
    if (lower_name == "javascript" || lower_name == "js") {
        return Language::JAVASCRIPT;
    }
    if (lower_name == "typescript" || lower_name == "ts") {
        return Language::TYPESCRIPT;
    }
    if (lower_name == "java") {
        return Language::JAVA;
    }
    if (lower_name == "cpp" || lower_name == "c++" || lower_name == "cxx" ||
        lower_name == "cplusplus") {
        return Language::CPP;
    }
    if (lower_name == "c") {
        return Language::C;
    }
    if (lower_name == "go" || lower_name == "golang") {
        return Language::GO;
    }
    if (lower_name == "rust" || lower_name == "rs") {
        return Language::RUST;
    }

    return Language::UNKNOWN;
}

std::vector<std::string_view> LanguageUtils::get_extensions(Language lang) {
    switch (lang) {
        case Language::PYTHON:
            return {".py", ".pyw", ".pyi"};
        case Language::JAVASCRIPT:
            return {".js", ".jsx", ".mjs", ".cjs"};
        case Language::TYPESCRIPT:
            return {".ts", ".tsx"};
        case Language::JAVA:
            return {".java"};
        case Language::CPP:
            return {".cpp", ".cc", ".cxx", ".hpp", ".hh", ".hxx"};
        case Language::C:
            return {".c", ".h"};
        case Language::GO:
            return {".go"};
        case Language::RUST:
            return {".rs"};
        case Language::UNKNOWN:
        default:
            return {};
    }
}

const std::vector<Language>& LanguageUtils::all() {
    static const std::vector<Language> languages = {
        Language::PYTHON, Language::JAVASCRIPT, Language::TYPESCRIPT, Language::JAVA,
        Language::CPP, Language::C, Language::GO, Language::RUST
    };
    return languages;
}

}  // namespace docpatch
