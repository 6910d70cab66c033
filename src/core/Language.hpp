#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <vector>

// Forward declarations for tree-sitter C API
extern "C" {
    struct TSLanguage;
}

namespace docpatch {

/**
 * @brief Languages recognised by the analyzer
 */
enum class Language {
    PYTHON,
    JAVASCRIPT,
    TYPESCRIPT,
    JAVA,
    CPP,
    C,
    GO,
    RUST,
    UNKNOWN   // Unknown or unsupported language
};

/**
 * @brief Language utilities: extension classification and tree-sitter grammars
 */
class LanguageUtils {
public:
    /**
     * @brief Detect language from file extension
     *
     * @param filepath Path to the file
     * @return Language enum value (UNKNOWN if not recognized)
     */
    static Language detect_from_extension(const std::filesystem::path& filepath);

    /**
     * @brief Get the linked tree-sitter grammar for a language
     *
     * @param lang Language enum value
     * @return Pointer to TSLanguage or nullptr if no grammar is linked
     */
    static const TSLanguage* get_ts_language(Language lang);

    /**
     * @brief Convert Language enum to string name
     *
     * @param lang Language enum value
     * @return String representation (e.g., "cpp", "python", "unknown")
     */
    static std::string_view to_string(Language lang);

    /**
     * @brief Convert string to Language enum
     *
     * @param name Language name (e.g., "python", "py", "js", "c++")
     * @return Language enum value (UNKNOWN if not recognized)
     */
    static Language from_string(std::string_view name);

    /**
     * @brief Get file extensions for a language
     *
     * @param lang Language enum value
     * @return Vector of file extensions (including dot, e.g., ".py")
     */
    static std::vector<std::string_view> get_extensions(Language lang);

    /**
     * @brief All known languages, in declaration order
     */
    static const std::vector<Language>& all();
};

}  // namespace docpatch
