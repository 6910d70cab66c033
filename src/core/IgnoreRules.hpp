#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace docpatch {

/**
 * @brief Ordered glob patterns excluding files and pruning directories
 *
 * Supported wildcards:
 *  - `*`  any run of characters inside one path segment
 *  - `**` any run of characters across segments; as a leading segment it
 *         also matches no directory at all, as a trailing segment it
 *         matches everything below
 *  - `?`  exactly one character other than '/'
 *
 * Paths are matched in generic form ('/' separators), relative to the
 * traversal root when called from a directory walk. A pattern without any
 * '/' is matched against the last path segment only, e.g. `*.min.js`.
 */
class IgnoreRuleSet {
public:
    /**
     * @brief Patterns skipped by default: dependency, VCS and build output trees
     */
    static const std::vector<std::string>& default_patterns();

    IgnoreRuleSet() = default;

    /**
     * @brief Compile a list of glob patterns
     * @param patterns Glob patterns in priority order
     */
    explicit IgnoreRuleSet(const std::vector<std::string>& patterns);

    /**
     * @brief Check whether a file path is excluded
     */
    bool matches_file(const std::filesystem::path& path) const;

    /**
     * @brief Check whether a directory and its whole subtree are excluded
     *
     * The directory is tested with a trailing '/', so a pattern that ends
     * in a `**` segment prunes the directory itself and not only its
     * children.
     */
    bool matches_directory(const std::filesystem::path& path) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

    bool empty() const { return patterns_.empty(); }

    /**
     * @brief Translate a glob pattern into an anchored regex
     */
    static std::string glob_to_regex(const std::string& pattern);

private:
    struct CompiledRule {
        std::regex pattern;
        bool basename_only;  // Pattern without '/': matched against the last segment
    };

    bool matches(const std::string& generic_path, const std::string& name) const;

    std::vector<std::string> patterns_;
    std::vector<CompiledRule> compiled_;
};

} // namespace docpatch
