#include "core/IgnoreRules.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace docpatch {

namespace {

std::string normalize(const std::filesystem::path& path) {
    std::string generic = path.generic_string();
    while (generic.rfind("./", 0) == 0) {
        generic.erase(0, 2);
    }
    while (generic.size() > 1 && generic.back() == '/') {
        generic.pop_back();
    }
    return generic;
}

std::string last_segment(const std::string& generic) {
    size_t slash = generic.rfind('/');
    return slash == std::string::npos ? generic : generic.substr(slash + 1);
}

}  // namespace

const std::vector<std::string>& IgnoreRuleSet::default_patterns() {
    static const std::vector<std::string> patterns = {
        "**/node_modules/**",
        "**/venv/**",
        "**/env/**",
        "**/.git/**",
        "**/__pycache__/**",
        "**/target/**",
        "**/build/**",
        "**/dist/**"
    };
    return patterns;
}

IgnoreRuleSet::IgnoreRuleSet(const std::vector<std::string>& patterns)
    : patterns_(patterns) {
    compiled_.reserve(patterns_.size());

    for (const auto& pattern : patterns_) {
        CompiledRule rule{std::regex(glob_to_regex(pattern)),
                          pattern.find('/') == std::string::npos};
        compiled_.push_back(std::move(rule));
    }

    spdlog::debug("Compiled {} ignore patterns", compiled_.size());
}

std::string IgnoreRuleSet::glob_to_regex(const std::string& pattern) {
    static const std::string special = R"(\^$.|+()[]{})";

    std::string regex = "^";
    size_t i = 0;

    while (i < pattern.size()) {
        char c = pattern[i];
        bool segment_start = (i == 0 || pattern[i - 1] == '/');

        if (c == '/' && pattern.compare(i, std::string::npos, "/**") == 0) {
            // Trailing "/**": the directory itself or anything below it
            regex += "(?:/.*)?";
            i += 3;
        } else if (c == '*' && i + 1 < pattern.size() && pattern[i + 1] == '*') {
            if (segment_start && i + 2 < pattern.size() && pattern[i + 2] == '/') {
                // Leading "**/": zero or more directories
                regex += "(?:.*/)?";
                i += 3;
            } else {
                regex += ".*";
                i += 2;
            }
        } else if (c == '*') {
            regex += "[^/]*";
            ++i;
        } else if (c == '?') {
            regex += "[^/]";
            ++i;
        } else {
            if (special.find(c) != std::string::npos) {
                regex += '\\';
            }
            regex += c;
            ++i;
        }
    }

    regex += "$";
    return regex;
}

bool IgnoreRuleSet::matches(const std::string& generic_path, const std::string& name) const {
    return std::any_of(compiled_.begin(), compiled_.end(), [&](const CompiledRule& rule) {
        return std::regex_match(rule.basename_only ? name : generic_path, rule.pattern);
    });
}

bool IgnoreRuleSet::matches_file(const std::filesystem::path& path) const {
    if (compiled_.empty()) {
        return false;
    }
    std::string generic = normalize(path);
    return matches(generic, last_segment(generic));
}

bool IgnoreRuleSet::matches_directory(const std::filesystem::path& path) const {
    if (compiled_.empty()) {
        return false;
    }
    std::string generic = normalize(path);
    return matches(generic + "/", last_segment(generic));
}

} // namespace docpatch
