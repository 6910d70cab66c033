#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace docpatch {

/**
 * @brief Abstract interface for handing patched files to version control
 *
 * Implementations commit the files and open a change for review
 * (pull request, merge request, etc.)
 */
class IChangePublisher {
public:
    virtual ~IChangePublisher() = default;

    /**
     * @brief Publish the files modified by a documentation run
     * @param files_modified Files rewritten by the patcher
     * @param symbol_count Number of symbols documented across those files
     * @return URL of the created change, or nullopt on failure
     */
    virtual std::optional<std::string> create_documentation_change(
        const std::vector<std::filesystem::path>& files_modified,
        size_t symbol_count) = 0;
};

} // namespace docpatch
