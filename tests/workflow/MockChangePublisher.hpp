#pragma once

#include "workflow/IChangePublisher.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace docpatch {

/**
 * @brief Records publish requests instead of talking to a VCS host
 */
class MockChangePublisher : public IChangePublisher {
public:
    std::optional<std::string> create_documentation_change(
        const std::vector<std::filesystem::path>& files_modified,
        size_t symbol_count) override;

    void set_url(std::optional<std::string> url) { url_ = std::move(url); }

    void set_throws(bool throws) { throws_ = throws; }

    size_t call_count() const { return call_count_; }

    const std::vector<std::filesystem::path>& last_files() const { return last_files_; }

    size_t last_symbol_count() const { return last_symbol_count_; }

private:
    std::optional<std::string> url_ = std::string("https://example.invalid/changes/1");
    bool throws_ = false;
    size_t call_count_ = 0;
    std::vector<std::filesystem::path> last_files_;
    size_t last_symbol_count_ = 0;
};

} // namespace docpatch
