#include "core/SourceFile.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace docpatch {

namespace {

void write_stream(const std::filesystem::path& filepath, std::string_view content,
                  bool remove_on_failure = false) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw FileWriteError(filepath, "cannot open for writing");
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        file.close();
        if (remove_on_failure) {
            std::error_code ec;
            std::filesystem::remove(filepath, ec);
        }
        throw FileWriteError(filepath, "write failed");
    }
}

}  // namespace

std::string SourceFile::read(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw FileReadError(filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileReadError(filepath);
    }

    return buffer.str();
}

void SourceFile::write(const std::filesystem::path& filepath,
                       std::string_view content,
                       bool atomic) {
    if (!atomic) {
        write_stream(filepath, content);
        spdlog::debug("Rewrote {} ({} bytes)", filepath.string(), content.size());
        return;
    }

    std::error_code ec;
    std::filesystem::path target = std::filesystem::weakly_canonical(filepath, ec);
    if (ec) {
        throw FileWriteError(filepath, ec.message());
    }

    // Renaming over one name would detach it from the other links
    if (std::filesystem::hard_link_count(target, ec) > 1 && !ec) {
        write_stream(target, content);
        spdlog::debug("Rewrote hard-linked {} in place ({} bytes)", target.string(), content.size());
        return;
    }
    ec.clear();

    std::filesystem::path temp_path = target;
    temp_path += ".docpatch.tmp";

    write_stream(temp_path, content, true);

    auto original_perms = std::filesystem::status(target, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(temp_path, original_perms, ec);
    }
    if (ec) {
        spdlog::debug("Keeping default permissions for {}: {}", target.string(), ec.message());
        ec.clear();
    }

    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        throw FileWriteError(filepath, ec.message());
    }

    spdlog::debug("Replaced {} ({} bytes)", target.string(), content.size());
}

} // namespace docpatch
