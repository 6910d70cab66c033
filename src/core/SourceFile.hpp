#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace docpatch {

/**
 * @brief Whole-file load and rewrite of source text
 */
class SourceFile {
public:
    /**
     * @brief Read the full content of a file
     * @param filepath File to read
     * @return File content, byte for byte
     * @throws FileReadError if the file cannot be opened or read
     */
    static std::string read(const std::filesystem::path& filepath);

    /**
     * @brief Replace the content of a file
     *
     * With @p atomic set, content goes to a sibling temporary file that is
     * then renamed over the target, so a crash never leaves a half-written
     * source file behind. Symlinks are followed, and the file they point to
     * is replaced. Files with several hard links are rewritten in place.
     *
     * @param filepath File to rewrite
     * @param content New content
     * @param atomic Write through a temporary file and rename
     * @throws FileWriteError on any I/O failure
     */
    static void write(const std::filesystem::path& filepath,
                      std::string_view content,
                      bool atomic = true);
};

} // namespace docpatch
