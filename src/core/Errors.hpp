#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace docpatch {

/**
 * @brief Invalid or unreadable configuration; fatal at startup
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A source file could not be read
 */
class FileReadError : public std::runtime_error {
public:
    explicit FileReadError(const std::filesystem::path& path)
        : std::runtime_error("Failed to read file: " + path.string()) {}
};

/**
 * @brief A source file could not be written back
 */
class FileWriteError : public std::runtime_error {
public:
    FileWriteError(const std::filesystem::path& path, const std::string& reason)
        : std::runtime_error("Failed to write file " + path.string() + ": " + reason) {}
};

/**
 * @brief The comment provider could not produce text for a symbol
 */
class SynthesisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace docpatch
