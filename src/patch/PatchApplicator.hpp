#pragma once

#include "core/SymbolRecord.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

/**
 * @brief Placement switches for inserted comments
 */
struct PatchOptions {
    /// Python class docstrings are inserted verbatim by default, while
    /// function docstrings get body indentation; set to indent both.
    bool indent_python_class_docstrings = false;

    /// Write through a temporary file renamed over the original
    bool atomic_writes = true;
};

/**
 * @brief A comment to insert for one analyzed symbol
 */
struct PatchRequest {
    SymbolRecord symbol;
    std::string comment;
};

struct UnpatchedSymbol {
    SymbolRecord symbol;
    std::string reason;
};

/**
 * @brief What happened to the requests for one file
 */
struct PatchOutcome {
    std::filesystem::path file;
    std::vector<SymbolRecord> patched;
    std::vector<UnpatchedSymbol> unpatched;
    bool written = false;
};

/**
 * @brief Inserts comments next to definitions and persists the result
 *
 * Placement:
 *  - Python functions: after the definition header, indented one level
 *    (4 spaces) deeper than the definition.
 *  - Python classes: after the definition header, verbatim unless
 *    PatchOptions::indent_python_class_docstrings is set.
 *  - Python one-liners and stubs (`def f(): ...`) have no block body and
 *    are reported unpatched.
 *  - Everything else: before the definition line, at its indentation.
 *
 * All insertions of a batch are planned against the original content and
 * applied bottom-up, so earlier insertions never shift later targets.
 */
class PatchApplicator {
public:
    explicit PatchApplicator(PatchOptions options = {});

    /**
     * @brief Insert one comment into content
     * @return Patched content, or nullopt if the record does not fit the
     *         content (line out of range or name not found near it)
     */
    std::optional<std::string> apply(std::string_view content,
                                     const SymbolRecord& symbol,
                                     std::string_view comment) const;

    /**
     * @brief Insert a batch of comments into content
     * @param content Content the records were produced from
     * @param requests Comments to insert, in any order
     * @param outcome Receives patched and unpatched symbols
     * @return Patched content
     */
    std::string apply_all(std::string_view content,
                          const std::vector<PatchRequest>& requests,
                          PatchOutcome& outcome) const;

    /**
     * @brief Load a file, insert a batch of comments and write it back
     *
     * Read and write failures are logged and reported through the outcome;
     * they never throw.
     */
    PatchOutcome patch_file(const std::filesystem::path& filepath,
                            const std::vector<PatchRequest>& requests) const;

    const PatchOptions& options() const { return options_; }

private:
    struct Insertion {
        size_t index;                    // Line index the comment is inserted at
        std::vector<std::string> lines;  // Lines to insert, fully indented
    };

    std::optional<Insertion> plan(const std::vector<std::string_view>& lines,
                                  const SymbolRecord& symbol,
                                  std::string_view comment,
                                  std::string& reason) const;

    PatchOptions options_;
};

} // namespace docpatch
