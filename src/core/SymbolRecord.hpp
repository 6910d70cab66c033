#pragma once

#include "core/Language.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

using json = nlohmann::json;

/**
 * @brief Kind of a discovered definition
 */
enum class SymbolKind {
    FUNCTION,  // Functions and methods
    CLASS      // Classes, structs, interfaces, traits
};

std::string_view to_string(SymbolKind kind);

/**
 * @brief An undocumented definition found by analysis
 *
 * Positions refer to the file content as it was analyzed; a record goes
 * stale as soon as that file is rewritten.
 */
struct SymbolRecord {
    std::string name;
    SymbolKind kind = SymbolKind::FUNCTION;
    std::filesystem::path source_file;
    size_t line = 0;    // 1-based
    size_t offset = 0;  // byte offset of the definition start
    Language language = Language::UNKNOWN;
};

/**
 * @brief File path -> undocumented symbols in discovery order
 */
using AnalysisResult = std::map<std::filesystem::path, std::vector<SymbolRecord>>;

/**
 * @brief File path -> symbol name -> comment text
 */
using CommentMap = std::map<std::filesystem::path, std::map<std::string, std::string>>;

json to_json(const SymbolRecord& symbol);
json to_json(const AnalysisResult& result);
json to_json(const CommentMap& comments);

/**
 * @brief Total number of records across all files
 */
size_t count_symbols(const AnalysisResult& result);

} // namespace docpatch
