#include "core/SymbolRecord.hpp"

namespace docpatch {

std::string_view to_string(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::CLASS:
            return "class";
        case SymbolKind::FUNCTION:
        default:
            return "function";
    }
}

json to_json(const SymbolRecord& symbol) {
    return {
        {"name", symbol.name},
        {"type", std::string(to_string(symbol.kind))},
        {"file", symbol.source_file.string()},
        {"line", symbol.line},
        {"position", symbol.offset},
        {"language", std::string(LanguageUtils::to_string(symbol.language))}
    };
}

json to_json(const AnalysisResult& result) {
    json files = json::object();

    for (const auto& [path, symbols] : result) {
        json entries = json::array();
        for (const auto& symbol : symbols) {
            entries.push_back(to_json(symbol));
        }
        files[path.string()] = entries;
    }

    return files;
}

json to_json(const CommentMap& comments) {
    json files = json::object();

    for (const auto& [path, by_name] : comments) {
        json entries = json::object();
        for (const auto& [name, text] : by_name) {
            entries[name] = text;
        }
        files[path.string()] = entries;
    }

    return files;
}

size_t count_symbols(const AnalysisResult& result) {
    size_t total = 0;
    for (const auto& entry : result) {
        total += entry.second.size();
    }
    return total;
}

} // namespace docpatch
