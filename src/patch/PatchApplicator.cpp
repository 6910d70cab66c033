#include "patch/PatchApplicator.hpp"
#include "core/Errors.hpp"
#include "core/SourceFile.hpp"
#include "core/TextLines.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace docpatch {

namespace {

constexpr std::string_view kPythonIndentStep = "    ";

// Lines after the anchor that may still hold the name (template headers,
// decorators folded into the anchor)
constexpr size_t kNameSearchLines = 4;

std::vector<std::string> comment_lines(std::string_view comment) {
    auto raw = text::split_lines(comment);
    if (raw.size() > 1 && raw.back().empty()) {
        raw.pop_back();
    }

    std::vector<std::string> lines;
    lines.reserve(raw.size());
    for (auto line : raw) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
    }
    return lines;
}

bool name_near(const std::vector<std::string_view>& lines, size_t index, std::string_view name) {
    size_t last = std::min(lines.size(), index + kNameSearchLines);
    for (size_t i = index; i < last; ++i) {
        if (lines[i].find(name) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

PatchApplicator::PatchApplicator(PatchOptions options) : options_(options) {}

std::optional<PatchApplicator::Insertion> PatchApplicator::plan(
    const std::vector<std::string_view>& lines,
    const SymbolRecord& symbol,
    std::string_view comment,
    std::string& reason
) const {
    if (symbol.line == 0 || symbol.line > lines.size()) {
        reason = "line " + std::to_string(symbol.line) + " is outside the file";
        return std::nullopt;
    }

    size_t def_index = symbol.line - 1;
    if (!name_near(lines, def_index, symbol.name)) {
        reason = "'" + symbol.name + "' not found at line " + std::to_string(symbol.line) +
                 ", record is stale";
        return std::nullopt;
    }

    std::string_view def_line = lines[def_index];
    std::string indent(text::leading_whitespace(def_line));
    bool crlf = !def_line.empty() && def_line.back() == '\r';

    Insertion insertion;
    std::string prefix;

    if (symbol.language == Language::PYTHON) {
        auto header_end = text::block_header_end(lines, def_index);
        if (!header_end) {
            reason = "no block body to hold a docstring";
            return std::nullopt;
        }
        insertion.index = *header_end + 1;

        bool indent_body = symbol.kind == SymbolKind::FUNCTION ||
                           options_.indent_python_class_docstrings;
        if (indent_body) {
            prefix = indent + std::string(kPythonIndentStep);
        }
    } else {
        insertion.index = def_index;
        prefix = indent;
    }

    for (auto& line : comment_lines(comment)) {
        std::string inserted = text::trim(line).empty() ? std::string() : prefix + line;
        if (crlf) {
            inserted += '\r';
        }
        insertion.lines.push_back(std::move(inserted));
    }

    return insertion;
}

std::optional<std::string> PatchApplicator::apply(std::string_view content,
                                                  const SymbolRecord& symbol,
                                                  std::string_view comment) const {
    PatchOutcome outcome;
    std::string patched = apply_all(content, {PatchRequest{symbol, std::string(comment)}}, outcome);
    if (outcome.patched.empty()) {
        return std::nullopt;
    }
    return patched;
}

std::string PatchApplicator::apply_all(std::string_view content,
                                       const std::vector<PatchRequest>& requests,
                                       PatchOutcome& outcome) const {
    auto original = text::split_lines(content);

    struct Planned {
        size_t order;
        Insertion insertion;
    };
    std::vector<Planned> planned;
    std::set<size_t> claimed_lines;

    for (size_t i = 0; i < requests.size(); ++i) {
        const auto& request = requests[i];

        // Overlapping regex rules report one definition several times
        if (claimed_lines.count(request.symbol.line)) {
            outcome.unpatched.push_back({request.symbol, "another symbol was already patched at this line"});
            continue;
        }

        std::string reason;
        auto insertion = plan(original, request.symbol, request.comment, reason);
        if (!insertion) {
            spdlog::warn("Not patching {} in {}: {}", request.symbol.name,
                         request.symbol.source_file.string(), reason);
            outcome.unpatched.push_back({request.symbol, reason});
            continue;
        }

        claimed_lines.insert(request.symbol.line);
        planned.push_back({i, std::move(*insertion)});
        outcome.patched.push_back(request.symbol);
    }

    // Bottom-up; at equal positions the later request goes in first so the
    // earlier one ends up above it
    std::sort(planned.begin(), planned.end(), [](const Planned& a, const Planned& b) {
        if (a.insertion.index != b.insertion.index) {
            return a.insertion.index > b.insertion.index;
        }
        return a.order > b.order;
    });

    std::vector<std::string> lines(original.begin(), original.end());
    for (const auto& entry : planned) {
        const auto& insertion = entry.insertion;
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(insertion.index),
                     insertion.lines.begin(), insertion.lines.end());
    }

    return text::join_lines(lines);
}

PatchOutcome PatchApplicator::patch_file(const std::filesystem::path& filepath,
                                         const std::vector<PatchRequest>& requests) const {
    PatchOutcome outcome;
    outcome.file = filepath;

    auto fail_all = [&](const std::string& reason) {
        for (const auto& request : requests) {
            outcome.unpatched.push_back({request.symbol, reason});
        }
    };

    std::string content;
    try {
        content = SourceFile::read(filepath);
    } catch (const FileReadError& e) {
        spdlog::error("{}", e.what());
        fail_all(e.what());
        return outcome;
    }

    std::string patched = apply_all(content, requests, outcome);
    if (outcome.patched.empty()) {
        return outcome;
    }

    try {
        SourceFile::write(filepath, patched, options_.atomic_writes);
        outcome.written = true;
    } catch (const FileWriteError& e) {
        spdlog::error("{}", e.what());
        for (const auto& symbol : outcome.patched) {
            outcome.unpatched.push_back({symbol, e.what()});
        }
        outcome.patched.clear();
        return outcome;
    }

    spdlog::info("Documented {} symbols in {}", outcome.patched.size(), filepath.string());
    return outcome;
}

} // namespace docpatch
