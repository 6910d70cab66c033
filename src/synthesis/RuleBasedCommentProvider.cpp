#include "synthesis/RuleBasedCommentProvider.hpp"
#include <cctype>

namespace docpatch {

namespace {

bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }

}  // namespace

std::string RuleBasedCommentProvider::to_sentence(std::string_view identifier) {
    std::string sentence;
    sentence.reserve(identifier.size() + 8);

    for (size_t i = 0; i < identifier.size(); ++i) {
        char c = identifier[i];
        if (c == '_') {
            if (!sentence.empty() && sentence.back() != ' ') {
                sentence += ' ';
            }
            continue;
        }
        if (i > 0 && is_upper(c) && is_lower(identifier[i - 1])) {
            sentence += ' ';
        }
        sentence += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    while (!sentence.empty() && sentence.back() == ' ') {
        sentence.pop_back();
    }
    if (sentence.empty()) {
        return std::string(identifier);
    }

    sentence[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(sentence[0])));
    return sentence;
}

std::string RuleBasedCommentProvider::synthesize(const SymbolRecord& symbol,
                                                 Language lang,
                                                 std::string_view /*context*/) {
    const std::string summary = to_sentence(symbol.name);
    const bool is_function = symbol.kind == SymbolKind::FUNCTION;

    switch (lang) {
        case Language::PYTHON:
            if (is_function) {
                return "\"\"\"\n" + summary + ".\n"
                       "\n"
                       "Args:\n"
                       "    Describe the parameters.\n"
                       "\n"
                       "Returns:\n"
                       "    Describe the return value.\n"
                       "\"\"\"";
            }
            return "\"\"\"\n" + summary + " class.\n"
                   "\n"
                   "Describe the class.\n"
                   "\"\"\"";

        case Language::JAVASCRIPT:
        case Language::TYPESCRIPT:
            if (is_function) {
                return "/**\n"
                       " * " + summary + "\n"
                       " *\n"
                       " * @param {} Describe the parameters.\n"
                       " * @returns {} Describe the return value.\n"
                       " */";
            }
            return "/**\n"
                   " * " + summary + " class\n"
                   " */";

        case Language::JAVA:
        case Language::CPP:
        case Language::C:
            if (is_function) {
                return "/**\n"
                       " * " + summary + "\n"
                       " *\n"
                       " * @param Describe the parameters.\n"
                       " * @return Describe the return value.\n"
                       " */";
            }
            return "/**\n"
                   " * " + summary + " class\n"
                   " */";

        case Language::GO:
            return "// " + summary + ".";

        case Language::RUST:
            return "/// " + summary + ".";

        case Language::UNKNOWN:
            break;
    }

    return "// " + summary;
}

} // namespace docpatch
