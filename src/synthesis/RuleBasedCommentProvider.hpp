#pragma once

#include "synthesis/ICommentProvider.hpp"
#include <string>
#include <string_view>

namespace docpatch {

/**
 * @brief Template comments derived from the symbol name alone
 *
 * Works offline and never fails, which makes it the fallback for every
 * other provider. Python docstrings come back unindented; the patcher
 * indents them into the body.
 */
class RuleBasedCommentProvider : public ICommentProvider {
public:
    std::string synthesize(const SymbolRecord& symbol,
                           Language lang,
                           std::string_view context) override;

    /**
     * @brief Turn an identifier into a sentence
     *
     * "calculateSum" -> "Calculate sum", "parse_file" -> "Parse file"
     */
    static std::string to_sentence(std::string_view identifier);
};

} // namespace docpatch
