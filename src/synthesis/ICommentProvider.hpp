#pragma once

#include "core/Language.hpp"
#include "core/SymbolRecord.hpp"
#include <string>
#include <string_view>

namespace docpatch {

/**
 * @brief Abstract interface for comment text generators
 *
 * Implementations turn symbol metadata into comment text ready for
 * insertion (rule-based templates, inference services, etc.)
 */
class ICommentProvider {
public:
    virtual ~ICommentProvider() = default;

    /**
     * @brief Produce a comment for an undocumented symbol
     * @param symbol Symbol to document
     * @param lang Language of the file holding the symbol
     * @param context Definition line and up to 10 following lines
     * @return Comment text, unindented; never empty
     * @throws SynthesisError if no text can be produced
     */
    virtual std::string synthesize(const SymbolRecord& symbol,
                                   Language lang,
                                   std::string_view context) = 0;
};

} // namespace docpatch
