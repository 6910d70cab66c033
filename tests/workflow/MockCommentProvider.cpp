#include "MockCommentProvider.hpp"
#include "core/Errors.hpp"

namespace docpatch {

MockCommentProvider::MockCommentProvider(std::string reply) : reply_(std::move(reply)) {}

std::string MockCommentProvider::synthesize(const SymbolRecord& symbol,
                                            Language lang,
                                            std::string_view context) {
    calls_.push_back({symbol.name, lang, std::string(context)});

    if (mode_ == Mode::Fail || (!fail_name_.empty() && symbol.name == fail_name_)) {
        throw SynthesisError("provider unavailable");
    }
    if (mode_ == Mode::Empty) {
        return {};
    }
    return reply_;
}

} // namespace docpatch
