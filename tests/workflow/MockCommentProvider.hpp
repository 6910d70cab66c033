#pragma once

#include "synthesis/ICommentProvider.hpp"
#include <string>
#include <vector>

namespace docpatch {

/**
 * @brief Scripted comment provider for testing the orchestrator
 *
 * Returns a fixed reply, an empty reply, or throws SynthesisError, and
 * records every call.
 */
class MockCommentProvider : public ICommentProvider {
public:
    enum class Mode {
        Reply,
        Empty,
        Fail
    };

    struct Call {
        std::string name;
        Language lang;
        std::string context;
    };

    explicit MockCommentProvider(std::string reply = "// Generated");

    std::string synthesize(const SymbolRecord& symbol,
                           Language lang,
                           std::string_view context) override;

    void set_mode(Mode mode) { mode_ = mode; }

    /// Fail only for this symbol name; other symbols get the reply
    void fail_for(std::string name) { fail_name_ = std::move(name); }

    const std::vector<Call>& calls() const { return calls_; }

private:
    std::string reply_;
    Mode mode_ = Mode::Reply;
    std::string fail_name_;
    std::vector<Call> calls_;
};

} // namespace docpatch
