#include <gtest/gtest.h>
#include "synthesis/RuleBasedCommentProvider.hpp"
#include "core/TextLines.hpp"

using namespace docpatch;

namespace {

SymbolRecord symbol(const std::string& name, SymbolKind kind, Language lang) {
    SymbolRecord record;
    record.name = name;
    record.kind = kind;
    record.language = lang;
    record.line = 1;
    return record;
}

}  // namespace

TEST(RuleBasedCommentProviderTest, IdentifierToSentence) {
    EXPECT_EQ(RuleBasedCommentProvider::to_sentence("calculateSum"), "Calculate sum");
    EXPECT_EQ(RuleBasedCommentProvider::to_sentence("calculate_sum"), "Calculate sum");
    EXPECT_EQ(RuleBasedCommentProvider::to_sentence("DataProcessor"), "Data processor");
    EXPECT_EQ(RuleBasedCommentProvider::to_sentence("__init__"), "Init");
    EXPECT_EQ(RuleBasedCommentProvider::to_sentence("x"), "X");
}

TEST(RuleBasedCommentProviderTest, PythonDocstringIsUnindented) {
    RuleBasedCommentProvider provider;
    std::string comment = provider.synthesize(
        symbol("calculate_sum", SymbolKind::FUNCTION, Language::PYTHON), Language::PYTHON, "");

    auto lines = text::split_lines(comment);
    ASSERT_GE(lines.size(), 3u);
    EXPECT_EQ(lines.front(), "\"\"\"");
    EXPECT_EQ(lines[1], "Calculate sum.");
    EXPECT_EQ(lines.back(), "\"\"\"");
}

TEST(RuleBasedCommentProviderTest, PythonClassDocstring) {
    RuleBasedCommentProvider provider;
    std::string comment = provider.synthesize(
        symbol("DataProcessor", SymbolKind::CLASS, Language::PYTHON), Language::PYTHON, "");

    EXPECT_NE(comment.find("Data processor class."), std::string::npos);
}

TEST(RuleBasedCommentProviderTest, BlockCommentForCFamily) {
    RuleBasedCommentProvider provider;
    for (Language lang : {Language::JAVASCRIPT, Language::TYPESCRIPT, Language::JAVA,
                          Language::CPP, Language::C}) {
        std::string comment = provider.synthesize(
            symbol("applyDiscount", SymbolKind::FUNCTION, lang), lang, "");

        EXPECT_EQ(comment.rfind("/**\n * Apply discount\n", 0), 0u) << LanguageUtils::to_string(lang);
        EXPECT_EQ(comment.substr(comment.size() - 3), " */") << LanguageUtils::to_string(lang);
    }
}

TEST(RuleBasedCommentProviderTest, LineCommentsForGoAndRust) {
    RuleBasedCommentProvider provider;

    EXPECT_EQ(provider.synthesize(symbol("totalPrice", SymbolKind::FUNCTION, Language::GO),
                                  Language::GO, ""),
              "// Total price.");
    EXPECT_EQ(provider.synthesize(symbol("Cart", SymbolKind::CLASS, Language::RUST),
                                  Language::RUST, ""),
              "/// Cart.");
}

TEST(RuleBasedCommentProviderTest, NeverEmpty) {
    RuleBasedCommentProvider provider;
    for (Language lang : LanguageUtils::all()) {
        for (SymbolKind kind : {SymbolKind::FUNCTION, SymbolKind::CLASS}) {
            EXPECT_FALSE(provider.synthesize(symbol("run", kind, lang), lang, "").empty());
        }
    }
    EXPECT_FALSE(provider.synthesize(symbol("run", SymbolKind::FUNCTION, Language::UNKNOWN),
                                     Language::UNKNOWN, "").empty());
}
