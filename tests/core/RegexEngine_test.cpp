#include <gtest/gtest.h>
#include "core/LanguageRegistry.hpp"
#include "core/RegexEngine.hpp"
#include "core/SourceFile.hpp"
#include <algorithm>
#include <filesystem>

using namespace docpatch;
namespace fs = std::filesystem;

class RegexEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        LanguageRegistry::Options options;
        options.use_syntax_tree = false;
        registry_ = std::make_unique<LanguageRegistry>(LanguageRegistry::build(options));

        fixtures_dir_ = fs::path(__FILE__).parent_path() / ".." / "fixtures";
        ASSERT_TRUE(fs::exists(fixtures_dir_)) << "Fixtures directory not found";
    }

    std::vector<SymbolRecord> analyze(Language lang, std::string_view content) {
        const LanguageSupport* support = registry_->find(lang);
        EXPECT_NE(support, nullptr);
        return engine_.analyze(*support, content, "input");
    }

    static const SymbolRecord* find(const std::vector<SymbolRecord>& symbols,
                                    const std::string& name) {
        auto it = std::find_if(symbols.begin(), symbols.end(),
                               [&](const SymbolRecord& s) { return s.name == name; });
        return it != symbols.end() ? &*it : nullptr;
    }

    std::unique_ptr<LanguageRegistry> registry_;
    RegexEngine engine_;
    fs::path fixtures_dir_;
};

TEST_F(RegexEngineTest, SinglePythonFunction) {
    auto symbols = analyze(Language::PYTHON, "def calculate_sum(a, b):\n    return a + b");

    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0].name, "calculate_sum");
    EXPECT_EQ(symbols[0].kind, SymbolKind::FUNCTION);
    EXPECT_EQ(symbols[0].line, 1u);
    EXPECT_EQ(symbols[0].offset, 0u);
    EXPECT_EQ(symbols[0].language, Language::PYTHON);
    EXPECT_EQ(symbols[0].source_file, fs::path("input"));
}

TEST_F(RegexEngineTest, PythonClassAndMethod) {
    auto symbols = analyze(Language::PYTHON,
        "class DataProcessor:\n"
        "    def __init__(self, config):\n"
        "        self.config = config\n");

    ASSERT_EQ(symbols.size(), 2u);

    const SymbolRecord* cls = find(symbols, "DataProcessor");
    ASSERT_NE(cls, nullptr);
    EXPECT_EQ(cls->kind, SymbolKind::CLASS);
    EXPECT_EQ(cls->line, 1u);

    const SymbolRecord* init = find(symbols, "__init__");
    ASSERT_NE(init, nullptr);
    EXPECT_EQ(init->kind, SymbolKind::FUNCTION);
    EXPECT_EQ(init->line, 2u);
    EXPECT_EQ(init->offset, std::string("class DataProcessor:\n    ").size());
}

TEST_F(RegexEngineTest, DocumentedPythonFunctionsAreSkipped) {
    auto symbols = analyze(Language::PYTHON,
        "# Adds numbers\n"
        "def add(a, b):\n"
        "    return a + b\n"
        "\n"
        "def sub(a, b):\n"
        "    \"\"\"Subtracts numbers.\"\"\"\n"
        "    return a - b\n");

    EXPECT_TRUE(symbols.empty());
}

TEST_F(RegexEngineTest, PythonFixture) {
    std::string content = SourceFile::read(fixtures_dir_ / "inventory.py");
    auto symbols = analyze(Language::PYTHON, content);

    ASSERT_EQ(symbols.size(), 4u);
    ASSERT_NE(find(symbols, "restock_candidates"), nullptr);
    EXPECT_EQ(find(symbols, "restock_candidates")->line, 14u);
    ASSERT_NE(find(symbols, "Warehouse"), nullptr);
    EXPECT_EQ(find(symbols, "Warehouse")->line, 19u);
    ASSERT_NE(find(symbols, "total_value"), nullptr);
    EXPECT_EQ(find(symbols, "total_value")->line, 29u);
    ASSERT_NE(find(symbols, "__init__"), nullptr);
    EXPECT_EQ(find(symbols, "__init__")->line, 20u);

    EXPECT_EQ(find(symbols, "count_items"), nullptr);
    EXPECT_EQ(find(symbols, "add_item"), nullptr);
    EXPECT_EQ(find(symbols, "Item"), nullptr);
}

TEST_F(RegexEngineTest, RulesAreAppliedInTableOrder) {
    auto symbols = analyze(Language::PYTHON,
        "class A:\n"
        "    pass\n"
        "\n"
        "x = 1\n"
        "def b():\n"
        "    pass\n");

    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0].name, "b");
    EXPECT_EQ(symbols[1].name, "A");
}

TEST_F(RegexEngineTest, JavaScriptFixture) {
    std::string content = SourceFile::read(fixtures_dir_ / "cart.js");
    auto symbols = analyze(Language::JAVASCRIPT, content);

    ASSERT_EQ(symbols.size(), 3u);
    EXPECT_EQ(symbols[0].name, "applyDiscount");
    EXPECT_EQ(symbols[0].line, 10u);
    EXPECT_EQ(symbols[1].name, "formatPrice");
    EXPECT_EQ(symbols[1].kind, SymbolKind::FUNCTION);
    EXPECT_EQ(symbols[1].line, 14u);
    EXPECT_EQ(symbols[2].name, "Cart");
    EXPECT_EQ(symbols[2].kind, SymbolKind::CLASS);
    EXPECT_EQ(symbols[2].line, 18u);
}

TEST_F(RegexEngineTest, JavaScriptMethodProperty) {
    auto symbols = analyze(Language::JAVASCRIPT,
        "const api = {\n"
        "    fetchUser: function(id) {\n"
        "        return id;\n"
        "    }\n"
        "};\n");

    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0].name, "fetchUser");
    EXPECT_EQ(symbols[0].line, 2u);
}

TEST_F(RegexEngineTest, ReservedWordsAreNotSymbols) {
    auto symbols = analyze(Language::CPP,
        "int main() {\n"
        "    if (ready) {\n"
        "    } else if (done) {\n"
        "    }\n"
        "}\n");

    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0].name, "main");
    EXPECT_EQ(symbols[0].line, 1u);
}

TEST_F(RegexEngineTest, GoAndRustTables) {
    auto go = analyze(Language::GO,
        "package cart\n"
        "\n"
        "type Cart struct {\n"
        "}\n"
        "\n"
        "func (c *Cart) Total() int {\n"
        "    return 0\n"
        "}\n");
    ASSERT_EQ(go.size(), 2u);
    EXPECT_EQ(go[0].name, "Total");
    EXPECT_EQ(go[1].name, "Cart");

    auto rust = analyze(Language::RUST,
        "/// A cart\n"
        "pub struct Cart {}\n"
        "\n"
        "pub fn total(c: &Cart) -> u32 {\n"
        "    0\n"
        "}\n");
    ASSERT_EQ(rust.size(), 1u);
    EXPECT_EQ(rust[0].name, "total");
    EXPECT_EQ(rust[0].line, 4u);
}

TEST_F(RegexEngineTest, EmptyContent) {
    EXPECT_TRUE(analyze(Language::PYTHON, "").empty());
}
