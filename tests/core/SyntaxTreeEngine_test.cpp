#include <gtest/gtest.h>
#include "core/LanguageRegistry.hpp"
#include "core/RegexEngine.hpp"
#include "core/SourceFile.hpp"
#include "core/SyntaxTreeEngine.hpp"
#include <algorithm>
#include <filesystem>
#include <set>
#include <tuple>

using namespace docpatch;
namespace fs = std::filesystem;

class SyntaxTreeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<LanguageRegistry>(LanguageRegistry::build());
        engine_ = std::make_unique<SyntaxTreeEngine>(*registry_);

        fixtures_dir_ = fs::path(__FILE__).parent_path() / ".." / "fixtures";
        ASSERT_TRUE(fs::exists(fixtures_dir_)) << "Fixtures directory not found";
    }

    std::vector<SymbolRecord> analyze(Language lang, std::string_view content) {
        const LanguageSupport* support = registry_->find(lang);
        EXPECT_NE(support, nullptr);
        auto symbols = engine_->analyze(*support, content, "input");
        EXPECT_TRUE(symbols.has_value());
        return symbols ? *symbols : std::vector<SymbolRecord>{};
    }

    static const SymbolRecord* find(const std::vector<SymbolRecord>& symbols,
                                    const std::string& name,
                                    SymbolKind kind) {
        auto it = std::find_if(symbols.begin(), symbols.end(), [&](const SymbolRecord& s) {
            return s.name == name && s.kind == kind;
        });
        return it != symbols.end() ? &*it : nullptr;
    }

    std::unique_ptr<LanguageRegistry> registry_;
    std::unique_ptr<SyntaxTreeEngine> engine_;
    fs::path fixtures_dir_;
};

TEST_F(SyntaxTreeEngineTest, ParsersCreatedForLinkedGrammars) {
    EXPECT_TRUE(engine_->can_parse(Language::PYTHON));
    EXPECT_TRUE(engine_->can_parse(Language::CPP));
    EXPECT_TRUE(engine_->can_parse(Language::C));
    EXPECT_FALSE(engine_->can_parse(Language::JAVASCRIPT));
    EXPECT_FALSE(engine_->can_parse(Language::GO));
}

TEST_F(SyntaxTreeEngineTest, SinglePythonFunction) {
    auto symbols = analyze(Language::PYTHON, "def calculate_sum(a, b):\n    return a + b");

    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0].name, "calculate_sum");
    EXPECT_EQ(symbols[0].kind, SymbolKind::FUNCTION);
    EXPECT_EQ(symbols[0].line, 1u);
    EXPECT_EQ(symbols[0].offset, 0u);
}

TEST_F(SyntaxTreeEngineTest, EnclosingDefinitionComesFirst) {
    auto symbols = analyze(Language::PYTHON,
        "class DataProcessor:\n"
        "    def __init__(self, config):\n"
        "        self.config = config\n");

    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0].name, "DataProcessor");
    EXPECT_EQ(symbols[0].kind, SymbolKind::CLASS);
    EXPECT_EQ(symbols[1].name, "__init__");
    EXPECT_EQ(symbols[1].kind, SymbolKind::FUNCTION);
    EXPECT_EQ(symbols[1].line, 2u);
}

TEST_F(SyntaxTreeEngineTest, DefinitionsInsideStringsAreIgnored) {
    auto symbols = analyze(Language::PYTHON,
        "TEMPLATE = \"\"\"\n"
        "def generated():\n"
        "    pass\n"
        "\"\"\"\n");

    EXPECT_TRUE(symbols.empty());
}

TEST_F(SyntaxTreeEngineTest, PythonFixture) {
    std::string content = SourceFile::read(fixtures_dir_ / "inventory.py");
    auto symbols = analyze(Language::PYTHON, content);

    ASSERT_EQ(symbols.size(), 4u);
    EXPECT_EQ(symbols[0].name, "restock_candidates");
    EXPECT_EQ(symbols[0].line, 14u);
    EXPECT_EQ(symbols[1].name, "Warehouse");
    EXPECT_EQ(symbols[1].line, 19u);
    EXPECT_EQ(symbols[2].name, "__init__");
    EXPECT_EQ(symbols[2].line, 20u);
    EXPECT_EQ(symbols[3].name, "total_value");
    EXPECT_EQ(symbols[3].line, 29u);
}

TEST_F(SyntaxTreeEngineTest, AgreesWithRegexEngineOnPython) {
    std::string content = SourceFile::read(fixtures_dir_ / "inventory.py");
    const LanguageSupport* support = registry_->find(Language::PYTHON);
    ASSERT_NE(support, nullptr);

    auto tree_symbols = engine_->analyze(*support, content, "inventory.py");
    ASSERT_TRUE(tree_symbols.has_value());
    auto regex_symbols = RegexEngine().analyze(*support, content, "inventory.py");

    auto shape = [](const std::vector<SymbolRecord>& symbols) {
        std::set<std::tuple<std::string, SymbolKind, size_t, size_t>> result;
        for (const auto& s : symbols) {
            result.emplace(s.name, s.kind, s.line, s.offset);
        }
        return result;
    };

    EXPECT_EQ(shape(*tree_symbols), shape(regex_symbols));
}

TEST_F(SyntaxTreeEngineTest, CppFixture) {
    std::string content = SourceFile::read(fixtures_dir_ / "geometry.cpp");
    auto symbols = analyze(Language::CPP, content);

    EXPECT_EQ(find(symbols, "distance", SymbolKind::FUNCTION), nullptr)
        << "Function with a preceding comment is documented";
    EXPECT_EQ(find(symbols, "Point", SymbolKind::CLASS), nullptr)
        << "Forward declarations are not definitions";
    EXPECT_EQ(find(symbols, "Circle_perimeter", SymbolKind::FUNCTION), nullptr)
        << "Prototypes are not definitions";

    const SymbolRecord* shape = find(symbols, "Shape", SymbolKind::CLASS);
    ASSERT_NE(shape, nullptr);
    EXPECT_EQ(shape->line, 12u);

    const SymbolRecord* circle = find(symbols, "Circle", SymbolKind::CLASS);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(circle->line, 18u);

    const SymbolRecord* area = find(symbols, "area", SymbolKind::FUNCTION);
    ASSERT_NE(area, nullptr);
    EXPECT_EQ(area->line, 22u);

    // Templates are documented above the template header
    const SymbolRecord* clamp = find(symbols, "clamp_value", SymbolKind::FUNCTION);
    ASSERT_NE(clamp, nullptr);
    EXPECT_EQ(clamp->line, 30u);
    EXPECT_EQ(clamp->offset, content.find("template <typename T>"));
}

TEST_F(SyntaxTreeEngineTest, QualifiedAndPointerDeclarators) {
    auto symbols = analyze(Language::CPP,
        "int x = 0;\n"
        "void Widget::draw() {\n"
        "}\n"
        "int y = 0;\n"
        "const char* Widget::label() const {\n"
        "    return nullptr;\n"
        "}\n"
        "int z = 0;\n"
        "Widget::~Widget() {\n"
        "}\n");

    EXPECT_NE(find(symbols, "draw", SymbolKind::FUNCTION), nullptr);
    EXPECT_NE(find(symbols, "label", SymbolKind::FUNCTION), nullptr);
    EXPECT_NE(find(symbols, "~Widget", SymbolKind::FUNCTION), nullptr);
    EXPECT_EQ(find(symbols, "Widget", SymbolKind::FUNCTION), nullptr);
}

TEST_F(SyntaxTreeEngineTest, CommentedCppDefinitions) {
    auto symbols = analyze(Language::CPP,
        "/**\n"
        " * A widget.\n"
        " */\n"
        "struct Widget {\n"
        "    int size;\n"
        "};\n"
        "\n"
        "// Builds a widget\n"
        "Widget make_widget() {\n"
        "    return Widget{};\n"
        "}\n");

    EXPECT_TRUE(symbols.empty());
}

TEST_F(SyntaxTreeEngineTest, NoParserForRegexOnlyLanguage) {
    const LanguageSupport* support = registry_->find(Language::JAVASCRIPT);
    ASSERT_NE(support, nullptr);
    EXPECT_FALSE(engine_->analyze(*support, "function f() {}", "f.js").has_value());
}

TEST(LanguageRegistryTest, DisabledGrammarFallsBackToRegex) {
    LanguageRegistry::Options options;
    options.disabled_grammars = {Language::PYTHON};
    auto registry = LanguageRegistry::build(options);

    const LanguageSupport* python = registry.find(Language::PYTHON);
    ASSERT_NE(python, nullptr);
    EXPECT_EQ(python->parsed_grammar(), nullptr);
    EXPECT_FALSE(python->regex_rules.empty());

    const LanguageSupport* cpp = registry.find(Language::CPP);
    ASSERT_NE(cpp, nullptr);
    EXPECT_NE(cpp->parsed_grammar(), nullptr);
}

TEST(LanguageRegistryTest, LanguageSubset) {
    LanguageRegistry::Options options;
    options.languages = {Language::PYTHON, Language::JAVASCRIPT};
    auto registry = LanguageRegistry::build(options);

    EXPECT_TRUE(registry.supports(Language::PYTHON));
    EXPECT_TRUE(registry.supports(Language::JAVASCRIPT));
    EXPECT_FALSE(registry.supports(Language::CPP));
    EXPECT_FALSE(registry.supports(Language::UNKNOWN));
    EXPECT_EQ(registry.languages().size(), 2u);
}
