#include <catch2/catch_test_macros.hpp>
#include "complexity/node_classifier.hpp"
#include "parsed_source.hpp"
#include "parser/languages/python_parser.hpp"
#include <cstring>

using codegauge::complexity::NodeClassifier;
using codegauge::complexity::NodeRole;
using codegauge::parser::languages::PythonParser;

namespace {

TSSymbol symbol(const TSLanguage* language, const char* name, bool named) {
    return ts_language_symbol_for_name(language, name, static_cast<uint32_t>(std::strlen(name)), named);
}

} // namespace

TEST_CASE("Python kinds resolve to their roles", "[NodeClassifier]") {
    PythonParser parser;
    const TSLanguage* language = parser.language();
    NodeClassifier classifier(language, parser.get_grammar_tables());

    REQUIRE(classifier.symbol_count() == ts_language_symbol_count(language));

    SECTION("Control flow, including alternate branches") {
        REQUIRE(classifier.classify(symbol(language, "if_statement", true)) == NodeRole::ControlFlow);
        REQUIRE(classifier.classify(symbol(language, "elif_clause", true)) == NodeRole::ControlFlow);
        REQUIRE(classifier.classify(symbol(language, "else_clause", true)) == NodeRole::ControlFlow);
        REQUIRE(classifier.classify(symbol(language, "except_clause", true)) == NodeRole::ControlFlow);
        REQUIRE(classifier.classify(symbol(language, "with_statement", true)) == NodeRole::ControlFlow);
    }

    SECTION("Blocks and encapsulation boundaries") {
        REQUIRE(classifier.classify(symbol(language, "block", true)) == NodeRole::Block);
        REQUIRE(classifier.classify(symbol(language, "module", true)) == NodeRole::Encapsulation);
        REQUIRE(classifier.classify(symbol(language, "function_definition", true)) == NodeRole::Encapsulation);
        REQUIRE(classifier.classify(symbol(language, "class_definition", true)) == NodeRole::Encapsulation);
    }

    SECTION("Operators and operands") {
        REQUIRE(classifier.classify(symbol(language, "assignment", true)) == NodeRole::Operator);
        REQUIRE(classifier.classify(symbol(language, "boolean_operator", true)) == NodeRole::Operator);
        REQUIRE(classifier.classify(symbol(language, "identifier", true)) == NodeRole::Operand);
        REQUIRE(classifier.classify(symbol(language, "integer", true)) == NodeRole::Operand);
        REQUIRE(classifier.classify(symbol(language, "string", true)) == NodeRole::Operand);
    }

    SECTION("Keywords only as anonymous tokens") {
        REQUIRE(classifier.classify(symbol(language, "return", false)) == NodeRole::OperatorKeyword);
        REQUIRE(classifier.classify(symbol(language, "def", false)) == NodeRole::OperatorKeyword);
        REQUIRE(classifier.classify(symbol(language, "lambda", false)) == NodeRole::OperatorKeyword);
    }

    SECTION("Everything else is unclassified") {
        REQUIRE(classifier.classify(symbol(language, "comment", true)) == NodeRole::None);
        REQUIRE(classifier.classify(symbol(language, "expression_statement", true)) == NodeRole::None);
        REQUIRE(classifier.classify(static_cast<TSSymbol>(-1)) == NodeRole::None);
    }
}

TEST_CASE("A kind listed twice keeps its first role", "[NodeClassifier]") {
    PythonParser parser;
    codegauge::parser::GrammarTables tables;
    tables.operators = {"identifier"};
    tables.operands = {"identifier"};
    tables.block = "block";

    NodeClassifier classifier(parser.language(), tables);
    REQUIRE(classifier.classify(symbol(parser.language(), "identifier", true)) == NodeRole::Operator);
    REQUIRE(classifier.classify(symbol(parser.language(), "block", true)) == NodeRole::Block);
    REQUIRE(classifier.classify(symbol(parser.language(), "if_statement", true)) == NodeRole::None);
}

TEST_CASE("Roles have printable names", "[NodeClassifier]") {
    REQUIRE(std::strcmp(codegauge::complexity::to_string(NodeRole::ControlFlow), "control-flow") == 0);
    REQUIRE(std::strcmp(codegauge::complexity::to_string(NodeRole::None), "none") == 0);
}

namespace {

// First node of the given kind in document order
TSNode find_kind(TSNode node, const char* kind) {
    if (std::strcmp(ts_node_type(node), kind) == 0) {
        return node;
    }
    for (uint32_t i = 0; i < ts_node_named_child_count(node); ++i) {
        TSNode found = find_kind(ts_node_named_child(node, i), kind);
        if (!ts_node_is_null(found)) {
            return found;
        }
    }
    return TSNode{};
}

} // namespace

TEST_CASE("An if chained under an else clause is not counted again", "[NodeClassifier]") {
    ParsedCpp parsed("void f() { if (a) {} else if (b) {} }\n");

    TSNode outer = find_kind(parsed.root(), "if_statement");
    REQUIRE_FALSE(ts_node_is_null(outer));
    REQUIRE_FALSE(parsed.classifier.is_chained_branch(outer));
    REQUIRE(parsed.classifier.counts_as_control_flow(outer));

    TSNode else_clause = find_kind(outer, "else_clause");
    REQUIRE_FALSE(ts_node_is_null(else_clause));
    REQUIRE(parsed.classifier.counts_as_control_flow(else_clause));

    TSNode chained = find_kind(else_clause, "if_statement");
    REQUIRE_FALSE(ts_node_is_null(chained));
    REQUIRE(parsed.classifier.classify(chained) == NodeRole::ControlFlow);
    REQUIRE(parsed.classifier.is_chained_branch(chained));
    REQUIRE_FALSE(parsed.classifier.counts_as_control_flow(chained));
}

TEST_CASE("Python elif chains need no chained branch rule", "[NodeClassifier]") {
    ParsedPython parsed("if a:\n    pass\nelif b:\n    if c:\n        pass\n");

    TSNode elif = find_kind(parsed.root(), "elif_clause");
    REQUIRE_FALSE(ts_node_is_null(elif));
    TSNode inner_if = find_kind(elif, "if_statement");
    REQUIRE_FALSE(ts_node_is_null(inner_if));
    REQUIRE_FALSE(parsed.classifier.is_chained_branch(inner_if));
    REQUIRE(parsed.classifier.counts_as_control_flow(inner_if));
}
