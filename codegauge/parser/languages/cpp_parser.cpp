#include "cpp_parser.hpp"

namespace codegauge::parser::languages {

namespace {

GrammarTables make_cpp_tables() {
    GrammarTables tables;

    tables.control_flow = {
        "if_statement",
        "else_clause",
        "for_statement",
        "for_range_loop",
        "while_statement",
        "do_statement",
        "switch_statement",
        "try_statement",
        "catch_clause",
    };

    tables.operators = {
        "binary_expression",
        "unary_expression",
        "assignment_expression",
        "update_expression",
        "conditional_expression",
        "pointer_expression",
    };

    tables.operator_keywords = {
        "if", "else", "for", "while", "do", "switch", "case", "default",
        "break", "continue", "return", "goto", "try", "catch", "throw",
        "new", "delete", "sizeof", "co_await", "co_return", "co_yield",
    };

    tables.operands = {
        "identifier",
        "field_identifier",
        "number_literal",
        "string_literal",
        "char_literal",
        "raw_string_literal",
        "true",
        "false",
        "null",
        "nullptr",
        "this",
    };

    // A lambda body is a function body: it does not nest its enclosing scope
    tables.encapsulation = {
        "translation_unit",
        "function_definition",
        "class_specifier",
        "struct_specifier",
        "lambda_expression",
    };
    tables.block = "compound_statement";

    tables.chained_branch_parent = "else_clause";
    tables.chained_branch_child = "if_statement";

    tables.docstring_statement = "expression_statement";
    tables.string_literal = "string_literal";
    tables.comment = "comment";
    return tables;
}

} // namespace

std::unique_ptr<ParserBase> CppParser::clone() const {
    return std::make_unique<CppParser>();
}

const TSLanguage* CppParser::language() const {
    return tree_sitter_cpp();
}

std::vector<std::string> CppParser::get_extensions() const {
    return {"cpp", "cc", "cxx", "hpp", "hh", "h"};
}

std::string CppParser::get_language_name() const {
    return "cpp";
}

std::string CppParser::get_line_comment_marker() const {
    return "//";
}

const GrammarTables& CppParser::get_grammar_tables() const {
    static const GrammarTables tables = make_cpp_tables();
    return tables;
}

} // namespace codegauge::parser::languages
