#include "python_parser.hpp"

namespace codegauge::parser::languages {

namespace {

GrammarTables make_python_tables() {
    GrammarTables tables;

    // else/elif count at the depth of the if they belong to
    tables.control_flow = {
        "if_statement",
        "for_statement",
        "while_statement",
        "try_statement",
        "except_clause",
        "with_statement",
        "match_statement",
        "else_clause",
        "elif_clause",
    };

    tables.operators = {
        "binary_operator",
        "unary_operator",
        "comparison_operator",
        "boolean_operator",
        "augmented_assignment",
        "assignment",
        "not_operator",
    };

    tables.operator_keywords = {
        "if", "else", "elif", "for", "while", "try", "except", "finally",
        "with", "return", "yield", "raise", "break", "continue", "pass",
        "import", "from", "as", "def", "class", "lambda", "and", "or", "not",
        "in", "is", "await", "async", "match", "case",
    };

    tables.operands = {
        "identifier",
        "integer",
        "float",
        "string",
        "true",
        "false",
        "none",
    };

    tables.encapsulation = {
        "function_definition",
        "class_definition",
        "module",
    };
    tables.block = "block";

    tables.docstring_statement = "expression_statement";
    tables.string_literal = "string";
    tables.comment = "comment";
    return tables;
}

} // namespace

std::unique_ptr<ParserBase> PythonParser::clone() const {
    return std::make_unique<PythonParser>();
}

const TSLanguage* PythonParser::language() const {
    return tree_sitter_python();
}

std::vector<std::string> PythonParser::get_extensions() const {
    return {"py", "pyi"};
}

std::string PythonParser::get_language_name() const {
    return "python";
}

std::string PythonParser::get_line_comment_marker() const {
    return "#";
}

const GrammarTables& PythonParser::get_grammar_tables() const {
    static const GrammarTables tables = make_python_tables();
    return tables;
}

} // namespace codegauge::parser::languages
