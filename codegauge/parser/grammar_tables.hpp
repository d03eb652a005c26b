#ifndef CODEGAUGE_PARSER_GRAMMAR_TABLES_HPP
#define CODEGAUGE_PARSER_GRAMMAR_TABLES_HPP

#pragma once

#include <string>
#include <vector>

namespace codegauge::parser {

// Node kind names a grammar uses for each role the metric walkers care
// about. Everything except operator_keywords names a named node kind;
// operator_keywords names anonymous keyword tokens.
struct GrammarTables {
    std::vector<std::string> control_flow;
    std::vector<std::string> operators;
    std::vector<std::string> operator_keywords;
    std::vector<std::string> operands;
    // Nodes whose body block starts a fresh nesting scope.
    std::vector<std::string> encapsulation;
    std::string block;

    // A chained_branch_child directly under a chained_branch_parent
    // continues its parent's chain (C++ `else if`) and is not counted
    // again. Empty when the grammar has a dedicated elif node.
    std::string chained_branch_parent;
    std::string chained_branch_child;

    // Module summary extraction
    std::string docstring_statement;
    std::string string_literal;
    std::string comment;
};

} // namespace codegauge::parser

#endif // CODEGAUGE_PARSER_GRAMMAR_TABLES_HPP
