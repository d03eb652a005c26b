#ifndef CODEGAUGE_COMPLEXITY_NODE_CLASSIFIER_HPP
#define CODEGAUGE_COMPLEXITY_NODE_CLASSIFIER_HPP

#pragma once

#include "parser/grammar_tables.hpp"
#include <cstdint>
#include <vector>
#include <tree_sitter/api.h>

namespace codegauge::complexity {

enum class NodeRole : uint8_t {
    None,
    ControlFlow,
    Block,
    Encapsulation,
    Operator,
    OperatorKeyword,
    Operand,
};

const char* to_string(NodeRole role);

// Resolves the kind names of a GrammarTables once into a lookup indexed
// by tree-sitter symbol, so walkers never compare kind strings. Immutable
// after construction and safe to share between threads.
class NodeClassifier {
public:
    NodeClassifier(const TSLanguage* language, const parser::GrammarTables& tables);

    NodeRole classify(TSSymbol symbol) const;
    NodeRole classify(TSNode node) const;

    // Keyword leaves are operators only as bare tokens
    bool is_operator_keyword_leaf(TSNode node) const;

    // `if` of an `else if`: already scored through its else clause
    bool is_chained_branch(TSNode node) const;

    // Control-flow node that adds its own unit to the complexity counts
    bool counts_as_control_flow(TSNode node) const;

    std::size_t symbol_count() const { return roles_.size(); }

private:
    std::vector<NodeRole> roles_;
    std::vector<bool> chain_parents_;
    std::vector<bool> chain_children_;
};

} // namespace codegauge::complexity

#endif // CODEGAUGE_COMPLEXITY_NODE_CLASSIFIER_HPP
