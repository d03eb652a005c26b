#include "node_classifier.hpp"
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace codegauge::complexity {

namespace {

void add_kinds(std::unordered_map<std::string, NodeRole>& index,
               const std::vector<std::string>& kinds,
               NodeRole role) {
    for (const auto& kind : kinds) {
        auto [it, inserted] = index.emplace(kind, role);
        if (!inserted && it->second != role) {
            spdlog::warn("Node kind {} listed as both {} and {}, keeping {}",
                         kind, to_string(it->second), to_string(role), to_string(it->second));
        }
    }
}

} // namespace

const char* to_string(NodeRole role) {
    switch (role) {
        case NodeRole::None: return "none";
        case NodeRole::ControlFlow: return "control-flow";
        case NodeRole::Block: return "block";
        case NodeRole::Encapsulation: return "encapsulation";
        case NodeRole::Operator: return "operator";
        case NodeRole::OperatorKeyword: return "operator-keyword";
        case NodeRole::Operand: return "operand";
    }
    return "none";
}

NodeClassifier::NodeClassifier(const TSLanguage* language, const parser::GrammarTables& tables) {
    std::unordered_map<std::string, NodeRole> named;
    add_kinds(named, tables.control_flow, NodeRole::ControlFlow);
    add_kinds(named, {tables.block}, NodeRole::Block);
    add_kinds(named, tables.encapsulation, NodeRole::Encapsulation);
    add_kinds(named, tables.operators, NodeRole::Operator);
    add_kinds(named, tables.operands, NodeRole::Operand);

    std::unordered_map<std::string, NodeRole> anonymous;
    add_kinds(anonymous, tables.operator_keywords, NodeRole::OperatorKeyword);

    // Includes alias symbols, which is what ts_node_symbol reports
    uint32_t count = ts_language_symbol_count(language);
    roles_.assign(count, NodeRole::None);
    chain_parents_.assign(count, false);
    chain_children_.assign(count, false);

    std::size_t classified = 0;
    for (uint32_t i = 0; i < count; ++i) {
        auto symbol = static_cast<TSSymbol>(i);
        const char* name = ts_language_symbol_name(language, symbol);
        if (!name) {
            continue;
        }

        const auto* index = &named;
        switch (ts_language_symbol_type(language, symbol)) {
            case TSSymbolTypeRegular:
                break;
            case TSSymbolTypeAnonymous:
                index = &anonymous;
                break;
            default:
                continue;
        }

        if (index == &named && !tables.chained_branch_parent.empty()) {
            chain_parents_[i] = tables.chained_branch_parent == name;
            chain_children_[i] = tables.chained_branch_child == name;
        }

        auto it = index->find(name);
        if (it != index->end()) {
            roles_[i] = it->second;
            ++classified;
        }
    }
    spdlog::debug("Classified {} of {} grammar symbols", classified, count);
}

NodeRole NodeClassifier::classify(TSSymbol symbol) const {
    // ts_builtin_sym_error is outside the symbol range
    if (symbol >= roles_.size()) {
        return NodeRole::None;
    }
    return roles_[symbol];
}

NodeRole NodeClassifier::classify(TSNode node) const {
    return classify(ts_node_symbol(node));
}

bool NodeClassifier::is_operator_keyword_leaf(TSNode node) const {
    return classify(node) == NodeRole::OperatorKeyword && ts_node_child_count(node) == 0;
}

bool NodeClassifier::is_chained_branch(TSNode node) const {
    TSSymbol symbol = ts_node_symbol(node);
    if (symbol >= chain_children_.size() || !chain_children_[symbol]) {
        return false;
    }

    TSNode parent = ts_node_parent(node);
    if (ts_node_is_null(parent)) {
        return false;
    }
    TSSymbol parent_symbol = ts_node_symbol(parent);
    return parent_symbol < chain_parents_.size() && chain_parents_[parent_symbol];
}

bool NodeClassifier::counts_as_control_flow(TSNode node) const {
    return classify(node) == NodeRole::ControlFlow && !is_chained_branch(node);
}

} // namespace codegauge::complexity
