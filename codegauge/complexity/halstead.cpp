#include "halstead.hpp"
#include "parser/parser_base.hpp"
#include <cmath>
#include <stack>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace codegauge::complexity {

double halstead_volume(std::size_t length, std::size_t vocabulary) {
    if (vocabulary == 0) {
        return 0.0;
    }
    return static_cast<double>(length) * std::log2(static_cast<double>(vocabulary));
}

HalsteadResult Halstead::calculate(TSNode root_node, const std::string& source_code) const {
    HalsteadResult result;
    if (ts_node_is_null(root_node)) {
        return result;
    }

    std::unordered_set<std::string> operators;
    std::unordered_set<std::string> operands;

    std::stack<TSNode> nodes;
    nodes.push(root_node);

    while (!nodes.empty()) {
        TSNode current = nodes.top();
        nodes.pop();

        switch (classifier_.classify(current)) {
            case NodeRole::Operator:
                ++result.total_operators;
                operators.insert(ts_node_type(current));
                break;
            case NodeRole::OperatorKeyword:
                // Keyword kinds are named after their text
                if (classifier_.is_operator_keyword_leaf(current)) {
                    ++result.total_operators;
                    operators.insert(ts_node_type(current));
                }
                break;
            case NodeRole::Operand: {
                std::string text = parser::extract_node_text(current, source_code);
                if (text.empty()) {
                    text = ts_node_type(current);
                }
                ++result.total_operands;
                operands.insert(std::move(text));
                break;
            }
            default:
                break;
        }

        uint32_t child_count = ts_node_child_count(current);
        for (uint32_t i = 0; i < child_count; i++) {
            nodes.push(ts_node_child(current, i));
        }
    }

    result.unique_operators = operators.size();
    result.unique_operands = operands.size();
    result.volume = halstead_volume(result.length(), result.vocabulary());

    spdlog::debug("Halstead: N1={} N2={} n1={} n2={} volume={}",
                  result.total_operators, result.total_operands,
                  result.unique_operators, result.unique_operands, result.volume);
    return result;
}

} // namespace codegauge::complexity
