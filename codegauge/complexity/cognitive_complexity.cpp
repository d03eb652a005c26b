#include "cognitive_complexity.hpp"
#include "utils/safe_conversions.hpp"
#include <algorithm>
#include <stack>
#include <string>
#include <spdlog/spdlog.h>

namespace codegauge::complexity {

ComplexityResult CognitiveComplexity::calculate(TSNode root_node) const {
    ComplexityResult result;

    if (ts_node_is_null(root_node)) {
        spdlog::error("Received null root node in calculate");
        return result;
    }

    // Each frame carries its own depth, so a sibling never sees the
    // depth a previous subtree descended to.
    std::stack<Frame> pending;
    pending.push({root_node, 0});

    while (!pending.empty()) {
        Frame frame = pending.top();
        pending.pop();

        NodeRole role = classifier_.classify(frame.node);
        if (role == NodeRole::ControlFlow && !classifier_.is_chained_branch(frame.node)) {
            const char* node_type = ts_node_type(frame.node);
            std::size_t line_number = utils::to_line_number(ts_node_start_point(frame.node).row);

            increment_for_structural(result, node_type, line_number);
            if (frame.nesting_level > 0) {
                increment_for_nesting(result, frame.nesting_level, node_type, line_number);
            }
            result.max_nesting_level = std::max(result.max_nesting_level, frame.nesting_level);
        }

        // Pushed in reverse so children pop in source order
        uint32_t child_count = ts_node_child_count(frame.node);
        for (uint32_t i = child_count; i > 0; --i) {
            TSNode child = ts_node_child(frame.node, i - 1);
            std::size_t child_level = frame.nesting_level;
            if (classifier_.classify(child) == NodeRole::Block && role != NodeRole::Encapsulation) {
                ++child_level;
            }
            pending.push({child, child_level});
        }
    }

    return result;
}

void CognitiveComplexity::increment_for_structural(ComplexityResult& result,
                                                   const char* node_type,
                                                   std::size_t line_number) const {
    result.total_complexity += 1;
    result.factors.push_back({
        node_type,
        1,
        line_number
    });
    spdlog::debug("Added structural complexity: +1 for {} at line {}",
                  node_type, line_number);
}

void CognitiveComplexity::increment_for_nesting(ComplexityResult& result,
                                                std::size_t nesting_level,
                                                const char* node_type,
                                                std::size_t line_number) const {
    result.total_complexity += nesting_level;
    result.factors.push_back({
        std::string("Nested ") + node_type,
        nesting_level,
        line_number
    });
    spdlog::debug("Added nesting complexity: +{} for {} at line {}",
                  nesting_level, node_type, line_number);
}

} // namespace codegauge::complexity
