#ifndef CODEGAUGE_COMPLEXITY_COGNITIVE_COMPLEXITY_HPP
#define CODEGAUGE_COMPLEXITY_COGNITIVE_COMPLEXITY_HPP

#pragma once

#include "node_classifier.hpp"
#include <cstddef>
#include <string>
#include <vector>
#include <tree_sitter/api.h>

namespace codegauge::complexity {

struct ComplexityFactor {
    std::string description;
    std::size_t increment;
    std::size_t line_number;
};

struct ComplexityResult {
    std::size_t total_complexity{0};
    // Deepest nesting level a control-flow node was found at
    std::size_t max_nesting_level{0};
    std::vector<ComplexityFactor> factors;
};

// Nesting-aware cognitive complexity over a whole tree.
//
// Every control-flow node adds 1 plus the nesting depth it sits at.
// Depth grows by one when descending into a block, unless the block
// belongs to an encapsulation node (module, class, function), whose body
// starts back at depth 0. Alternate branches (else, elif, except) are
// children of the statement they extend, not of its block, so they are
// counted at the depth of the opening clause. An `if` that only chains
// another branch (C++ `else if`) is covered by its else clause.
class CognitiveComplexity {
public:
    explicit CognitiveComplexity(const NodeClassifier& classifier) : classifier_(classifier) {}

    ComplexityResult calculate(TSNode root_node) const;

private:
    struct Frame {
        TSNode node;
        std::size_t nesting_level;
    };

    void increment_for_structural(ComplexityResult& result, const char* node_type, std::size_t line_number) const;
    void increment_for_nesting(ComplexityResult& result, std::size_t nesting_level,
                               const char* node_type, std::size_t line_number) const;

    const NodeClassifier& classifier_;
};

} // namespace codegauge::complexity

#endif // CODEGAUGE_COMPLEXITY_COGNITIVE_COMPLEXITY_HPP
