#ifndef CODEGAUGE_COMPLEXITY_NODE_CENSUS_HPP
#define CODEGAUGE_COMPLEXITY_NODE_CENSUS_HPP

#pragma once

#include "node_classifier.hpp"
#include <cstddef>
#include <tree_sitter/api.h>

namespace codegauge::complexity {

struct NodeCensus {
    std::size_t node_count{0};
    // Cyclomatic proxy: every control-flow node counts once, unweighted
    std::size_t control_flow_count{0};
};

// Visits every node, named and anonymous, exactly once.
NodeCensus take_census(TSNode root, const NodeClassifier& classifier);

} // namespace codegauge::complexity

#endif // CODEGAUGE_COMPLEXITY_NODE_CENSUS_HPP
