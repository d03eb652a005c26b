#ifndef CODEGAUGE_COMPLEXITY_HALSTEAD_HPP
#define CODEGAUGE_COMPLEXITY_HALSTEAD_HPP

#pragma once

#include "node_classifier.hpp"
#include <cstddef>
#include <string>
#include <tree_sitter/api.h>

namespace codegauge::complexity {

struct HalsteadResult {
    std::size_t total_operators{0};   // N1
    std::size_t total_operands{0};    // N2
    std::size_t unique_operators{0};  // n1
    std::size_t unique_operands{0};   // n2
    double volume{0.0};

    std::size_t vocabulary() const { return unique_operators + unique_operands; }
    std::size_t length() const { return total_operators + total_operands; }
};

// Volume = (N1 + N2) * log2(n1 + n2), 0 for an empty vocabulary.
//
// Operators are keyed by node kind (or keyword text for bare keyword
// leaves). Operands are keyed by their source text, so repeated uses of
// one name are one unique operand.
class Halstead {
public:
    explicit Halstead(const NodeClassifier& classifier) : classifier_(classifier) {}

    HalsteadResult calculate(TSNode root_node, const std::string& source_code) const;

private:
    const NodeClassifier& classifier_;
};

double halstead_volume(std::size_t length, std::size_t vocabulary);

} // namespace codegauge::complexity

#endif // CODEGAUGE_COMPLEXITY_HALSTEAD_HPP
