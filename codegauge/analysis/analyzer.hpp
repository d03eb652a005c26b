// analyzer.hpp
#ifndef CODEGAUGE_ANALYSIS_ANALYZER_HPP
#define CODEGAUGE_ANALYSIS_ANALYZER_HPP

#pragma once

#include "parser/parser_base.hpp"
#include "complexity/cognitive_complexity.hpp"
#include "complexity/halstead.hpp"
#include "complexity/node_classifier.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <llvm/Support/JSON.h>

namespace codegauge::analysis {

// Metrics for one source text. Flat on purpose: nothing here refers back
// into the syntax tree it was computed from.
struct AnalysisResult {
    std::size_t node_count{0};
    std::size_t complexity_score{0};       // cyclomatic proxy
    std::size_t cognitive_complexity{0};
    double halstead_volume{0.0};
    double maintainability_index{100.0};
    double sqale_debt_hours{0.0};
    std::size_t lines_of_code{0};
    std::optional<std::string> description;

    // The fixed result for empty or whitespace-only input
    static AnalysisResult empty();

    llvm::json::Object to_json() const;

    bool operator==(const AnalysisResult& other) const;
    bool operator!=(const AnalysisResult& other) const { return !(*this == other); }
};

// Computes AnalysisResult for source text of one language.
//
// Owns its tree-sitter parser, so an Analyzer must not be used from two
// threads at once; give every worker its own instance (see clone()).
// analyze() never throws for text input: syntax errors just end up as
// ERROR nodes that are counted like any other node.
class Analyzer {
public:
    // Throws std::runtime_error if parser is null or fails to initialize
    explicit Analyzer(std::unique_ptr<parser::ParserBase> parser);
    ~Analyzer();

    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

    AnalysisResult analyze(const std::string &source_code);

    // Individual cognitive complexity increments; they sum to
    // analyze(source_code).cognitive_complexity.
    std::vector<complexity::ComplexityFactor> explain(const std::string &source_code);

    // Independent analyzer for the same language
    std::unique_ptr<Analyzer> clone() const;

    std::string language() const { return parser_->get_language_name(); }

private:
    std::unique_ptr<parser::ParserBase> parser_;
    complexity::NodeClassifier classifier_;
    complexity::CognitiveComplexity cognitive_;
    complexity::Halstead halstead_;
};

} // namespace codegauge::analysis

#endif // CODEGAUGE_ANALYSIS_ANALYZER_HPP
