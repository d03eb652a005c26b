#include "analyzer.hpp"
#include "source_summary.hpp"
#include "complexity/maintainability.hpp"
#include "complexity/node_census.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace codegauge::analysis {

namespace {

std::unique_ptr<parser::ParserBase> require_initialized(std::unique_ptr<parser::ParserBase> parser) {
    if (!parser) {
        throw std::runtime_error("Analyzer requires a parser");
    }
    if (!parser->initialize()) {
        throw std::runtime_error("Failed to initialize " + parser->get_language_name() + " parser");
    }
    return parser;
}

} // namespace

AnalysisResult AnalysisResult::empty() {
    AnalysisResult result;
    result.maintainability_index = 100.0;
    return result;
}

llvm::json::Object AnalysisResult::to_json() const {
    llvm::json::Object object{
        {"node_count", static_cast<int64_t>(node_count)},
        {"complexity_score", static_cast<int64_t>(complexity_score)},
        {"cognitive_complexity", static_cast<int64_t>(cognitive_complexity)},
        {"halstead_volume", halstead_volume},
        {"maintainability_index", maintainability_index},
        {"sqale_debt_hours", sqale_debt_hours},
        {"lines_of_code", static_cast<int64_t>(lines_of_code)},
    };
    if (description) {
        object["description"] = llvm::json::isUTF8(*description)
            ? *description
            : llvm::json::fixUTF8(*description);
    } else {
        object["description"] = nullptr;
    }
    return object;
}

bool AnalysisResult::operator==(const AnalysisResult& other) const {
    return node_count == other.node_count &&
           complexity_score == other.complexity_score &&
           cognitive_complexity == other.cognitive_complexity &&
           halstead_volume == other.halstead_volume &&
           maintainability_index == other.maintainability_index &&
           sqale_debt_hours == other.sqale_debt_hours &&
           lines_of_code == other.lines_of_code &&
           description == other.description;
}

// The classifier is built before the walkers that hold a reference to it
Analyzer::Analyzer(std::unique_ptr<parser::ParserBase> parser)
    : parser_(require_initialized(std::move(parser))),
      classifier_(parser_->language(), parser_->get_grammar_tables()),
      cognitive_(classifier_),
      halstead_(classifier_)
{
    spdlog::debug("Created {} analyzer", parser_->get_language_name());
}

Analyzer::~Analyzer() = default;

AnalysisResult Analyzer::analyze(const std::string& source_code) {
    if (is_blank(source_code)) {
        spdlog::debug("Blank input, returning empty result");
        return AnalysisResult::empty();
    }

    parser::SyntaxTree tree = parser_->parse(source_code);
    TSNode root = tree.root();
    if (ts_node_has_error(root)) {
        spdlog::debug("{} source has syntax errors, metrics are best effort", parser_->get_language_name());
    }

    auto census = complexity::take_census(root, classifier_);
    auto cognitive = cognitive_.calculate(root);
    auto halstead = halstead_.calculate(root, source_code);

    AnalysisResult result;
    result.node_count = census.node_count;
    result.complexity_score = census.control_flow_count;
    result.cognitive_complexity = cognitive.total_complexity;
    result.halstead_volume = complexity::round_to_hundredths(halstead.volume);
    result.lines_of_code = count_lines_of_code(source_code, parser_->get_line_comment_marker());
    // MI takes the unrounded volume and the cyclomatic count
    result.maintainability_index = complexity::maintainability_index(
        halstead.volume, result.complexity_score, result.lines_of_code);
    result.sqale_debt_hours = complexity::sqale_debt_hours(result.cognitive_complexity);
    result.description = extract_module_docstring(root, source_code, parser_->get_grammar_tables());

    spdlog::debug("Analyzed {} nodes: cyclomatic {}, cognitive {}, MI {}",
                  result.node_count, result.complexity_score,
                  result.cognitive_complexity, result.maintainability_index);
    return result;
}

std::vector<complexity::ComplexityFactor> Analyzer::explain(const std::string& source_code) {
    if (is_blank(source_code)) {
        return {};
    }

    parser::SyntaxTree tree = parser_->parse(source_code);
    return cognitive_.calculate(tree.root()).factors;
}

std::unique_ptr<Analyzer> Analyzer::clone() const {
    return std::make_unique<Analyzer>(parser_->clone());
}

} // namespace codegauge::analysis
