#include "analysis/analyzer.hpp"
#include "parser/parser_factory.hpp"
#include "utils/filesystem.hpp"
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/FormatVariadic.h>
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace llvm;

// Command line options
static cl::OptionCategory CodegaugeCategory("Codegauge Options");

static cl::list<std::string> InputFiles(
    cl::Positional,
    cl::desc("<file>..."),
    cl::OneOrMore,
    cl::cat(CodegaugeCategory));

static cl::opt<std::string> Language(
    "language",
    cl::desc("Analyze every file as this language instead of detecting it from the extension"),
    cl::value_desc("lang"),
    cl::cat(CodegaugeCategory));

static cl::opt<unsigned> Threshold(
    "threshold",
    cl::desc("Only report files with at least this cognitive complexity (default: 0)"),
    cl::init(0),
    cl::cat(CodegaugeCategory));

static cl::opt<std::string> OutputFormat(
    "format",
    cl::desc("Output format (text, json)"),
    cl::init("text"),
    cl::cat(CodegaugeCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Enable debug logging and list complexity factors"),
    cl::init(false),
    cl::cat(CodegaugeCategory));

namespace {

struct FileReport {
    std::string file_path;
    std::string language;
    codegauge::analysis::AnalysisResult metrics;
    std::vector<codegauge::complexity::ComplexityFactor> factors;
};

size_t total_cognitive_complexity(const std::vector<FileReport>& reports) {
    size_t total = 0;
    for (const auto& report : reports) {
        total += report.metrics.cognitive_complexity;
    }
    return total;
}

void output_results_json(const std::vector<FileReport>& reports) {
    json::Array results;
    for (const auto& report : reports) {
        json::Object entry = report.metrics.to_json();
        entry["file"] = report.file_path;
        entry["language"] = report.language;
        results.push_back(std::move(entry));
    }

    json::Object document{
        {"total_cognitive_complexity", static_cast<int64_t>(total_cognitive_complexity(reports))},
        {"results", std::move(results)},
    };
    outs() << formatv("{0:2}", json::Value(std::move(document))) << "\n";
}

void output_results_text(const std::vector<FileReport>& reports) {
    for (const auto& report : reports) {
        const auto& m = report.metrics;
        outs() << "File: " << report.file_path << "\n"
               << "Language: " << report.language << "\n"
               << "Lines of code: " << m.lines_of_code << "\n"
               << "Nodes: " << m.node_count << "\n"
               << "Cyclomatic complexity: " << m.complexity_score << "\n"
               << "Cognitive complexity: " << m.cognitive_complexity << "\n"
               << "Halstead volume: " << format("%.2f", m.halstead_volume) << "\n"
               << "Maintainability index: " << format("%.2f", m.maintainability_index) << "\n"
               << "SQALE debt (hours): " << format("%.2f", m.sqale_debt_hours) << "\n";
        if (m.description) {
            outs() << "Description: " << *m.description << "\n";
        }

        if (Verbose && !report.factors.empty()) {
            outs() << "Complexity Factors:\n";
            for (const auto& factor : report.factors) {
                outs() << "  - " << factor.description
                       << " (line " << factor.line_number
                       << ", +" << factor.increment << ")\n";
            }
        }
        outs() << "\n";
    }
    outs() << "Total cognitive complexity: " << total_cognitive_complexity(reports) << "\n";
}

} // namespace

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    // Parse command line options
    cl::HideUnrelatedOptions(CodegaugeCategory);
    cl::ParseCommandLineOptions(argc, argv, "Codegauge - source complexity metrics\n");

    // Configure spdlog
    if (Verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    if (OutputFormat != "text" && OutputFormat != "json") {
        spdlog::error("Unknown output format: {} (expected text or json)", OutputFormat.getValue());
        return 1;
    }

    try {
        auto factory = codegauge::parser::ParserFactory::with_builtin_languages();

        if (!Language.empty() && !factory.create_parser(Language)) {
            spdlog::error("Unsupported language: {} (supported: {})", Language.getValue(),
                          join(factory.get_supported_languages(), ", "));
            return 1;
        }

        // One analyzer per language, reused across files
        std::map<std::string, std::unique_ptr<codegauge::analysis::Analyzer>> analyzers;
        std::vector<FileReport> reports;
        bool failed = false;

        for (const auto& input : InputFiles) {
            std::string file_path = codegauge::utils::normalize_path(input);
            std::string language = Language.empty() ? factory.detect_language(file_path) : Language.getValue();
            if (language.empty()) {
                spdlog::error("Could not detect language for file: {} (known extensions: {})", file_path,
                              join(factory.get_supported_extensions(), ", "));
                failed = true;
                continue;
            }

            std::string content;
            try {
                content = codegauge::utils::read_file_content(file_path);
            } catch (const std::exception& e) {
                spdlog::error("{}", e.what());
                failed = true;
                continue;
            }

            auto& analyzer = analyzers[language];
            if (!analyzer) {
                analyzer = std::make_unique<codegauge::analysis::Analyzer>(factory.create_parser(language));
            }

            spdlog::info("Analyzing file: {} ({})", file_path, language);
            FileReport report{file_path, language, analyzer->analyze(content), {}};
            if (report.metrics.cognitive_complexity < Threshold) {
                continue;
            }
            if (Verbose) {
                report.factors = analyzer->explain(content);
            }
            reports.push_back(std::move(report));
        }

        // Output results
        if (OutputFormat == "json") {
            output_results_json(reports);
        } else {
            output_results_text(reports);
        }
        return failed ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("An error occurred: {}", e.what());
        return 1;
    }
}
