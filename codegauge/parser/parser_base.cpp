#include "parser/parser_base.hpp"
#include "utils/safe_conversions.hpp"
#include <stdexcept>

namespace codegauge::parser {

std::string extract_node_text(const TSNode &node, const std::string &source_code) {
    uint32_t start_byte = ts_node_start_byte(node);
    uint32_t end_byte = ts_node_end_byte(node);

    if (start_byte > end_byte || end_byte > source_code.length()) {
        return "";
    }

    return source_code.substr(start_byte, end_byte - start_byte);
}

bool ParserBase::initialize() {
    if (initialized_) {
        return true;
    }

    if (!parser_) {
        spdlog::error("Parser not created for {}", get_language_name());
        return false;
    }

    spdlog::debug("Setting up {} parser with tree-sitter", get_language_name());
    if (!ts_parser_set_language(parser_.get(), language())) {
        spdlog::error("tree-sitter rejected the {} grammar (ABI version {})",
                      get_language_name(), ts_language_version(language()));
        return false;
    }

    initialized_ = true;
    return true;
}

SyntaxTree ParserBase::parse(const std::string &source_code) {
    if (!initialized_) {
        throw std::runtime_error("Parser for " + get_language_name() + " used before initialize()");
    }

    TSTree* tree = ts_parser_parse_string(
        parser_.get(),
        nullptr,
        source_code.c_str(),
        utils::safe_string_length(source_code)
    );

    // Only happens without a language, a timeout or a cancellation flag,
    // none of which this parser ever sets.
    if (!tree) {
        throw std::runtime_error("tree-sitter produced no tree for " + get_language_name() + " source");
    }

    spdlog::debug("Parsed {} bytes of {} source", source_code.size(), get_language_name());
    return SyntaxTree(tree);
}

} // namespace codegauge::parser
