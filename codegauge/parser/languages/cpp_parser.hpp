#ifndef CODEGAUGE_PARSER_CPP_PARSER_HPP
#define CODEGAUGE_PARSER_CPP_PARSER_HPP

#pragma once

#include "../parser_base.hpp"
#include <string>
#include <vector>
#include <memory>

// Forward declare the tree-sitter function
extern "C" {
    const TSLanguage* tree_sitter_cpp();
}

namespace codegauge::parser::languages {

class CppParser : public ParserBase {
public:
    CppParser() = default;

    // Implement non-copyable but movable semantics
    CppParser(const CppParser&) = delete;
    CppParser& operator=(const CppParser&) = delete;
    CppParser(CppParser&&) = default;
    CppParser& operator=(CppParser&&) = default;

    ~CppParser() override = default;

    // Create a fresh instance instead of copying
    std::unique_ptr<ParserBase> clone() const override;
    const TSLanguage* language() const override;
    std::vector<std::string> get_extensions() const override;
    std::string get_language_name() const override;
    std::string get_line_comment_marker() const override;
    const GrammarTables& get_grammar_tables() const override;
};

} // namespace codegauge::parser::languages

#endif // CODEGAUGE_PARSER_CPP_PARSER_HPP
