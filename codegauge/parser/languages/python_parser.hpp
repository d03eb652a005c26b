#ifndef CODEGAUGE_PARSER_PYTHON_PARSER_HPP
#define CODEGAUGE_PARSER_PYTHON_PARSER_HPP

#pragma once

#include "parser/parser_base.hpp"
#include <string>
#include <vector>
#include <memory>

extern "C" {
    const TSLanguage* tree_sitter_python();
}

namespace codegauge::parser::languages {

class PythonParser : public ParserBase {
public:
    PythonParser() = default;

    PythonParser(const PythonParser&) = delete;
    PythonParser& operator=(const PythonParser&) = delete;
    PythonParser(PythonParser&&) = default;
    PythonParser& operator=(PythonParser&&) = default;

    ~PythonParser() override = default;

    std::unique_ptr<ParserBase> clone() const override;
    const TSLanguage* language() const override;
    std::vector<std::string> get_extensions() const override;
    std::string get_language_name() const override;
    std::string get_line_comment_marker() const override;
    const GrammarTables& get_grammar_tables() const override;
};

} // namespace codegauge::parser::languages

#endif // CODEGAUGE_PARSER_PYTHON_PARSER_HPP
