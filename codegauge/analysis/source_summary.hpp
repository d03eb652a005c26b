#ifndef CODEGAUGE_ANALYSIS_SOURCE_SUMMARY_HPP
#define CODEGAUGE_ANALYSIS_SOURCE_SUMMARY_HPP

#pragma once

#include "parser/grammar_tables.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tree_sitter/api.h>

namespace codegauge::analysis {

std::string_view trim(std::string_view text);

bool is_blank(std::string_view text);

// Lines that are neither blank nor start with comment_marker once
// trimmed. At least 1 for any non-empty source, 0 for "".
std::size_t count_lines_of_code(std::string_view source, std::string_view comment_marker);

// Removes one enclosing pair of """, ''', " or ' (checked in that order)
// and trims the rest. Text without a matching pair is only trimmed.
std::string strip_string_delimiters(std::string_view literal);

// The module docstring: a string literal forming the first top-level
// statement, comments before it skipped. Any other first statement, or
// a first statement that is not a bare string, means no description.
std::optional<std::string> extract_module_docstring(TSNode root,
                                                    const std::string& source_code,
                                                    const parser::GrammarTables& tables);

} // namespace codegauge::analysis

#endif // CODEGAUGE_ANALYSIS_SOURCE_SUMMARY_HPP
