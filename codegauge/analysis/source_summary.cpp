#include "source_summary.hpp"
#include "parser/parser_base.hpp"
#include <algorithm>
#include <array>

namespace codegauge::analysis {

namespace {

// ASCII whitespace, including the \x1c-\x1f separators
constexpr std::string_view kWhitespace = " \t\n\r\f\v\x1c\x1d\x1e\x1f";

// UTF-8 encodings of the non-ASCII Unicode whitespace characters
constexpr std::array<std::string_view, 19> kUnicodeWhitespace = {
    "\xc2\x85",      // U+0085 next line
    "\xc2\xa0",      // U+00A0 no-break space
    "\xe1\x9a\x80",  // U+1680 ogham space mark
    "\xe2\x80\x80", "\xe2\x80\x81", "\xe2\x80\x82", "\xe2\x80\x83",
    "\xe2\x80\x84", "\xe2\x80\x85", "\xe2\x80\x86", "\xe2\x80\x87",
    "\xe2\x80\x88", "\xe2\x80\x89", "\xe2\x80\x8a",  // U+2000-U+200A
    "\xe2\x80\xa8",  // U+2028 line separator
    "\xe2\x80\xa9",  // U+2029 paragraph separator
    "\xe2\x80\xaf",  // U+202F narrow no-break space
    "\xe2\x81\x9f",  // U+205F medium mathematical space
    "\xe3\x80\x80",  // U+3000 ideographic space
};

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Byte length of the whitespace character text starts with, 0 if none
std::size_t leading_whitespace(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    if (kWhitespace.find(text.front()) != std::string_view::npos) {
        return 1;
    }
    for (auto space : kUnicodeWhitespace) {
        if (starts_with(text, space)) {
            return space.size();
        }
    }
    return 0;
}

std::size_t trailing_whitespace(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    if (kWhitespace.find(text.back()) != std::string_view::npos) {
        return 1;
    }
    for (auto space : kUnicodeWhitespace) {
        if (ends_with(text, space)) {
            return space.size();
        }
    }
    return 0;
}

} // namespace

std::string_view trim(std::string_view text) {
    while (auto width = leading_whitespace(text)) {
        text.remove_prefix(width);
    }
    while (auto width = trailing_whitespace(text)) {
        text.remove_suffix(width);
    }
    return text;
}

bool is_blank(std::string_view text) {
    return trim(text).empty();
}

std::size_t count_lines_of_code(std::string_view source, std::string_view comment_marker) {
    if (source.empty()) {
        return 0;
    }

    std::size_t loc = 0;
    std::size_t begin = 0;
    while (begin <= source.size()) {
        auto end = source.find('\n', begin);
        if (end == std::string_view::npos) {
            end = source.size();
        }

        auto line = trim(source.substr(begin, end - begin));
        if (!line.empty() && (comment_marker.empty() || !starts_with(line, comment_marker))) {
            ++loc;
        }
        begin = end + 1;
    }

    return std::max<std::size_t>(loc, 1);
}

std::string strip_string_delimiters(std::string_view literal) {
    // Triple quotes first: stripping a single quote off """x""" would
    // leave ""x"" behind.
    static constexpr std::array<std::string_view, 4> kDelimiters = {
        R"(""")", "'''", "\"", "'",
    };

    for (auto delimiter : kDelimiters) {
        if (literal.size() >= 2 * delimiter.size() &&
            starts_with(literal, delimiter) && ends_with(literal, delimiter)) {
            auto inner = literal.substr(delimiter.size(), literal.size() - 2 * delimiter.size());
            return std::string(trim(inner));
        }
    }
    return std::string(trim(literal));
}

std::optional<std::string> extract_module_docstring(TSNode root,
                                                    const std::string& source_code,
                                                    const parser::GrammarTables& tables) {
    if (ts_node_is_null(root)) {
        return std::nullopt;
    }

    uint32_t child_count = ts_node_child_count(root);
    for (uint32_t i = 0; i < child_count; ++i) {
        TSNode statement = ts_node_child(root, i);
        std::string_view type = ts_node_type(statement);

        if (type == tables.comment) {
            continue;
        }
        if (type != tables.docstring_statement) {
            return std::nullopt;
        }

        uint32_t part_count = ts_node_child_count(statement);
        for (uint32_t j = 0; j < part_count; ++j) {
            TSNode part = ts_node_child(statement, j);
            if (tables.string_literal != ts_node_type(part)) {
                continue;
            }
            std::string text = parser::extract_node_text(part, source_code);
            if (text.empty()) {
                return std::nullopt;
            }
            return strip_string_delimiters(text);
        }
        // Only the first statement can be the docstring
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace codegauge::analysis
