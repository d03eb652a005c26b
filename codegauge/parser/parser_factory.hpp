#ifndef CODEGAUGE_PARSER_FACTORY_HPP
#define CODEGAUGE_PARSER_FACTORY_HPP

#pragma once

#include "parser_base.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace codegauge::parser {

// Registry of the languages a front end can analyze. Every create_*
// call hands out a fresh, initialized parser so that callers running
// on separate threads never share a TSParser.
class ParserFactory {
public:
    ParserFactory() = default;
    ParserFactory(const ParserFactory&) = delete;
    ParserFactory& operator=(const ParserFactory&) = delete;
    ParserFactory(ParserFactory&&) = default;
    ParserFactory& operator=(ParserFactory&&) = default;

    // Python and C++
    static ParserFactory with_builtin_languages();

    // Register a new parser type
    template<typename T>
    void register_parser() {
        register_parser(std::make_unique<T>());
    }

    void register_parser(std::unique_ptr<ParserBase> parser);

    // Get parser by language name, nullptr if unknown
    std::unique_ptr<ParserBase> create_parser(const std::string &language) const;

    // Language registered for the file's extension, empty if unknown
    std::string detect_language(const std::string &file_path) const;

    // Sorted, for stable help and error output
    std::vector<std::string> get_supported_languages() const;
    std::vector<std::string> get_supported_extensions() const;

private:
    std::unordered_map<std::string, std::unique_ptr<ParserBase>> parsers_;
    std::unordered_map<std::string, std::string> extensions_;
};

} // namespace codegauge::parser

#endif // CODEGAUGE_PARSER_FACTORY_HPP
