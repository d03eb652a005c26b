#ifndef CODEGAUGE_TEST_PARSED_SOURCE_HPP
#define CODEGAUGE_TEST_PARSED_SOURCE_HPP

#pragma once

#include "complexity/node_classifier.hpp"
#include "parser/languages/cpp_parser.hpp"
#include "parser/languages/python_parser.hpp"
#include "parser/parser_base.hpp"
#include <memory>
#include <stdexcept>
#include <string>

// Source text parsed once, with the classifier for its grammar, for
// tests that drive a single walker directly.
template<typename Parser>
struct ParsedSource {
    explicit ParsedSource(std::string text)
        : source(std::move(text)),
          parser(initialized_parser()),
          tree(parser->parse(source)),
          classifier(parser->language(), parser->get_grammar_tables()) {}

    TSNode root() const { return tree.root(); }

    std::string source;
    std::unique_ptr<codegauge::parser::ParserBase> parser;
    codegauge::parser::SyntaxTree tree;
    codegauge::complexity::NodeClassifier classifier;

private:
    static std::unique_ptr<codegauge::parser::ParserBase> initialized_parser() {
        auto parser = std::make_unique<Parser>();
        if (!parser->initialize()) {
            throw std::runtime_error("grammar rejected by tree-sitter");
        }
        return parser;
    }
};

using ParsedPython = ParsedSource<codegauge::parser::languages::PythonParser>;
using ParsedCpp = ParsedSource<codegauge::parser::languages::CppParser>;

#endif // CODEGAUGE_TEST_PARSED_SOURCE_HPP
