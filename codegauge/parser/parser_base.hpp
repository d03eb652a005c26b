#ifndef CODEGAUGE_PARSER_BASE_HPP
#define CODEGAUGE_PARSER_BASE_HPP

#pragma once

#include "parser/grammar_tables.hpp"
#include <string>
#include <memory>
#include <vector>
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>

namespace codegauge::parser {

// Owns one parsed tree. Nodes handed out by root() are valid for the
// lifetime of this object only.
class SyntaxTree {
public:
    explicit SyntaxTree(TSTree* tree) : tree_(tree, ts_tree_delete) {}

    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;
    SyntaxTree(SyntaxTree&&) = default;
    SyntaxTree& operator=(SyntaxTree&&) = default;

    TSNode root() const { return ts_tree_root_node(tree_.get()); }

private:
    std::unique_ptr<TSTree, void(*)(TSTree*)> tree_;
};

// Text covered by node, or an empty string when the node range does not
// fit the source (e.g. zero width MISSING nodes).
std::string extract_node_text(const TSNode &node, const std::string &source_code);

class ParserBase {
public:
    // Non-copyable but movable
    ParserBase() : parser_(ts_parser_new(), ts_parser_delete) {}
    ParserBase(const ParserBase&) = delete;
    ParserBase& operator=(const ParserBase&) = delete;
    ParserBase(ParserBase&&) = default;
    ParserBase& operator=(ParserBase&&) = default;
    virtual ~ParserBase() = default;

    // Create a fresh, uninitialized parser for the same language
    virtual std::unique_ptr<ParserBase> clone() const = 0;

    virtual const TSLanguage* language() const = 0;
    virtual std::vector<std::string> get_extensions() const = 0;
    virtual std::string get_language_name() const = 0;
    virtual std::string get_line_comment_marker() const = 0;
    virtual const GrammarTables& get_grammar_tables() const = 0;

    // Binds the grammar to the underlying TSParser. Returns false if the
    // parser could not be created or tree-sitter rejects the grammar.
    bool initialize();
    bool is_initialized() const { return initialized_; }

    // Error tolerant: malformed input yields a tree with ERROR nodes.
    // Throws std::runtime_error if called before initialize().
    SyntaxTree parse(const std::string &source_code);

protected:
    std::unique_ptr<TSParser, void(*)(TSParser*)> parser_;

private:
    bool initialized_ = false;
};

} // namespace codegauge::parser

#endif // CODEGAUGE_PARSER_BASE_HPP
