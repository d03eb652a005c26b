#include <catch2/catch_test_macros.hpp>
#include "parser/parser_factory.hpp"
#include "parser/languages/python_parser.hpp"
#include <stdexcept>

using codegauge::parser::ParserFactory;

TEST_CASE("Built-in factory knows Python and C++", "[ParserFactory]") {
    auto factory = ParserFactory::with_builtin_languages();

    const std::vector<std::string> expected{"cpp", "python"};
    REQUIRE(factory.get_supported_languages() == expected);

    const std::vector<std::string> expected_extensions{"cc", "cpp", "cxx", "h", "hh", "hpp", "py", "pyi"};
    REQUIRE(factory.get_supported_extensions() == expected_extensions);
}

TEST_CASE("Languages are detected from the file extension", "[ParserFactory]") {
    auto factory = ParserFactory::with_builtin_languages();

    REQUIRE(factory.detect_language("pkg/module.py") == "python");
    REQUIRE(factory.detect_language("stubs/module.pyi") == "python");
    REQUIRE(factory.detect_language("src/main.cc") == "cpp");
    REQUIRE(factory.detect_language("include/api.hpp") == "cpp");
    REQUIRE(factory.detect_language("Makefile").empty());
    REQUIRE(factory.detect_language("lib.rs").empty());
}

TEST_CASE("Factory hands out fresh initialized parsers", "[ParserFactory]") {
    auto factory = ParserFactory::with_builtin_languages();

    auto first = factory.create_parser("python");
    auto second = factory.create_parser("python");
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(first.get() != second.get());
    REQUIRE(first->is_initialized());
    REQUIRE(first->get_language_name() == "python");

    auto by_file = factory.create_parser(factory.detect_language("tool.cpp"));
    REQUIRE(by_file);
    REQUIRE(by_file->get_language_name() == "cpp");

    REQUIRE_FALSE(factory.create_parser("cobol"));
    REQUIRE_FALSE(factory.create_parser(factory.detect_language("notes.txt")));
}

TEST_CASE("Empty factory and null registration", "[ParserFactory]") {
    ParserFactory factory;
    factory.register_parser(nullptr);
    REQUIRE(factory.get_supported_languages().empty());

    factory.register_parser<codegauge::parser::languages::PythonParser>();
    const std::vector<std::string> expected{"python"};
    REQUIRE(factory.get_supported_languages() == expected);
}

TEST_CASE("Parsing requires initialization", "[ParserFactory]") {
    codegauge::parser::languages::PythonParser parser;
    REQUIRE_FALSE(parser.is_initialized());
    REQUIRE_THROWS_AS(parser.parse("x = 1"), std::runtime_error);

    REQUIRE(parser.initialize());
    auto tree = parser.parse("x = 1");
    REQUIRE(std::string(ts_node_type(tree.root())) == "module");
}
