#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "complexity/halstead.hpp"
#include "parsed_source.hpp"
#include <cmath>

using codegauge::complexity::Halstead;
using codegauge::complexity::HalsteadResult;
using Catch::Matchers::WithinAbs;

namespace {

HalsteadResult python_halstead(const std::string& source) {
    ParsedPython parsed(source);
    Halstead calculator(parsed.classifier);
    return calculator.calculate(parsed.root(), parsed.source);
}

} // namespace

TEST_CASE("Volume of an empty vocabulary is zero", "[Halstead]") {
    REQUIRE(codegauge::complexity::halstead_volume(0, 0) == 0.0);

    auto result = python_halstead("# nothing but a comment\n");
    REQUIRE(result.total_operators == 0);
    REQUIRE(result.total_operands == 0);
    REQUIRE(result.volume == 0.0);
}

TEST_CASE("Volume is length times log2 of vocabulary", "[Halstead]") {
    REQUIRE_THAT(codegauge::complexity::halstead_volume(6, 4), WithinAbs(12.0, 1e-12));
    REQUIRE_THAT(codegauge::complexity::halstead_volume(3, 3), WithinAbs(4.754887502163468, 1e-12));
    REQUIRE(codegauge::complexity::halstead_volume(5, 1) == 0.0);
}

TEST_CASE("Assignment counts one operator and its operands", "[Halstead]") {
    auto result = python_halstead("x = 1");

    REQUIRE(result.total_operators == 1);
    REQUIRE(result.unique_operators == 1);
    REQUIRE(result.total_operands == 2);
    REQUIRE(result.unique_operands == 2);
    REQUIRE_THAT(result.volume, WithinAbs(3.0 * std::log2(3.0), 1e-9));
}

TEST_CASE("Operands are keyed by their text", "[Halstead]") {
    SECTION("Same name twice is one unique operand") {
        auto result = python_halstead("a = a");
        REQUIRE(result.total_operands == 2);
        REQUIRE(result.unique_operands == 1);
        REQUIRE_THAT(result.volume, WithinAbs(3.0, 1e-9));
    }

    SECTION("Different names stay distinct") {
        auto result = python_halstead("x = y\nx = z\n");
        REQUIRE(result.total_operators == 2);
        REQUIRE(result.unique_operators == 1);
        REQUIRE(result.total_operands == 4);
        REQUIRE(result.unique_operands == 3);
        REQUIRE_THAT(result.volume, WithinAbs(12.0, 1e-9));
    }
}

TEST_CASE("Keyword tokens count as operators by their text", "[Halstead]") {
    auto result = python_halstead("def f():\n    return x\n");

    // def, return / f, x
    REQUIRE(result.total_operators == 2);
    REQUIRE(result.unique_operators == 2);
    REQUIRE(result.total_operands == 2);
    REQUIRE(result.unique_operands == 2);
    REQUIRE_THAT(result.volume, WithinAbs(8.0, 1e-9));
}

TEST_CASE("C++ expressions feed the same counts", "[Halstead]") {
    ParsedCpp parsed("int f(int a) { return a + a; }\n");
    Halstead calculator(parsed.classifier);
    auto result = calculator.calculate(parsed.root(), parsed.source);

    // binary_expression, return
    REQUIRE(result.total_operators == 2);
    REQUIRE(result.unique_operators == 2);
    // f, a (parameter), a, a
    REQUIRE(result.total_operands == 4);
    REQUIRE(result.unique_operands == 2);
}
