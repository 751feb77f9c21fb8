#include <catch2/catch_test_macros.hpp>
#include "paramscript/errors.h"
#include "paramscript/parser.h"

TEST_CASE("Parser grammar loads", "[parser]") {
    paramscript::ExpressionParser parser;
    REQUIRE(parser.isGrammarValid());
}

TEST_CASE("Parser basic expressions", "[parser]") {
    paramscript::ExpressionParser parser;

    SECTION("Number") {
        auto result = parser.parse("42");
        REQUIRE(result.success);
        REQUIRE(result.expression->is<paramscript::NumberLiteral>());
        REQUIRE(result.expression->as<paramscript::NumberLiteral>().value == 42.0);
    }

    SECTION("Scientific notation") {
        auto result = parser.parse("1.5e3");
        REQUIRE(result.success);
        REQUIRE(result.expression->as<paramscript::NumberLiteral>().value == 1500.0);
    }

    SECTION("Precedence") {
        auto result = parser.parse("1 + 2 * 3");
        REQUIRE(result.success);
        REQUIRE(paramscript::astToString(result.expression) == "(1 + (2 * 3))");
    }

    SECTION("Power is right associative and binds tighter than unary minus") {
        REQUIRE(paramscript::astToString(parser.parse("2**3**2").expression) == "(2 ** (3 ** 2))");
        REQUIRE(paramscript::astToString(parser.parse("-2**2").expression) == "(-(2 ** 2))");
    }

    SECTION("Floor division, modulo and matrix product") {
        REQUIRE(paramscript::astToString(parser.parse("7 // 2 % 3").expression) == "((7 // 2) % 3)");
        REQUIRE(paramscript::astToString(parser.parse("a @ b").expression) == "(a @ b)");
    }

    SECTION("Strings, booleans and None") {
        REQUIRE(parser.parse("'text'").expression->is<paramscript::StringLiteral>());
        REQUIRE(parser.parse("\"text\"").expression->as<paramscript::StringLiteral>().value == "text");
        REQUIRE(parser.parse("'it\\'s'").expression->as<paramscript::StringLiteral>().value == "it's");
        REQUIRE(parser.parse("\"a\\nb\"").expression->as<paramscript::StringLiteral>().value == "a\nb");
        REQUIRE(parser.parse("True").expression->as<paramscript::BooleanLiteral>().value);
        REQUIRE(parser.parse("None").expression->is<paramscript::NoneLiteral>());
        REQUIRE(parser.parse("Nonexistent").expression->is<paramscript::Name>());
    }

    SECTION("Function calls") {
        auto result = parser.parse("max(1, x, 3)");
        REQUIRE(result.success);
        const auto& call = result.expression->as<paramscript::FunctionCall>();
        REQUIRE(call.name == "max");
        REQUIRE(call.args.size() == 3);
    }

    SECTION("Lists") {
        auto result = parser.parse("[1, 'a', [2, 3]]");
        REQUIRE(result.success);
        REQUIRE(result.expression->as<paramscript::ListLiteral>().items.size() == 3);
        REQUIRE(parser.parse("[]").success);
    }
}

TEST_CASE("Parser subscripts and transpose", "[parser]") {
    paramscript::ExpressionParser parser;

    SECTION("Index and multi-index") {
        REQUIRE(paramscript::astToString(parser.parse("v[0]").expression) == "v[0]");
        REQUIRE(paramscript::astToString(parser.parse("m[1, -1]").expression) == "m[1, (-1)]");
    }

    SECTION("Slices") {
        auto result = parser.parse("v[1:3]");
        REQUIRE(result.success);
        const auto& sub = result.expression->as<paramscript::Subscript>();
        REQUIRE(sub.items.size() == 1);
        REQUIRE(sub.items[0].isSlice);
        REQUIRE(sub.items[0].start != nullptr);
        REQUIRE(sub.items[0].step == nullptr);

        auto open = parser.parse("v[::2]");
        REQUIRE(open.success);
        const auto& item = open.expression->as<paramscript::Subscript>().items[0];
        REQUIRE(item.start == nullptr);
        REQUIRE(item.stop == nullptr);
        REQUIRE(item.step != nullptr);
    }

    SECTION("Transpose") {
        auto result = parser.parse("array2d([1,2,3]).T");
        REQUIRE(result.success);
        REQUIRE(result.expression->is<paramscript::Transpose>());
        REQUIRE(parser.parse("m.Total").success == false);
    }
}

TEST_CASE("Parser array literals", "[parser]") {
    paramscript::ExpressionParser parser;

    SECTION("Blank and comma separated items") {
        auto result = parser.parse("$[1 2 3]");
        REQUIRE(result.success);
        const auto& array = result.expression->as<paramscript::ArrayLiteral>();
        REQUIRE_FALSE(array.nested);
        REQUIRE(array.rows.size() == 1);
        REQUIRE(array.rows[0].size() == 3);

        REQUIRE(parser.parse("$[1, 2, 3]").expression->as<paramscript::ArrayLiteral>().rows[0].size() == 3);
    }

    SECTION("A blank before a sign starts a new item") {
        auto pair = parser.parse("$[1 -2]");
        REQUIRE(pair.success);
        REQUIRE(pair.expression->as<paramscript::ArrayLiteral>().rows[0].size() == 2);

        auto four = parser.parse("$[-5 5 -5 5]");
        REQUIRE(four.success);
        REQUIRE(four.expression->as<paramscript::ArrayLiteral>().rows[0].size() == 4);

        auto rows = parser.parse("$[1 0 0; 0 0 -1; 0 1 0]").expression->as<paramscript::ArrayLiteral>().rows;
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[1].size() == 3);
        REQUIRE(paramscript::astToString(rows[1][2]) == "(-1)");
    }

    SECTION("Spaced operators and parentheses stay expressions") {
        REQUIRE(parser.parse("$[1 - 2]").expression->as<paramscript::ArrayLiteral>().rows[0].size() == 1);
        REQUIRE(parser.parse("$[1-2 3]").expression->as<paramscript::ArrayLiteral>().rows[0].size() == 2);
        REQUIRE(parser.parse("$[(1 -2) 3]").expression->as<paramscript::ArrayLiteral>().rows[0].size() == 2);
        REQUIRE(parser.parse("$[2 * -3]").expression->as<paramscript::ArrayLiteral>().rows[0].size() == 1);
        REQUIRE(parser.parse("$[1 2; -3 4]").expression->as<paramscript::ArrayLiteral>().rows[1].size() == 2);
        REQUIRE(paramscript::astToString(parser.parse("1 -2").expression) == "(1 - 2)");
    }

    SECTION("Rows") {
        auto result = parser.parse("$[1 2; 3 4]");
        REQUIRE(result.success);
        REQUIRE(result.expression->as<paramscript::ArrayLiteral>().rows.size() == 2);
    }

    SECTION("Ranges") {
        auto result = parser.parse("$[1:0.5:2]");
        REQUIRE(result.success);
        const auto& item = result.expression->as<paramscript::ArrayLiteral>().rows[0][0];
        REQUIRE(item->is<paramscript::RangeLiteral>());
        REQUIRE(item->as<paramscript::RangeLiteral>().step == 0.5);
        REQUIRE(item->as<paramscript::RangeLiteral>().stop == 2.0);

        auto unit = parser.parse("$[-1:3]").expression->as<paramscript::ArrayLiteral>().rows[0][0];
        REQUIRE(unit->as<paramscript::RangeLiteral>().start == -1.0);
        REQUIRE(unit->as<paramscript::RangeLiteral>().step == 1.0);
    }

    SECTION("Nested blocks") {
        auto result = parser.parse("$[[1,2;3,4],[5,6;7,8]]");
        REQUIRE(result.success);
        const auto& row = result.expression->as<paramscript::ArrayLiteral>().rows[0];
        REQUIRE(row.size() == 2);
        REQUIRE(row[0]->as<paramscript::ArrayLiteral>().nested);
    }

    SECTION("Empty array") {
        REQUIRE(parser.parse("$[]").success);
    }
}

TEST_CASE("Parser error handling", "[parser]") {
    paramscript::ExpressionParser parser;

    SECTION("Plain text is not an expression") {
        auto result = parser.parse("hello world");
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.errorMessage.empty());
    }

    SECTION("Dangling operator") {
        REQUIRE_FALSE(parser.parse("1 +").success);
        REQUIRE_FALSE(parser.parse("(1 + 2").success);
    }

    SECTION("parseOrThrow raises ExpressionSyntaxError") {
        REQUIRE_THROWS_AS(parser.parseOrThrow("1 2"), paramscript::ExpressionSyntaxError);
        REQUIRE(parser.parseOrThrow("1+2") != nullptr);
    }

    SECTION("Caret is not part of the grammar") {
        REQUIRE_FALSE(parser.parse("2^3").success);
    }
}

TEST_CASE("Collect referenced names", "[parser]") {
    paramscript::ExpressionParser parser;
    auto expr = parser.parseOrThrow("sqrt(a) + b[i] * a - $[c 1]");

    std::vector<std::string> names;
    paramscript::collectNames(expr, names);
    REQUIRE(names == std::vector<std::string>{"a", "b", "i", "c"});
}
