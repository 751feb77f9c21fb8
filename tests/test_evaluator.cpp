#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "paramscript/dependency_resolver.h"
#include "paramscript/errors.h"
#include "paramscript/evaluator.h"
#include "paramscript/parser.h"
#include <cmath>

using Catch::Matchers::WithinAbs;
using paramscript::ErrorMarker;
using paramscript::Evaluator;
using paramscript::EvaluatorOptions;
using paramscript::List;
using paramscript::NdArray;
using paramscript::PathValue;
using paramscript::Record;
using paramscript::Value;

static Value evalExpr(const std::string& text, const Record* context = nullptr) {
    paramscript::ExpressionParser parser;
    paramscript::ExpressionEvaluator evaluator(context);
    return evaluator.evaluate(parser.parseOrThrow(text));
}

static EvaluatorOptions quietOptions() {
    EvaluatorOptions options;
    options.silent = true;
    return options;
}

// ============================================================================
// Expression evaluator
// ============================================================================

TEST_CASE("Expression evaluator arithmetic", "[evaluator]") {
    REQUIRE(evalExpr("1 + 2 * 3") == Value(7));
    REQUIRE(evalExpr("2 ** 3 ** 2") == Value(512));
    REQUIRE(evalExpr("-2 ** 2") == Value(-4));
    REQUIRE(evalExpr("[1, 2] * 2") == Value(List{2, 4}));
    REQUIRE_THAT(evalExpr("2 * pi").asNumber(), WithinAbs(6.283185307179586, 1e-12));

    SECTION("Names resolve against the context") {
        Record context{{"x", 4}, {"v", List{10, 20, 30}}};
        REQUIRE(evalExpr("x ** 0.5", &context) == Value(2));
        REQUIRE(evalExpr("v[-1] + v[0]", &context) == Value(40));
        REQUIRE(evalExpr("v[1:]", &context) == Value(List{20, 30}));
    }

    SECTION("A field shadows a constant") {
        Record context{{"e", 2}};
        REQUIRE(evalExpr("e", &context) == Value(2));
    }

    SECTION("Unknown names raise UnresolvedReference") {
        REQUIRE_THROWS_AS(evalExpr("missing + 1"), paramscript::UnresolvedReference);
    }

    SECTION("Failed fields cannot be used") {
        Record context{{"bad", ErrorMarker{"unresolved reference to `d`", "d"}}};
        try {
            evalExpr("bad + 1", &context);
            FAIL("expected UnresolvedReference");
        } catch (const paramscript::UnresolvedReference& e) {
            REQUIRE(e.name() == "d");
        }
    }

    SECTION("Non-integral index raises EvaluationError") {
        REQUIRE_THROWS_AS(evalExpr("[1, 2][0.5]"), paramscript::EvaluationError);
    }
}

// ============================================================================
// Record evaluation
// ============================================================================

TEST_CASE("Records without expressions are unchanged", "[evaluator]") {
    Evaluator evaluator;
    Record record{
        {"count", 3},
        {"enabled", true},
        {"name", "hello world"},
        {"sizes", List{1, 2, 3}},
        {"dir", PathValue("/tmp/run")},
        {"nothing", Value()}
    };
    REQUIRE(evaluator.evaluate(record) == record);
}

TEST_CASE("Evaluation follows record order", "[evaluator][scenario]") {
    Evaluator evaluator;
    Record record{{"a", 1}, {"b", "${a}+1"}, {"c", "${a}+${d}"}};

    Record snapshot = evaluator.evaluate(record);
    REQUIRE(snapshot.get("a") == Value(1));
    REQUIRE(snapshot.get("b") == Value(2));
    REQUIRE(snapshot.get("c").isError());
    REQUIRE(snapshot.get("c").as<ErrorMarker>().missingName == "d");
    REQUIRE(snapshot.get("c").as<ErrorMarker>().cause == "unresolved reference to `d`");

    // The source is never mutated
    REQUIRE(record.get("b") == Value("${a}+1"));

    SECTION("Defining the missing field and sorting resolves it") {
        record.set("d", 2);
        Record sorted = paramscript::DependencyResolver::sort(record);
        REQUIRE(evaluator.evaluate(sorted).get("c") == Value(3));
    }

    SECTION("Errors are collected by name") {
        auto errors = paramscript::collectErrors(snapshot);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].first == "c");
        REQUIRE(errors[0].second.missingName == "d");
    }
}

TEST_CASE("Sorted evaluation is order independent", "[evaluator]") {
    EvaluatorOptions options = quietOptions();
    options.sortDefinitions = true;
    Evaluator evaluator(options);

    Record record{{"total", "${a}+${b}"}, {"b", "${a}*2"}, {"a", 3}};
    Record snapshot = evaluator.evaluate(record);

    REQUIRE(paramscript::collectErrors(snapshot).empty());
    REQUIRE(snapshot.keys() == std::vector<std::string>{"a", "b", "total"});
    REQUIRE(snapshot.get("total") == Value(9));
}

TEST_CASE("Evaluating a snapshot again is a no-op", "[evaluator]") {
    Evaluator evaluator;
    Record record{
        {"a", 2},
        {"b", "${a}*3"},
        {"c", "${b} m"},
        {"sizes", List{1, 2}},
        {"m", "$[1 2; 3 4]"},
        {"dir", PathValue("/tmp/${a}")},
        {"units", "real"}
    };

    Record snapshot = evaluator.evaluate(record);
    REQUIRE(snapshot.get("c") == Value("6 m"));
    REQUIRE(snapshot.get("dir") == Value(PathValue("/tmp/2")));
    REQUIRE(evaluator.evaluate(snapshot) == snapshot);
}

TEST_CASE("Arithmetic literal text is evaluated by a second pass", "[evaluator]") {
    Evaluator evaluator;
    Record record{{"a", 4}, {"sum", "$1+2"}, {"label", "$run ${a}"}};

    Record first = evaluator.evaluate(record);
    REQUIRE(first.get("sum") == Value("1+2"));
    REQUIRE(first.get("label") == Value("run 4"));

    Record second = evaluator.evaluate(first);
    REQUIRE(second.get("sum") == Value(3));
    REQUIRE(second.get("label") == Value("run 4"));
}

TEST_CASE("Escaped markers are deferred by one pass", "[evaluator]") {
    Evaluator evaluator;
    Record record{{"x", 5}, {"later", "\\${x} apples"}};

    Record first = evaluator.evaluate(record);
    REQUIRE(first.get("later") == Value("${x} apples"));

    Record second = evaluator.evaluate(first);
    REQUIRE(second.get("later") == Value("5 apples"));
}

TEST_CASE("Interpolation and partial evaluation", "[evaluator]") {
    Evaluator evaluator;

    SECTION("Text that is not arithmetic stays text") {
        Record snapshot = evaluator.evaluate(Record{{"n", 3}, {"s", "${n} apples"}});
        REQUIRE(snapshot.get("s") == Value("3 apples"));
    }

    SECTION("Literal prefix skips arithmetic") {
        Record snapshot = evaluator.evaluate(Record{{"x", 5}, {"s", "$value ${x}+1"}, {"t", "$ 1+1"}});
        REQUIRE(snapshot.get("s") == Value("value 5+1"));
        REQUIRE(snapshot.get("t") == Value("1+1"));
    }

    SECTION("Comments are stripped before evaluation") {
        Record snapshot = evaluator.evaluate(Record{{"x", "2*3   # six"}, {"title", "# Title"}});
        REQUIRE(snapshot.get("x") == Value(6));
        REQUIRE(snapshot.get("title") == Value("# Title"));
    }

    SECTION("Caret is a power operator") {
        REQUIRE(evaluator.value(Record{{"steps", "2^10"}}, "steps") == Value(1024));
    }

    SECTION("Self reference is kept as written") {
        REQUIRE(evaluator.value(Record{{"a", "${a}"}}, "a") == Value("${a}"));
    }

    SECTION("Indexed markers") {
        Record snapshot = evaluator.evaluate(Record{
            {"boxsize", List{40, 40, 80}},
            {"z", "${boxsize[2]}"},
            {"last", "${boxsize[-1]}/2"},
            {"m", "$[1 2; 3 4]"},
            {"m01", "${m[0,1]}"},
            {"bad", "${boxsize[3]}"}
        });
        REQUIRE(snapshot.get("z") == Value(80));
        REQUIRE(snapshot.get("last") == Value(40));
        REQUIRE(snapshot.get("m01") == Value(2));
        REQUIRE(snapshot.get("bad").isError());
        REQUIRE(snapshot.get("bad").as<ErrorMarker>().missingName.empty());
    }

    SECTION("A lone marker keeps the kind of its value") {
        Record snapshot = evaluator.evaluate(Record{
            {"dir", PathValue("/tmp/run")},
            {"alias", "${dir}"},
            {"file", PathValue("${dir}/out.txt")}
        });
        REQUIRE(snapshot.get("alias") == Value(PathValue("/tmp/run")));
        REQUIRE(snapshot.get("file") == Value(PathValue("/tmp/run/out.txt")));
    }

    SECTION("A failed field poisons its dependents with the root cause") {
        Record snapshot = evaluator.evaluate(Record{{"c", "${d}"}, {"e", "${c}*2"}});
        REQUIRE(snapshot.get("e").isError());
        REQUIRE(snapshot.get("e").as<ErrorMarker>().missingName == "d");
    }
}

// ============================================================================
// Arrays
// ============================================================================

TEST_CASE("Array literals", "[evaluator][array]") {
    Evaluator evaluator;
    auto arrayOf = [&](const std::string& text) {
        Value v = evaluator.value(Record{{"x", text}}, "x");
        REQUIRE(v.is<NdArray>());
        return v.as<NdArray>();
    };

    SECTION("Row vector") {
        NdArray a = arrayOf("$[1 2 3]");
        REQUIRE(a.shape == std::vector<size_t>{1, 3});
        REQUIRE(a.data == std::vector<double>{1, 2, 3});
    }

    SECTION("Negative items separated by blanks") {
        REQUIRE(arrayOf("$[1 -2]").data == std::vector<double>{1, -2});
        REQUIRE(arrayOf("$[-5 5 -5 5]").data == std::vector<double>{-5, 5, -5, 5});

        NdArray rotation = arrayOf("$[1 0 0; 0 0 -1; 0 1 0]");
        REQUIRE(rotation.shape == std::vector<size_t>{3, 3});
        REQUIRE(rotation.data == std::vector<double>{1, 0, 0, 0, 0, -1, 0, 1, 0});
    }

    SECTION("Column vector") {
        NdArray a = arrayOf("$[1;2;3]");
        REQUIRE(a.shape == std::vector<size_t>{3, 1});
    }

    SECTION("Range expansion") {
        NdArray a = arrayOf("$[1:0.5:2]");
        REQUIRE(a.data == std::vector<double>{1, 1.5, 2});
        REQUIRE(arrayOf("$[0:3 10]").data == std::vector<double>{0, 1, 2, 3, 10});
    }

    SECTION("Three and four dimensions") {
        REQUIRE(arrayOf("$[[1,2;3,4],[5,6;7,8]]").shape == std::vector<size_t>{2, 2, 2});
        REQUIRE(arrayOf("$[[[[1 2]]]]").shape == std::vector<size_t>{1, 1, 1, 2});
    }

    SECTION("Five dimensions are rejected") {
        REQUIRE(evaluator.value(Record{{"x", "$[[[[[1]]]]]"}}, "x").isError());
    }

    SECTION("Oversized ranges are rejected unless allowed") {
        REQUIRE(evaluator.value(Record{{"x", "$[1:1000]"}}, "x").isError());

        EvaluatorOptions options;
        options.maxRangeElements = 2000;
        Value big = Evaluator(options).value(Record{{"x", "$[1:1000]"}}, "x");
        REQUIRE(big.as<NdArray>().shape == std::vector<size_t>{1, 1000});
    }

    SECTION("Oversized constructions fail one field only") {
        Record snapshot = Evaluator(quietOptions()).evaluate(Record{
            {"huge", "eye(200000)"},
            {"wide", "zeros(10000) + ones(10000, 1)"},
            {"after", "1+1"}
        });
        REQUIRE(snapshot.get("huge").isError());
        REQUIRE(snapshot.get("wide").isError());
        REQUIRE(snapshot.get("after") == Value(2));

        std::string text;
        REQUIRE_NOTHROW(text = Evaluator(quietOptions()).format("${eye(200000)}", Record{}));
        REQUIRE(text == "${eye(200000)}");
    }

    SECTION("Array markers coerce sequences to rows") {
        Record snapshot = evaluator.evaluate(Record{
            {"v", List{1, 2, 3}},
            {"row", "@{v}"},
            {"col", "@{v}.T"}
        });
        REQUIRE(snapshot.get("row").as<NdArray>().shape == std::vector<size_t>{1, 3});
        REQUIRE(snapshot.get("col").as<NdArray>().shape == std::vector<size_t>{3, 1});
    }

    SECTION("Star is element-wise, @ is a matrix product") {
        Record snapshot = evaluator.evaluate(Record{
            {"m", "$[1 2; 3 4]"},
            {"sq", "${m} * ${m}"},
            {"mm", "${m} @ ${m}"}
        });
        REQUIRE(snapshot.get("sq") == Value(List{List{1, 4}, List{9, 16}}));
        REQUIRE(snapshot.get("mm").as<NdArray>().data == std::vector<double>{7, 10, 15, 22});
    }

    SECTION("Eigenvalues of a symmetric matrix") {
        NdArray values = evaluator.value(Record{{"x", "eig($[2 1; 1 2])"}}, "x").as<NdArray>();
        REQUIRE_THAT(values.data[0], WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(values.data[1], WithinAbs(3.0, 1e-12));
    }
}

// ============================================================================
// Recursive literals
// ============================================================================

TEST_CASE("Recursive literal lists", "[evaluator]") {
    Evaluator evaluator;

    SECTION("String elements are interpolated and evaluated one by one") {
        Value items = evaluator.value(
            Record{{"a", 2}, {"items", "!['${a}', ${a}, 'x', '$lit ${a}', [1, '${a}*2']]"}}, "items");
        REQUIRE(items == Value(List{2, 2, "x", "$lit ${a}", List{1, 4}}));
    }

    SECTION("Unresolved element becomes an error marker") {
        Value items = evaluator.value(Record{{"items", "!['${zz}', 1]"}}, "items");
        REQUIRE(items.as<List>()[0].isError());
        REQUIRE(items.as<List>()[1] == Value(1));
    }

    SECTION("Malformed literal fails the field") {
        REQUIRE(evaluator.value(Record{{"items", "![1, "}}, "items").isError());
    }
}

// ============================================================================
// Options
// ============================================================================

TEST_CASE("Evaluator options", "[evaluator][options]") {
    SECTION("Strict arithmetic turns leftover text into errors") {
        EvaluatorOptions options;
        options.strictArithmetic = true;
        Evaluator evaluator(options);

        Record snapshot = evaluator.evaluate(Record{{"n", 3}, {"s", "${n} apples"}, {"w", "hello"}});
        REQUIRE(snapshot.get("s").isError());
        REQUIRE(snapshot.get("w").as<ErrorMarker>().missingName == "hello");
    }

    SECTION("Evaluation off only substitutes") {
        EvaluatorOptions options;
        options.evaluation = false;
        Evaluator evaluator(options);
        REQUIRE(evaluator.value(Record{{"a", 1}, {"b", "${a}+1"}}, "b") == Value("1+1"));
    }

    SECTION("Protection promotes bare names of known fields") {
        EvaluatorOptions options;
        options.protection = true;
        Evaluator evaluator(options);
        REQUIRE(evaluator.value(Record{{"a", 2}, {"b", "$a*3"}}, "b") == Value(6));
    }

    SECTION("Strict ordering raises") {
        EvaluatorOptions options;
        options.sortDefinitions = true;
        options.strictOrdering = true;
        Evaluator evaluator(options);
        REQUIRE_THROWS_AS(evaluator.evaluate(Record{{"b", "${a}"}}), paramscript::OrderingFailure);
    }
}

TEST_CASE("Field selection", "[evaluator]") {
    Evaluator evaluator;
    Record record{{"a", 1}, {"b", "${a}+1"}, {"c", "${b}*10"}};

    Record subset = evaluator.evaluate(record, {"c", "a"});
    REQUIRE(subset.keys() == std::vector<std::string>{"c", "a"});
    REQUIRE(subset.get("c") == Value(20));

    REQUIRE_THROWS_AS(evaluator.evaluate(record, {"zz"}), paramscript::FieldNotFound);
    REQUIRE_THROWS_AS(evaluator.value(record, "zz"), paramscript::FieldNotFound);
}

// ============================================================================
// Templates
// ============================================================================

TEST_CASE("Template formatting", "[evaluator][template]") {
    Evaluator evaluator(quietOptions());
    Record record{{"x", 5}};

    REQUIRE(evaluator.format("value is ${x}", record) == "value is 5");

    SECTION("Missing names keep their marker") {
        std::string text;
        REQUIRE_NOTHROW(text = evaluator.format("value is ${y}", record));
        REQUIRE(text == "value is ${y}");
    }

    SECTION("No arithmetic on the template") {
        REQUIRE(evaluator.format("${x}+1", record) == "5+1");
        REQUIRE(evaluator.format("${x*2}", record) == "10");
    }

    SECTION("Escapes and array markers") {
        REQUIRE(evaluator.format("cost \\${x}", record) == "cost ${x}");
        REQUIRE(evaluator.format("@{x}", record) == "@{x}");
    }
}

TEST_CASE("Template evaluation", "[evaluator][template]") {
    Evaluator evaluator(quietOptions());
    Record record{{"name", "alpha"}, {"n", 5}};

    std::string tmpl =
        "# run ${name}\n"
        "steps ${n}*2\n"
        "${n}*2   # doubled\n"
        "% total = ${n}\n"
        "plain";

    std::string expected =
        "# run alpha\n"
        "steps 5*2\n"
        "10   # doubled\n"
        "# total = 5\n"
        "plain";

    REQUIRE(evaluator.formatEval(tmpl, record) == expected);
}
