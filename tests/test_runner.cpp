/**
 * End-to-end tests for ParamRunner on the files in examples/.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "paramscript/parser.h"
#include "paramscript/runner.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

static fs::path getExamplesDir() {
    const char* env = std::getenv("PARAMSCRIPT_EXAMPLES_DIR");
    if (env && env[0] != '\0') return fs::path(env);
    return fs::path("../examples");
}

static paramscript::EvaluatorOptions quietOptions() {
    paramscript::EvaluatorOptions options;
    options.silent = true;
    return options;
}

TEST_CASE("Run box.params", "[runner][examples]") {
    fs::path inputPath = getExamplesDir() / "box.params";
    if (!fs::exists(inputPath)) {
        SKIP("Example not found: " << inputPath.string());
    }

    paramscript::ParamRunner runner(inputPath.string());
    REQUIRE(runner.run(quietOptions()));
    REQUIRE(runner.isReadSuccess());
    REQUIRE(runner.getErrorCount() == 0);

    const auto& snapshot = runner.getSnapshot();
    REQUIRE(snapshot.size() == 12);
    REQUIRE_THAT(snapshot.get("natoms").asNumber(), WithinAbs(115200.0, 1e-6));
    REQUIRE(snapshot.get("volume").asNumber() == 128000.0);
    REQUIRE(snapshot.get("steps").asNumber() == 1024.0);
    REQUIRE(snapshot.get("label").asText() == "box 40x40");
    REQUIRE(snapshot.get("note").asText() == "${density} is substituted later");
    REQUIRE(snapshot.get("workdir").as<paramscript::PathValue>().str() == "/tmp/sim/run1/");
    REQUIRE(snapshot.get("dumpfile").as<paramscript::PathValue>().str() == "/tmp/sim/run1/dump.lammpstrj");
    REQUIRE(snapshot.get("rotation").as<paramscript::NdArray>().shape == std::vector<size_t>{3, 3});
    REQUIRE(snapshot.get("spacing").as<paramscript::NdArray>().data ==
            std::vector<double>{0, 0.25, 0.5, 0.75, 1});

    // Definitions keep their source text
    REQUIRE(runner.getDefinitions().get("steps").asText() == "2^10");

    SECTION("Render the example template") {
        auto tmpl = paramscript::readFile((getExamplesDir() / "box.template").string());
        REQUIRE(tmpl.has_value());

        std::string output = runner.render(*tmpl);
        REQUIRE_THAT(output, ContainsSubstring("# LAMMPS input generated for box 40x40\n"));
        REQUIRE_THAT(output, ContainsSubstring("units real\n"));
        REQUIRE_THAT(output, ContainsSubstring("region box block 0 40 0 40 0 80\n"));
        REQUIRE_THAT(output, ContainsSubstring("115.2   # thousands of atoms\n"));
        REQUIRE_THAT(output, ContainsSubstring("dump 1 all custom 1024 /tmp/sim/run1/dump.lammpstrj id x y z\n"));
        REQUIRE_THAT(output, ContainsSubstring("# volume = 128000"));
    }

    SECTION("Debug output") {
        fs::path debugDir = fs::temp_directory_path() / "paramscript_test_debug";
        fs::remove_all(debugDir);
        runner.generateDebugOutput(debugDir.string());

        REQUIRE(fs::exists(debugDir / "README.md"));
        REQUIRE(fs::exists(debugDir / "definitions.txt"));
        REQUIRE(fs::exists(debugDir / "ordering.json"));
        REQUIRE(fs::exists(debugDir / "fields.md"));
        REQUIRE(fs::exists(debugDir / "snapshot.json"));
        REQUIRE(fs::exists(debugDir / "evaluation.txt"));
        REQUIRE_FALSE(fs::exists(debugDir / "errors.md"));

        auto fieldsTable = paramscript::readFile((debugDir / "fields.md").string());
        REQUIRE(fieldsTable.has_value());
        REQUIRE_THAT(*fieldsTable, ContainsSubstring("| `natoms` | evaluation | number |"));
        REQUIRE_THAT(*fieldsTable, ContainsSubstring("| `label` | literal | text |"));
        REQUIRE_THAT(*fieldsTable, ContainsSubstring("| `workdir` | path | path |"));

        auto report = paramscript::readFile((debugDir / "report.md").string());
        REQUIRE(report.has_value());
        REQUIRE_THAT(*report, ContainsSubstring("| `pi` | 3.141592653589793 | Pi |"));
        fs::remove_all(debugDir);
    }
}

TEST_CASE("Run unordered definitions", "[runner][examples]") {
    fs::path inputPath = getExamplesDir() / "unordered.params";
    if (!fs::exists(inputPath)) {
        SKIP("Example not found: " << inputPath.string());
    }

    SECTION("Record order leaves forward references unresolved") {
        paramscript::ParamRunner runner(inputPath.string());
        REQUIRE_FALSE(runner.run(quietOptions()));
        REQUIRE(runner.isEvaluated());
        REQUIRE(runner.getErrorCount() == 2);
        REQUIRE(runner.getSnapshot().get("total").as<paramscript::ErrorMarker>().missingName == "a");
    }

    SECTION("Sorting resolves them") {
        auto options = quietOptions();
        options.sortDefinitions = true;

        paramscript::ParamRunner runner(inputPath.string());
        REQUIRE(runner.run(options));
        REQUIRE(runner.getOrderedDefinitions().keys() == std::vector<std::string>{"a", "b", "total"});
        REQUIRE(runner.getSnapshot().get("total").asNumber() == 9.0);
        REQUIRE(runner.isOrderingSuccess());
    }
}

TEST_CASE("Strict ordering failure stops the run", "[runner]") {
    fs::path inputPath = fs::temp_directory_path() / "paramscript_test_cycle.params";
    {
        std::ofstream f(inputPath);
        f << "p=\"${q}+1\"\nq=\"${p}+1\"\n";
    }

    auto options = quietOptions();
    options.sortDefinitions = true;
    options.strictOrdering = true;

    paramscript::ParamRunner runner(inputPath.string());
    bool ok = runner.run(options);
    fs::remove(inputPath);

    REQUIRE_FALSE(ok);
    REQUIRE(runner.isReadSuccess());
    REQUIRE_FALSE(runner.isEvaluated());
    REQUIRE(runner.getErrorMessage() == "could not order 2/2 expressions");
    REQUIRE_THROWS_AS(runner.render("${p}"), std::runtime_error);
}

TEST_CASE("Missing input file", "[runner]") {
    paramscript::ParamRunner runner("/nonexistent/input.params");
    REQUIRE_FALSE(runner.run());
    REQUIRE_FALSE(runner.isReadSuccess());
    REQUIRE_THAT(runner.getErrorMessage(), ContainsSubstring("Could not open file"));
}
