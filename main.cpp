#include "paramscript/options.h"
#include "paramscript/parser.h"
#include "paramscript/runner.h"
#include "paramscript/serialization.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <definitions-file>\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -t, --template <file>   Render a template against the evaluated definitions\n";
    std::cerr << "  -o, --output <file>     Output file (default: stdout)\n";
    std::cerr << "  -f, --format <format>   Output format: json, text, report (default: report)\n";
    std::cerr << "  -s, --sort              Sort definitions by dependency before evaluation\n";
    std::cerr << "      --strict            Sort in strict mode: unorderable definitions are an error\n";
    std::cerr << "  -c, --config <file>     Load evaluator options from a config file\n";
    std::cerr << "  -d, --debug [dir]       Debug mode: create output folder with all intermediate files\n";
    std::cerr << "                          If dir not specified, creates <input_dir>/<input_name>_paramscript/\n";
    std::cerr << "  -h, --help              Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::string inputFile;
    std::string outputFile;
    std::string templateFile;
    std::string configFile;
    std::string debugDir;
    std::string format = "report";
    bool debugMode = false;
    bool sortDefinitions = false;
    bool strictOrdering = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-s" || arg == "--sort") {
            sortDefinitions = true;
        } else if (arg == "--strict") {
            sortDefinitions = true;
            strictOrdering = true;
        } else if (arg == "-d" || arg == "--debug") {
            debugMode = true;
            // The next argument is a directory unless it is the last one (the input file)
            if (i + 2 < argc && argv[i + 1][0] != '-') {
                debugDir = argv[++i];
            }
        } else if (arg == "-o" || arg == "--output" || arg == "-f" || arg == "--format" ||
                   arg == "-t" || arg == "--template" || arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "-o" || arg == "--output") outputFile = value;
            else if (arg == "-f" || arg == "--format") format = value;
            else if (arg == "-t" || arg == "--template") templateFile = value;
            else configFile = value;
        } else if (arg[0] != '-') {
            inputFile = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (inputFile.empty()) {
        std::cerr << "Error: No input file specified\n";
        printUsage(argv[0]);
        return 1;
    }
    if (format != "json" && format != "text" && format != "report") {
        std::cerr << "Unknown format: " << format << "\n";
        return 1;
    }

    // Configure evaluator options; command-line flags override the config file
    paramscript::EvaluatorOptions options;
    if (!configFile.empty() && !paramscript::loadEvaluatorOptionsFromFile(configFile, options)) {
        std::cerr << "Error: Could not open config file: " << configFile << "\n";
        return 1;
    }
    if (sortDefinitions) options.sortDefinitions = true;
    if (strictOrdering) options.strictOrdering = true;

    // Run the pipeline (Read -> Order -> Evaluate)
    paramscript::ParamRunner runner(inputFile);
    bool runSuccess = runner.run(options);

    if (!runner.isReadSuccess()) {
        std::cerr << "Error: " << runner.getErrorMessage() << "\n";
        return 1;
    }
    if (!runner.isEvaluated()) {
        std::cerr << "\n=== Ordering Error ===\n";
        std::cerr << runner.getErrorMessage() << "\n";
        return 1;
    }

    // Handle Debug Output generation
    if (debugMode) {
        fs::path debugPath;
        if (debugDir.empty()) {
            fs::path inputPath(inputFile);
            debugPath = inputPath.parent_path() / (inputPath.stem().string() + "_paramscript");
        } else {
            debugPath = debugDir;
        }
        std::cerr << "Debug output: " << fs::weakly_canonical(debugPath) << "\n";
        runner.generateDebugOutput(debugPath.string());
    }

    // Generate output
    std::string output;
    if (!templateFile.empty()) {
        auto templateText = paramscript::readFile(templateFile);
        if (!templateText) {
            std::cerr << "Error: Could not open template file: " << templateFile << "\n";
            return 1;
        }
        output = runner.render(*templateText);
    } else if (format == "json") {
        output = paramscript::recordToJson(runner.getSnapshot()).dump(2) + "\n";
    } else if (format == "text") {
        output = paramscript::recordToText(runner.getSnapshot());
    } else {
        output = paramscript::generateRecordReport(runner.getDefinitions(), runner.getSnapshot());
    }

    if (!outputFile.empty()) {
        std::ofstream file(outputFile);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open output file: " << outputFile << "\n";
            return 1;
        }
        file << output;
    } else {
        std::cout << output;
    }

    if (!runSuccess) {
        std::cerr << "\n=== Evaluation Errors ===\n";
        for (const auto& [name, marker] : paramscript::collectErrors(runner.getSnapshot())) {
            std::cerr << "  " << name << ": " << marker.cause << "\n";
        }
        return 1;
    }
    return 0;
}
