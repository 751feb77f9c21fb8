#include "paramscript/runner.h"
#include "paramscript/constants.h"
#include "paramscript/grammar.h"
#include "paramscript/parser.h"
#include "paramscript/serialization.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace paramscript {

ParamRunner::ParamRunner(const std::string& inputFile)
    : inputFile_(inputFile) {}

bool ParamRunner::run(const EvaluatorOptions& options) {
    auto pipeline_start = std::chrono::high_resolution_clock::now();

    // 1. Read
    auto t1 = std::chrono::high_resolution_clock::now();
    auto content = readFile(inputFile_);
    if (!content) {
        errorMessage_ = "Could not open file: " + inputFile_;
        return false;
    }
    sourceText_ = *content;
    try {
        definitions_ = recordFromText(sourceText_);
    } catch (const std::runtime_error& e) {
        errorMessage_ = inputFile_ + ": " + e.what();
        return false;
    }
    readSuccess_ = true;
    auto t2 = std::chrono::high_resolution_clock::now();
    timing_.read_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    // 2. Order (the analysis is kept for reports even when not sorting)
    t1 = std::chrono::high_resolution_clock::now();
    OrderingMode mode = options.strictOrdering ? OrderingMode::Strict : OrderingMode::Lenient;
    orderingResult_ = DependencyResolver::analyze(definitions_, mode);
    if (options.sortDefinitions) {
        if (!orderingResult_.success) {
            errorMessage_ = orderingResult_.errorMessage;
            return false;
        }
        if (!orderingResult_.forced.empty() && !options.silent) {
            std::cerr << "Warning: " << orderingResult_.errorMessage << "\n";
        }
        ordered_ = orderingResult_.record;
    } else {
        ordered_ = definitions_;
    }
    t2 = std::chrono::high_resolution_clock::now();
    timing_.ordering_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    // 3. Evaluate (already ordered)
    t1 = std::chrono::high_resolution_clock::now();
    EvaluatorOptions evaluationOptions = options;
    evaluationOptions.sortDefinitions = false;
    evaluator_ = std::make_shared<Evaluator>(evaluationOptions);
    snapshot_ = evaluator_->evaluate(ordered_);
    t2 = std::chrono::high_resolution_clock::now();
    timing_.evaluation_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    auto pipeline_end = std::chrono::high_resolution_clock::now();
    timing_.total_time_ms = std::chrono::duration<double, std::milli>(pipeline_end - pipeline_start).count();

    return collectErrors(snapshot_).empty();
}

std::string ParamRunner::render(const std::string& templateText) const {
    if (!evaluator_) {
        throw std::runtime_error("render called before a successful run");
    }
    return evaluator_->formatEval(templateText, ordered_);
}

// Helper to write string to file
static void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not write " << path.string() << "\n";
        return;
    }
    file << content;
}

void ParamRunner::generateDebugOutput(const std::string& debugDirStr) const {
    fs::path debugDir(debugDirStr);
    try {
        fs::create_directories(debugDir);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error: Could not create debug directory '" << debugDirStr << "': " << e.what() << "\n";
        return;
    }

    // 1. Original definitions
    writeFile(debugDir / "definitions.txt", sourceText_);

    // 2. Summary
    auto failures = collectErrors(snapshot_);
    std::ostringstream stats;
    stats << "# Evaluation Summary\n\n";
    stats << "**Input file:** " << inputFile_ << "\n\n";

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    stats << "**Generated:** " << std::ctime(&time) << "\n";

    stats << "| Metric | Value |\n";
    stats << "|--------|-------|\n";
    stats << "| Fields | " << definitions_.size() << " |\n";
    stats << "| Static fields | " << orderingResult_.staticCount << " |\n";
    stats << "| Dynamic fields | " << orderingResult_.dynamicCount << " |\n";
    stats << "| Forced by ordering | " << orderingResult_.forced.size() << " |\n";
    stats << "| Failed fields | " << failures.size() << " |\n";

    if (!orderingResult_.errorMessage.empty()) {
        stats << "\n## Warnings\n\n";
        stats << "- " << orderingResult_.errorMessage << "\n";
    }

    stats << "\n## Constants\n\n";
    stats << "| Name | Value | Description |\n";
    stats << "|------|-------|-------------|\n";
    for (const auto& [name, info] : Constants::getAll()) {
        stats << "| `" << name << "` | " << formatNumber(info.value) << " | " << info.description << " |\n";
    }
    writeFile(debugDir / "report.md", stats.str());

    // 3. Ordering
    writeFile(debugDir / "ordering.json", generateOrderingJSON(orderingResult_));

    // 4. Field table
    std::ostringstream fields;
    fields << "# Fields\n\n";
    fields << "| # | Name | Processing | Kind | Definition | Value |\n";
    fields << "|---|------|------------|------|------------|-------|\n";
    for (size_t i = 0; i < ordered_.size(); ++i) {
        const std::string& name = ordered_.keyAt(i);
        const Value* value = snapshot_.find(name);
        fields << "| " << i + 1;
        fields << " | `" << name << "`";
        const Value& raw = ordered_.at(i);
        if (raw.isText()) {
            fields << " | " << expressionKindToString(
                ExpressionGrammar::classify(ExpressionGrammar::stripComment(raw.asText())));
        } else {
            fields << " | " << (raw.is<PathValue>() ? "path" : "-");
        }
        fields << " | " << (value ? kindToString(value->kind()) : "-");
        fields << " | `" << valueToLiteral(raw) << "`";
        fields << " | `" << (value ? toRepr(*value) : "-") << "`";
        fields << " |\n";
    }
    writeFile(debugDir / "fields.md", fields.str());

    // 5. Snapshot
    writeFile(debugDir / "snapshot.txt", recordToText(snapshot_));
    writeFile(debugDir / "snapshot.json", recordToJson(snapshot_).dump(2));
    writeFile(debugDir / "evaluation.txt", generateRecordReport(definitions_, snapshot_));

    // 6. Errors
    if (!failures.empty()) {
        std::ostringstream errs;
        errs << "# Evaluation Errors\n\n";
        for (const auto& [name, marker] : failures) {
            errs << "- **" << name << "**: " << marker.cause;
            if (!marker.missingName.empty()) errs << " (define `" << marker.missingName << "`)";
            errs << "\n";
        }
        writeFile(debugDir / "errors.md", errs.str());
    }

    // 7. Profiling
    std::ostringstream prof;
    prof << "# Profiling Report\n\n";
    prof << "| Stage | Time (ms) |\n|---|---|\n";
    prof << std::fixed << std::setprecision(3);
    prof << "| Read | " << timing_.read_time_ms << " |\n";
    prof << "| Ordering | " << timing_.ordering_time_ms << " |\n";
    prof << "| Evaluation | " << timing_.evaluation_time_ms << " |\n";
    prof << "| **Total** | **" << timing_.total_time_ms << "** |\n";
    writeFile(debugDir / "profiling.md", prof.str());

    // 8. Index
    std::ostringstream index;
    index << "# paramscript Debug Output\n\n";
    index << "Evaluation of: `" << inputFile_ << "`\n\n";
    index << "## Contents\n\n";
    index << "| File | Description |\n|---|---|\n";
    index << "| [report.md](report.md) | Field statistics |\n";
    index << "| [fields.md](fields.md) | Definitions and values in evaluation order |\n";
    index << "| [ordering.json](ordering.json) | Dependency ordering |\n";
    index << "| [snapshot.txt](snapshot.txt) | Evaluated fields, text format |\n";
    index << "| [snapshot.json](snapshot.json) | Evaluated fields, JSON |\n";
    index << "| [evaluation.txt](evaluation.txt) | Evaluation report |\n";
    index << "| [profiling.md](profiling.md) | Pipeline timing |\n";
    if (!failures.empty()) {
        index << "| [errors.md](errors.md) | Failed fields |\n";
    }
    writeFile(debugDir / "README.md", index.str());
}

}  // namespace paramscript
