#pragma once

#include "paramscript/dependency_resolver.h"
#include "paramscript/evaluator.h"
#include "paramscript/options.h"
#include "paramscript/record.h"
#include <memory>
#include <string>

namespace paramscript {

class ParamRunner {
public:
    explicit ParamRunner(const std::string& inputFile);

    // Read -> order -> evaluate. False on I/O or strict ordering failure, or
    // when the snapshot holds ErrorMarkers.
    bool run(const EvaluatorOptions& options = EvaluatorOptions());

    // Render a template against the ordered definitions (formatEval rules)
    std::string render(const std::string& templateText) const;

    // Generate debug output
    void generateDebugOutput(const std::string& debugDir) const;

    struct PipelineTiming {
        double read_time_ms = 0.0;
        double ordering_time_ms = 0.0;
        double evaluation_time_ms = 0.0;
        double total_time_ms = 0.0;
    };

    // Accessors
    const std::string& getSourceText() const { return sourceText_; }
    const Record& getDefinitions() const { return definitions_; }
    const Record& getOrderedDefinitions() const { return ordered_; }
    const Record& getSnapshot() const { return snapshot_; }
    const OrderingResult& getOrderingResult() const { return orderingResult_; }
    const PipelineTiming& getTiming() const { return timing_; }
    const std::string& getErrorMessage() const { return errorMessage_; }

    bool isReadSuccess() const { return readSuccess_; }
    bool isOrderingSuccess() const { return orderingResult_.success; }
    bool isEvaluated() const { return evaluator_ != nullptr; }
    size_t getErrorCount() const { return collectErrors(snapshot_).size(); }

private:
    std::string inputFile_;
    std::string sourceText_;
    std::string errorMessage_;
    bool readSuccess_ = false;

    Record definitions_;
    Record ordered_;
    Record snapshot_;
    OrderingResult orderingResult_;
    PipelineTiming timing_;
    std::shared_ptr<Evaluator> evaluator_;
};

}  // namespace paramscript
