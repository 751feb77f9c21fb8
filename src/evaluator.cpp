#include "paramscript/evaluator.h"
#include "paramscript/array_ops.h"
#include "paramscript/constants.h"
#include "paramscript/dependency_resolver.h"
#include "paramscript/errors.h"
#include "paramscript/functions.h"
#include <iostream>
#include <sstream>

namespace paramscript {

// A field that failed cannot be used by later expressions. The root missing
// name is carried along so the caller still sees what to define.
static void requireUsable(const std::string& name, const Value& value) {
    if (!value.isError()) return;
    const auto& marker = value.as<ErrorMarker>();
    std::string message = "reference to failed field `" + name + "`: " + marker.cause;
    if (!marker.missingName.empty()) {
        throw UnresolvedReference(marker.missingName, message);
    }
    throw EvaluationError(message);
}

static NdArray scalarArray(double value) {
    NdArray array;
    array.data.push_back(value);
    return array;
}

// ============================================================================
// ExpressionEvaluator
// ============================================================================

ExpressionEvaluator::ExpressionEvaluator(const Record* context, size_t maxRangeElements)
    : context_(context), maxRangeElements_(maxRangeElements) {}

Value ExpressionEvaluator::evaluate(const ExprPtr& expr) const {
    if (!expr) {
        throw EvaluationError("empty expression");
    }

    if (expr->is<NumberLiteral>()) {
        return Value(expr->as<NumberLiteral>().value);
    }
    if (expr->is<StringLiteral>()) {
        return Value(expr->as<StringLiteral>().value);
    }
    if (expr->is<BooleanLiteral>()) {
        return Value(expr->as<BooleanLiteral>().value);
    }
    if (expr->is<NoneLiteral>()) {
        return Value();
    }
    if (expr->is<Name>()) {
        return evaluateName(expr->as<Name>().name);
    }
    if (expr->is<ListLiteral>()) {
        List items;
        for (const auto& item : expr->as<ListLiteral>().items) {
            items.push_back(evaluate(item));
        }
        return Value(std::move(items));
    }
    if (expr->is<ArrayLiteral>()) {
        const auto& array = expr->as<ArrayLiteral>();
        NdArray block = evaluateArrayBlock(array);
        if (array.nested) return Value(std::move(block));
        return Value(atLeast2d(block));
    }
    if (expr->is<RangeLiteral>()) {
        const auto& range = expr->as<RangeLiteral>();
        return Value(NdArray::vector(
            ExpressionGrammar::expandRange(range.start, range.step, range.stop, maxRangeElements_)));
    }
    if (expr->is<UnaryOp>()) {
        const auto& unary = expr->as<UnaryOp>();
        return applyUnaryOperator(unary.op, evaluate(unary.operand));
    }
    if (expr->is<BinaryOp>()) {
        const auto& binary = expr->as<BinaryOp>();
        Value left = evaluate(binary.left);
        Value right = evaluate(binary.right);
        return applyBinaryOperator(binary.op, left, right);
    }
    if (expr->is<FunctionCall>()) {
        const auto& call = expr->as<FunctionCall>();
        std::vector<Value> args;
        args.reserve(call.args.size());
        for (const auto& arg : call.args) {
            args.push_back(evaluate(arg));
        }
        return evaluateStandardFunction(call.name, args);
    }
    if (expr->is<Subscript>()) {
        return evaluateSubscript(expr->as<Subscript>());
    }
    if (expr->is<Transpose>()) {
        Value operand = evaluate(expr->as<Transpose>().operand);
        if (isScalar(operand)) return operand;
        return fromArray(transposeArray(toArray(operand)), false);
    }

    throw EvaluationError("unsupported expression");
}

Value ExpressionEvaluator::evaluateName(const std::string& name) const {
    if (context_) {
        if (const Value* value = context_->find(name)) {
            requireUsable(name, *value);
            return *value;
        }
    }
    if (auto constant = Constants::lookup(name)) {
        return Value(*constant);
    }
    throw UnresolvedReference(name);
}

// Each row stacks its items along a new axis (ranges contribute their
// elements one by one); several rows are stacked again.
NdArray ExpressionEvaluator::evaluateArrayBlock(const ArrayLiteral& array) const {
    std::vector<NdArray> rows;
    rows.reserve(array.rows.size());

    for (const auto& row : array.rows) {
        std::vector<NdArray> items;
        for (const auto& item : row) {
            if (item->is<RangeLiteral>()) {
                const auto& range = item->as<RangeLiteral>();
                for (double x : ExpressionGrammar::expandRange(range.start, range.step, range.stop,
                                                               maxRangeElements_)) {
                    items.push_back(scalarArray(x));
                }
            } else if (item->is<ArrayLiteral>()) {
                items.push_back(evaluateArrayBlock(item->as<ArrayLiteral>()));
            } else {
                items.push_back(toArray(evaluate(item)));
            }
        }
        rows.push_back(stackArrays(items));
    }

    if (rows.size() == 1) return rows.front();
    NdArray stacked = stackArrays(rows);
    if (stacked.ndim() > MAX_ARRAY_DIMENSIONS) {
        throw EvaluationError("array literal has more than " +
                              std::to_string(MAX_ARRAY_DIMENSIONS) + " dimensions");
    }
    return stacked;
}

Value ExpressionEvaluator::evaluateSubscript(const Subscript& subscript) const {
    Value target = evaluate(subscript.target);

    std::vector<IndexSpec> specs;
    specs.reserve(subscript.items.size());
    for (const auto& item : subscript.items) {
        IndexSpec spec;
        spec.isSlice = item.isSlice;
        if (item.isSlice) {
            if (item.start) spec.start = evaluateIndex(item.start);
            if (item.stop) spec.stop = evaluateIndex(item.stop);
            if (item.step) spec.step = evaluateIndex(item.step);
        } else {
            spec.index = evaluateIndex(item.index);
        }
        specs.push_back(spec);
    }
    return indexValue(target, specs);
}

long ExpressionEvaluator::evaluateIndex(const ExprPtr& expr) const {
    return toInteger(evaluate(expr), "index");
}

// ============================================================================
// Evaluator
// ============================================================================

Evaluator::Evaluator(const EvaluatorOptions& options)
    : options_(options), parser_(std::make_shared<ExpressionParser>()) {
    if (!parser_->isGrammarValid()) {
        throw std::runtime_error("Expression grammar failed to load: " + parser_->getLastError());
    }
}

Record Evaluator::evaluate(const Record& record) const {
    Record source = record;

    if (options_.protection) {
        Record protectedSource;
        for (size_t i = 0; i < record.size(); ++i) {
            const Value& raw = record.at(i);
            if (raw.isText()) {
                protectedSource.set(record.keyAt(i),
                                    Value(ExpressionGrammar::protect(raw.asText(), record.keys())));
            } else {
                protectedSource.set(record.keyAt(i), raw);
            }
        }
        source = protectedSource;
    }

    if (options_.sortDefinitions) {
        OrderingMode mode = options_.strictOrdering ? OrderingMode::Strict : OrderingMode::Lenient;
        source = DependencyResolver::sort(source, mode, options_.silent);
    }

    Record snapshot;
    for (size_t i = 0; i < source.size(); ++i) {
        const std::string& name = source.keyAt(i);
        Value result = evaluateField(name, source.at(i), snapshot);
        if (options_.verbose) {
            std::cerr << "  " << name << " = " << toRepr(result) << "\n";
        }
        snapshot.set(name, std::move(result));
    }
    return snapshot;
}

Record Evaluator::evaluate(const Record& record, const std::vector<std::string>& names) const {
    for (const auto& name : names) {
        if (!record.has(name)) throw FieldNotFound(name);
    }
    return evaluate(record).select(names);
}

Value Evaluator::value(const Record& record, const std::string& name) const {
    if (!record.has(name)) throw FieldNotFound(name);
    return evaluate(record).get(name);
}

Value Evaluator::evaluateField(const std::string& name, const Value& raw, const Record& snapshot) const {
    if (raw.isText()) return evaluateText(name, raw.asText(), snapshot);
    if (raw.is<PathValue>()) return evaluatePath(raw.as<PathValue>(), snapshot);
    return raw;
}

Value Evaluator::evaluateText(const std::string& name, const std::string& raw, const Record& snapshot) const {
    // ${own name} is kept as written
    if (ExpressionGrammar::isSelfReference(raw, name)) {
        return Value(raw);
    }

    std::string text = ExpressionGrammar::stripComment(raw);

    if (!options_.evaluation) {
        return Value(format(text, snapshot));
    }

    try {
        switch (ExpressionGrammar::classify(text)) {
            case ExpressionKind::RecursiveLiteral:
                return evaluateLiteralList(ExpressionGrammar::stripPrefix(text), snapshot);
            case ExpressionKind::LiteralText:
                return Value(substitute(ExpressionGrammar::stripPrefix(text), snapshot));
            case ExpressionKind::PartialInterpolation:
                return Value(substitute(text, snapshot));
            case ExpressionKind::Evaluation:
                break;
        }

        std::string trimmed = ExpressionGrammar::trim(text);
        if (trimmed.empty()) {
            return Value(text);
        }

        // A lone ${...} keeps the referenced value and its kind
        auto markers = ExpressionGrammar::findMarkers(trimmed);
        if (markers.size() == 1 && markers.front().sigil == '$' && !markers.front().escaped &&
            markers.front().begin == 0 && markers.front().end == trimmed.size()) {
            Value resolved = resolveMarker(markers.front(), snapshot);
            if (!resolved.isText()) return resolved;
        }
        return evaluateArithmetic(substitute(text, snapshot));
    } catch (const UnresolvedReference& e) {
        return Value(ErrorMarker{e.what(), e.name()});
    } catch (const EvaluationError& e) {
        return Value(ErrorMarker{e.what(), ""});
    } catch (const ExpressionSyntaxError& e) {
        return Value(ErrorMarker{e.what(), ""});
    }
}

Value Evaluator::evaluatePath(const PathValue& path, const Record& snapshot) const {
    if (!options_.evaluation) {
        return Value(PathValue(format(path.str(), snapshot)));
    }
    try {
        return Value(PathValue(substitute(path.str(), snapshot)));
    } catch (const UnresolvedReference& e) {
        return Value(ErrorMarker{e.what(), e.name()});
    } catch (const EvaluationError& e) {
        return Value(ErrorMarker{e.what(), ""});
    } catch (const ExpressionSyntaxError& e) {
        return Value(ErrorMarker{e.what(), ""});
    }
}

/**
 * !<literal>: markers outside quotes are substituted first (unresolved ones
 * become quoted text), then the literal is evaluated and each string element
 * is interpolated and evaluated on its own.
 */
Value Evaluator::evaluateLiteralList(const std::string& body, const Record& snapshot) const {
    std::string source = ExpressionGrammar::interpolate(body, [&](const Marker& marker) -> std::string {
        try {
            return toRepr(resolveMarker(marker, snapshot));
        } catch (const UnresolvedReference&) {
            return "'" + marker.text() + "'";
        }
    }, true);

    ExprPtr expr = parser_->parseOrThrow(ExpressionGrammar::toPowerOperator(source));
    ExpressionEvaluator literal(nullptr, options_.maxRangeElements);
    return freezeStrings(literal.evaluate(expr), snapshot);
}

Value Evaluator::freezeStrings(const Value& value, const Record& snapshot) const {
    if (value.is<List>()) {
        List items;
        for (const auto& item : value.as<List>()) {
            items.push_back(freezeStrings(item, snapshot));
        }
        return Value(std::move(items));
    }
    if (!value.isText()) return value;

    const std::string& text = value.asText();
    if (ExpressionGrammar::isLiteralText(text)) return value;

    try {
        return evaluateArithmetic(substitute(text, snapshot));
    } catch (const UnresolvedReference& e) {
        return Value(ErrorMarker{e.what(), e.name()});
    } catch (const EvaluationError& e) {
        return Value(ErrorMarker{e.what(), ""});
    } catch (const ExpressionSyntaxError& e) {
        return Value(ErrorMarker{e.what(), ""});
    }
}

// Text that is not arithmetic stays text unless strictArithmetic is set
Value Evaluator::evaluateArithmetic(const std::string& text) const {
    ParseResult parsed = parser_->parse(ExpressionGrammar::toPowerOperator(text));
    if (!parsed.success) {
        if (options_.strictArithmetic) {
            return Value(ErrorMarker{"invalid expression `" + text + "`: " + parsed.errorMessage, ""});
        }
        return Value(text);
    }

    ExpressionEvaluator expression(nullptr, options_.maxRangeElements);
    try {
        return expression.evaluate(parsed.expression);
    } catch (const UnresolvedReference& e) {
        if (options_.strictArithmetic) {
            return Value(ErrorMarker{e.what(), e.name()});
        }
        return Value(text);
    }
}

Value Evaluator::resolveMarker(const Marker& marker, const Record& snapshot) const {
    std::string content = ExpressionGrammar::trim(marker.content);

    if (ExpressionGrammar::isIdentifier(content)) {
        if (const Value* value = snapshot.find(content)) {
            requireUsable(content, *value);
            return *value;
        }
        if (auto constant = Constants::lookup(content)) {
            return Value(*constant);
        }
        throw UnresolvedReference(content);
    }

    ExprPtr expr = parser_->parseOrThrow(ExpressionGrammar::toPowerOperator(content));
    ExpressionEvaluator local(&snapshot, options_.maxRangeElements);
    return local.evaluate(expr);
}

std::string Evaluator::substitute(const std::string& text, const Record& snapshot) const {
    return ExpressionGrammar::interpolate(text, [&](const Marker& marker) {
        std::string fragment = toText(resolveMarker(marker, snapshot));
        return marker.sigil == '@' ? "array2d(" + fragment + ")" : fragment;
    });
}

// ============================================================================
// Templates
// ============================================================================

std::string Evaluator::format(const std::string& tmpl, const Record& record) const {
    return ExpressionGrammar::interpolate(tmpl, [&](const Marker& marker) -> std::string {
        if (marker.sigil != '$') return marker.text();
        try {
            return toText(resolveMarker(marker, record));
        } catch (const UnresolvedReference& e) {
            if (!options_.silent) std::cerr << "Warning: " << e.what() << " in " << marker.text() << "\n";
        } catch (const EvaluationError& e) {
            if (!options_.silent) std::cerr << "Warning: " << e.what() << " in " << marker.text() << "\n";
        } catch (const ExpressionSyntaxError& e) {
            if (!options_.silent) std::cerr << "Warning: " << e.what() << "\n";
        }
        return marker.text();
    });
}

std::string Evaluator::evaluateLine(const std::string& line, const Record& snapshot) const {
    size_t first = line.find_first_not_of(" \t");
    if (first == std::string::npos) return line;
    if (line[first] == '#') return format(line, snapshot);
    if (line[first] == '%') return line.substr(0, first) + "#" + format(line.substr(first + 1), snapshot);

    size_t hash = std::string::npos;
    for (size_t i = first; i < line.size(); ++i) {
        if (line[i] == '#' && line[i - 1] != '\\') {
            hash = i;
            break;
        }
    }
    std::string code = ExpressionGrammar::stripComment(hash == std::string::npos ? line : line.substr(0, hash));
    std::string comment = hash == std::string::npos ? "" : line.substr(hash);

    std::string text = format(code, snapshot);
    std::string body = ExpressionGrammar::trim(text);
    if (body.empty() || ExpressionGrammar::hasMarkers(body)) return text + comment;

    ParseResult parsed = parser_->parse(ExpressionGrammar::toPowerOperator(body));
    if (!parsed.success) return text + comment;

    try {
        Value result = ExpressionEvaluator(nullptr, options_.maxRangeElements).evaluate(parsed.expression);
        if (!result.isText()) {
            size_t lead = text.find_first_not_of(" \t");
            size_t tail = text.find_last_not_of(" \t\r");
            text = text.substr(0, lead) + toText(result) + text.substr(tail + 1);
        }
    } catch (const UnresolvedReference&) {
        // plain words stay as written
    } catch (const EvaluationError& e) {
        if (options_.verbose) std::cerr << "Warning: line '" << body << "': " << e.what() << "\n";
    }
    return text + comment;
}

std::string Evaluator::formatEval(const std::string& tmpl, const Record& record) const {
    Record snapshot = evaluate(record);

    std::ostringstream out;
    size_t start = 0;
    while (true) {
        size_t newline = tmpl.find('\n', start);
        if (newline == std::string::npos) {
            out << evaluateLine(tmpl.substr(start), snapshot);
            break;
        }
        out << evaluateLine(tmpl.substr(start, newline - start), snapshot) << '\n';
        start = newline + 1;
    }
    return out.str();
}

// ============================================================================
// Error collection
// ============================================================================

std::vector<std::pair<std::string, ErrorMarker>> collectErrors(const Record& snapshot) {
    std::vector<std::pair<std::string, ErrorMarker>> failures;
    for (size_t i = 0; i < snapshot.size(); ++i) {
        if (snapshot.at(i).isError()) {
            failures.emplace_back(snapshot.keyAt(i), snapshot.at(i).as<ErrorMarker>());
        }
    }
    return failures;
}

}  // namespace paramscript
