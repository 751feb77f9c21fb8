#include "paramscript/functions.h"
#include "paramscript/array_ops.h"
#include "paramscript/errors.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <numeric>
#include <set>

namespace paramscript {

using UnaryKernel = std::function<double(double)>;
using BinaryKernel = std::function<double(double, double)>;

static constexpr double PI = 3.14159265358979323846;

// ============================================================================
// Operators
// ============================================================================

static double pythonModulo(double x, double y) {
    if (y == 0.0) return std::numeric_limits<double>::quiet_NaN();
    double r = std::fmod(x, y);
    if (r != 0.0 && ((r < 0.0) != (y < 0.0))) r += y;
    return r;
}

static BinaryKernel binaryKernel(const std::string& op) {
    if (op == "+") return [](double x, double y) { return x + y; };
    if (op == "-") return [](double x, double y) { return x - y; };
    if (op == "*") return [](double x, double y) { return x * y; };
    if (op == "/") return [](double x, double y) { return x / y; };
    if (op == "//") return [](double x, double y) { return std::floor(x / y); };
    if (op == "%") return pythonModulo;
    if (op == "**") return [](double x, double y) { return std::pow(x, y); };
    throw EvaluationError("unknown operator " + op);
}

static bool isNumericValue(const Value& value) {
    return isScalar(value) || value.is<List>() || value.is<NdArray>();
}

Value applyUnaryOperator(const std::string& op, const Value& operand) {
    if (op != "-" && op != "+") {
        throw EvaluationError("unknown unary operator " + op);
    }
    if (isScalar(operand)) {
        double x = toScalar(operand);
        return Value(op == "-" ? -x : x);
    }
    if (operand.is<List>() || operand.is<NdArray>()) {
        NdArray array = toArray(operand);
        if (op == "-") array = mapArray(array, [](double x) { return -x; });
        return fromArray(std::move(array), operand.is<List>());
    }
    throw EvaluationError("bad operand type for unary " + op + ": " + kindToString(operand.kind()));
}

Value applyBinaryOperator(const std::string& op, const Value& left, const Value& right) {
    if (op == "+" && left.isText() && right.isText()) {
        return Value(left.asText() + right.asText());
    }

    if (!isNumericValue(left) || !isNumericValue(right)) {
        throw EvaluationError("unsupported operand types for " + op + ": " +
                              kindToString(left.kind()) + " and " + kindToString(right.kind()));
    }

    if (op == "@") {
        return fromArray(matmul(toArray(left), toArray(right)), false);
    }

    BinaryKernel kernel = binaryKernel(op);
    if (isScalar(left) && isScalar(right)) {
        return Value(kernel(toScalar(left), toScalar(right)));
    }

    bool asList = !left.is<NdArray>() && !right.is<NdArray>();
    return fromArray(broadcastBinary(toArray(left), toArray(right), kernel), asList);
}

// ============================================================================
// Function tables
// ============================================================================

static const std::map<std::string, UnaryKernel> ELEMENTWISE_FUNCTIONS = {
    {"sin", [](double x) { return std::sin(x); }},
    {"cos", [](double x) { return std::cos(x); }},
    {"tan", [](double x) { return std::tan(x); }},
    {"asin", [](double x) { return std::asin(x); }},
    {"acos", [](double x) { return std::acos(x); }},
    {"atan", [](double x) { return std::atan(x); }},
    {"sinh", [](double x) { return std::sinh(x); }},
    {"cosh", [](double x) { return std::cosh(x); }},
    {"tanh", [](double x) { return std::tanh(x); }},
    {"exp", [](double x) { return std::exp(x); }},
    {"log", [](double x) { return std::log(x); }},
    {"ln", [](double x) { return std::log(x); }},
    {"log10", [](double x) { return std::log10(x); }},
    {"log2", [](double x) { return std::log2(x); }},
    {"sqrt", [](double x) { return std::sqrt(x); }},
    {"abs", [](double x) { return std::fabs(x); }},
    {"floor", [](double x) { return std::floor(x); }},
    {"ceil", [](double x) { return std::ceil(x); }},
    {"round", [](double x) { return std::nearbyint(x); }},  // half to even
    {"degrees", [](double x) { return x * 180.0 / PI; }},
    {"radians", [](double x) { return x * PI / 180.0; }}
};

static const std::map<std::string, BinaryKernel> ELEMENTWISE_BINARY_FUNCTIONS = {
    {"atan2", [](double y, double x) { return std::atan2(y, x); }},
    {"pow", [](double x, double y) { return std::pow(x, y); }},
    {"hypot", [](double x, double y) { return std::hypot(x, y); }},
    {"fmod", [](double x, double y) { return std::fmod(x, y); }}
};

static const std::set<std::string> OTHER_FUNCTIONS = {
    "min", "max", "sum", "prod", "mean", "len", "size",
    "array", "array2d", "zeros", "ones", "eye", "linspace", "arange",
    "transpose", "matmul", "inv", "det", "trace", "eig", "eigvec"
};

bool isStandardFunction(const std::string& name) {
    return ELEMENTWISE_FUNCTIONS.count(name) > 0 ||
           ELEMENTWISE_BINARY_FUNCTIONS.count(name) > 0 ||
           OTHER_FUNCTIONS.count(name) > 0;
}

// ============================================================================
// Helpers
// ============================================================================

static void requireArgs(const std::string& name, const std::vector<Value>& args,
                        size_t minArgs, size_t maxArgs) {
    if (args.size() < minArgs || args.size() > maxArgs) {
        std::string expected = minArgs == maxArgs
            ? std::to_string(minArgs)
            : std::to_string(minArgs) + " to " + std::to_string(maxArgs);
        throw EvaluationError("function " + name + " expects " + expected +
                              " argument(s), got " + std::to_string(args.size()));
    }
}

static Value mapValue(const Value& arg, const UnaryKernel& fn) {
    if (isScalar(arg)) return Value(fn(toScalar(arg)));
    return fromArray(mapArray(toArray(arg), fn), arg.is<List>());
}

static Value zipValues(const Value& a, const Value& b, const BinaryKernel& fn) {
    if (isScalar(a) && isScalar(b)) return Value(fn(toScalar(a), toScalar(b)));
    bool asList = !a.is<NdArray>() && !b.is<NdArray>();
    return fromArray(broadcastBinary(toArray(a), toArray(b), fn), asList);
}

static size_t toCount(const Value& value, const std::string& what) {
    long n = toInteger(value, what);
    if (n < 0) throw EvaluationError(what + " must not be negative");
    if (static_cast<size_t>(n) > MAX_ARRAY_ELEMENTS) {
        throw EvaluationError(what + " is too large");
    }
    return static_cast<size_t>(n);
}

static std::vector<size_t> shapeArgument(const std::string& name, const std::vector<Value>& args) {
    std::vector<Value> dims = args;
    if (args.size() == 1 && args[0].is<List>()) dims = args[0].as<List>();
    if (dims.empty() || dims.size() > MAX_ARRAY_DIMENSIONS) {
        throw EvaluationError(name + ": expected 1 to 4 dimensions");
    }
    std::vector<size_t> shape;
    size_t count = 1;
    for (const auto& d : dims) {
        size_t extent = toCount(d, name + " dimension");
        if (extent != 0 && count > MAX_ARRAY_ELEMENTS / extent) {
            throw EvaluationError(name + ": array is too large");
        }
        count *= extent;
        shape.push_back(extent);
    }
    return shape;
}

static Value minMax(const std::string& name, const std::vector<Value>& args) {
    bool isMin = name == "min";
    std::vector<double> values;
    if (args.size() == 1 && !isScalar(args[0])) {
        values = toArray(args[0]).data;
    } else {
        for (const auto& arg : args) {
            if (!isScalar(arg)) {
                throw EvaluationError(name + " expects numbers or a single sequence");
            }
            values.push_back(toScalar(arg));
        }
    }
    if (values.empty()) {
        throw EvaluationError(name + "() arg is an empty sequence");
    }
    double result = values.front();
    for (double v : values) {
        if (isMin ? v < result : v > result) result = v;
    }
    return Value(result);
}

static Value generateRange(const std::string& name, const std::vector<Value>& args) {
    if (name == "linspace") {
        requireArgs(name, args, 2, 3);
        double a = toScalar(args[0]);
        double b = toScalar(args[1]);
        size_t n = args.size() == 3 ? toCount(args[2], "linspace count") : 50;
        std::vector<double> data(n);
        for (size_t i = 0; i < n; ++i) {
            data[i] = n == 1 ? a : a + (b - a) * static_cast<double>(i) / static_cast<double>(n - 1);
        }
        return Value(NdArray::vector(std::move(data)));
    }

    // arange
    requireArgs(name, args, 1, 3);
    double start = args.size() == 1 ? 0.0 : toScalar(args[0]);
    double stop = args.size() == 1 ? toScalar(args[0]) : toScalar(args[1]);
    double step = args.size() == 3 ? toScalar(args[2]) : 1.0;
    if (step == 0.0) {
        throw EvaluationError("arange: step cannot be zero");
    }
    double count = std::ceil((stop - start) / step);
    if (!(count >= 0.0)) count = 0.0;
    if (count > static_cast<double>(MAX_ARRAY_ELEMENTS)) {
        throw EvaluationError("arange: too many elements");
    }
    std::vector<double> data(static_cast<size_t>(count));
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = start + step * static_cast<double>(i);
    }
    return Value(NdArray::vector(std::move(data)));
}

// ============================================================================
// Standard Function Evaluation
// ============================================================================

Value evaluateStandardFunction(const std::string& name, const std::vector<Value>& args) {
    // Element-wise functions of one argument
    auto unary = ELEMENTWISE_FUNCTIONS.find(name);
    if (unary != ELEMENTWISE_FUNCTIONS.end()) {
        if (name == "round" && args.size() == 2) {
            double scale = std::pow(10.0, static_cast<double>(toInteger(args[1], "round digits")));
            return mapValue(args[0], [scale](double x) { return std::nearbyint(x * scale) / scale; });
        }
        requireArgs(name, args, 1, 1);
        return mapValue(args[0], unary->second);
    }

    // Element-wise functions of two arguments
    auto binary = ELEMENTWISE_BINARY_FUNCTIONS.find(name);
    if (binary != ELEMENTWISE_BINARY_FUNCTIONS.end()) {
        requireArgs(name, args, 2, 2);
        return zipValues(args[0], args[1], binary->second);
    }

    // Reductions
    if (name == "min" || name == "max") {
        requireArgs(name, args, 1, std::numeric_limits<size_t>::max());
        return minMax(name, args);
    }
    if (name == "sum" || name == "prod" || name == "mean") {
        requireArgs(name, args, 1, 1);
        std::vector<double> data = toArray(args[0]).data;
        if (name == "sum") return Value(std::accumulate(data.begin(), data.end(), 0.0));
        if (name == "prod") {
            return Value(std::accumulate(data.begin(), data.end(), 1.0, std::multiplies<double>()));
        }
        if (data.empty()) return Value(std::numeric_limits<double>::quiet_NaN());
        return Value(std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size()));
    }
    if (name == "len") {
        requireArgs(name, args, 1, 1);
        const Value& x = args[0];
        if (x.is<List>()) return Value(static_cast<double>(x.as<List>().size()));
        if (x.isText()) return Value(static_cast<double>(x.asText().size()));
        if (x.is<NdArray>() && x.as<NdArray>().ndim() > 0) {
            return Value(static_cast<double>(x.as<NdArray>().shape[0]));
        }
        throw EvaluationError("a " + kindToString(x.kind()) + " value has no length");
    }
    if (name == "size") {
        requireArgs(name, args, 1, 1);
        List dims;
        for (size_t d : toArray(args[0]).shape) dims.emplace_back(static_cast<double>(d));
        return Value(std::move(dims));
    }

    // Construction
    if (name == "array") {
        requireArgs(name, args, 1, 1);
        return fromArray(toArray(args[0]), false);
    }
    if (name == "array2d") {
        requireArgs(name, args, 1, 1);
        return Value(atLeast2d(toArray(args[0])));
    }
    if (name == "zeros" || name == "ones") {
        return Value(NdArray::filled(shapeArgument(name, args), name == "ones" ? 1.0 : 0.0));
    }
    if (name == "eye") {
        requireArgs(name, args, 1, 1);
        size_t n = toCount(args[0], "eye size");
        if (n != 0 && n > MAX_ARRAY_ELEMENTS / n) {
            throw EvaluationError("eye: array is too large");
        }
        NdArray identity = NdArray::filled({n, n}, 0.0);
        for (size_t i = 0; i < n; ++i) identity.data[i * n + i] = 1.0;
        return Value(std::move(identity));
    }
    if (name == "linspace" || name == "arange") {
        return generateRange(name, args);
    }

    // Linear algebra
    if (name == "transpose") {
        requireArgs(name, args, 1, 1);
        return fromArray(transposeArray(toArray(args[0])), false);
    }
    if (name == "matmul") {
        requireArgs(name, args, 2, 2);
        return fromArray(matmul(toArray(args[0]), toArray(args[1])), false);
    }
    if (name == "inv") {
        requireArgs(name, args, 1, 1);
        return Value(inverse(toArray(args[0])));
    }
    if (name == "det") {
        requireArgs(name, args, 1, 1);
        return Value(determinant(toArray(args[0])));
    }
    if (name == "trace") {
        requireArgs(name, args, 1, 1);
        NdArray m = toArray(args[0]);
        if (m.ndim() != 2) {
            throw EvaluationError("trace: expected a matrix, got shape " + shapeToString(m.shape));
        }
        double total = 0.0;
        for (size_t i = 0; i < std::min(m.shape[0], m.shape[1]); ++i) {
            total += m.data[i * m.shape[1] + i];
        }
        return Value(total);
    }
    if (name == "eig") {
        requireArgs(name, args, 1, 1);
        return Value(eigenvalues(toArray(args[0])));
    }
    if (name == "eigvec") {
        requireArgs(name, args, 1, 1);
        return Value(eigenvectors(toArray(args[0])));
    }

    throw UnresolvedReference(name, "unknown function `" + name + "`");
}

}  // namespace paramscript
