#include "paramscript/array_ops.h"
#include "paramscript/errors.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace paramscript {

using RowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// ============================================================================
// Conversions
// ============================================================================

bool isScalar(const Value& value) {
    return value.isNumber() || value.is<bool>();
}

double toScalar(const Value& value) {
    if (value.isNumber()) return value.asNumber();
    if (value.is<bool>()) return value.as<bool>() ? 1.0 : 0.0;
    throw EvaluationError("expected a number, got " + kindToString(value.kind()));
}

long toInteger(const Value& value, const std::string& what) {
    if (!isScalar(value)) {
        throw EvaluationError(what + " must be an integer, got " + kindToString(value.kind()));
    }
    double x = toScalar(value);
    if (!std::isfinite(x) || std::floor(x) != x) {
        throw EvaluationError(what + " must be an integer, got " + formatNumber(x));
    }
    // 2^63 and -2^63 are exact doubles
    const double limit = -static_cast<double>(std::numeric_limits<long>::min());
    if (x < -limit || x >= limit) {
        throw EvaluationError(what + " is out of range: " + formatNumber(x));
    }
    return static_cast<long>(x);
}

static NdArray listToArray(const List& items, size_t depth) {
    if (depth > MAX_ARRAY_DIMENSIONS) {
        throw EvaluationError("arrays are limited to " + std::to_string(MAX_ARRAY_DIMENSIONS) + " dimensions");
    }
    std::vector<NdArray> parts;
    parts.reserve(items.size());
    for (const auto& item : items) {
        if (isScalar(item)) {
            NdArray scalar;
            scalar.data = {toScalar(item)};
            parts.push_back(std::move(scalar));
        } else if (item.is<List>()) {
            parts.push_back(listToArray(item.as<List>(), depth + 1));
        } else if (item.is<NdArray>()) {
            parts.push_back(item.as<NdArray>());
        } else {
            throw EvaluationError("cannot convert a " + kindToString(item.kind()) +
                                  " element to a number");
        }
    }
    if (parts.empty()) return NdArray::vector({});
    return stackArrays(parts);
}

NdArray toArray(const Value& value) {
    if (value.is<NdArray>()) return value.as<NdArray>();
    if (isScalar(value)) {
        NdArray scalar;
        scalar.data = {toScalar(value)};
        return scalar;
    }
    if (value.is<List>()) return listToArray(value.as<List>(), 1);
    throw EvaluationError("expected a number or numeric array, got " + kindToString(value.kind()));
}

static Value arrayToListAt(const NdArray& array, size_t dim, size_t& offset) {
    List items;
    items.reserve(array.shape[dim]);
    for (size_t i = 0; i < array.shape[dim]; ++i) {
        if (dim + 1 == array.ndim()) {
            items.emplace_back(array.data[offset++]);
        } else {
            items.push_back(arrayToListAt(array, dim + 1, offset));
        }
    }
    return Value(std::move(items));
}

List arrayToList(const NdArray& array) {
    if (array.ndim() == 0) return List{Value(array.data.front())};
    size_t offset = 0;
    return arrayToListAt(array, 0, offset).as<List>();
}

Value fromArray(NdArray array, bool asList) {
    if (array.ndim() == 0) return Value(array.data.front());
    if (asList) return Value(arrayToList(array));
    return Value(std::move(array));
}

std::string shapeToString(const std::vector<size_t>& shape) {
    std::string out = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(shape[i]);
    }
    return out + ")";
}

static std::vector<size_t> stridesOf(const std::vector<size_t>& shape) {
    std::vector<size_t> strides(shape.size(), 1);
    for (size_t i = shape.size(); i-- > 1;) {
        strides[i - 1] = strides[i] * shape[i];
    }
    return strides;
}

// ============================================================================
// Shape operations
// ============================================================================

NdArray stackArrays(const std::vector<NdArray>& items) {
    if (items.empty()) return NdArray::vector({});
    const auto& inner = items.front().shape;
    if (inner.size() + 1 > MAX_ARRAY_DIMENSIONS) {
        throw EvaluationError("arrays are limited to " + std::to_string(MAX_ARRAY_DIMENSIONS) + " dimensions");
    }
    NdArray result;
    result.shape.push_back(items.size());
    result.shape.insert(result.shape.end(), inner.begin(), inner.end());
    for (const auto& item : items) {
        if (item.shape != inner) {
            throw EvaluationError("cannot stack arrays with shapes " + shapeToString(inner) +
                                  " and " + shapeToString(item.shape));
        }
        result.data.insert(result.data.end(), item.data.begin(), item.data.end());
    }
    return result;
}

NdArray atLeast2d(const NdArray& array) {
    NdArray result = array;
    if (array.ndim() == 0) {
        result.shape = {1, 1};
    } else if (array.ndim() == 1) {
        result.shape = {1, array.shape[0]};
    }
    return result;
}

NdArray transposeArray(const NdArray& array) {
    if (array.ndim() < 2) return array;

    size_t nd = array.ndim();
    NdArray result;
    result.shape.assign(array.shape.rbegin(), array.shape.rend());
    result.data.resize(array.size());

    auto srcStrides = stridesOf(array.shape);
    std::vector<size_t> counter(nd, 0);  // index into result
    for (size_t n = 0; n < result.size(); ++n) {
        size_t offset = 0;
        for (size_t axis = 0; axis < nd; ++axis) {
            offset += counter[axis] * srcStrides[nd - 1 - axis];
        }
        result.data[n] = array.data[offset];
        for (size_t axis = nd; axis-- > 0;) {
            if (++counter[axis] < result.shape[axis]) break;
            counter[axis] = 0;
        }
    }
    return result;
}

// ============================================================================
// Element-wise arithmetic
// ============================================================================

NdArray mapArray(const NdArray& array, const std::function<double(double)>& fn) {
    NdArray result = array;
    for (double& x : result.data) x = fn(x);
    return result;
}

NdArray broadcastBinary(const NdArray& left, const NdArray& right,
                        const std::function<double(double, double)>& fn) {
    size_t nd = std::max(left.ndim(), right.ndim());

    // Shapes aligned to the right, missing leading axes have size 1
    std::vector<size_t> shapeL(nd, 1), shapeR(nd, 1), shape(nd, 1);
    std::copy(left.shape.begin(), left.shape.end(), shapeL.begin() + (nd - left.ndim()));
    std::copy(right.shape.begin(), right.shape.end(), shapeR.begin() + (nd - right.ndim()));

    size_t count = 1;
    for (size_t i = 0; i < nd; ++i) {
        if (shapeL[i] == shapeR[i] || shapeR[i] == 1) {
            shape[i] = shapeL[i];
        } else if (shapeL[i] == 1) {
            shape[i] = shapeR[i];
        } else {
            throw EvaluationError("operands could not be broadcast together with shapes " +
                                  shapeToString(left.shape) + " " + shapeToString(right.shape));
        }
        if (shape[i] != 0 && count > MAX_ARRAY_ELEMENTS / shape[i]) {
            throw EvaluationError("broadcast result is too large: " + shapeToString(left.shape) + " " +
                                  shapeToString(right.shape));
        }
        count *= shape[i];
    }

    auto stridesL = stridesOf(shapeL);
    auto stridesR = stridesOf(shapeR);
    for (size_t i = 0; i < nd; ++i) {
        if (shapeL[i] == 1) stridesL[i] = 0;
        if (shapeR[i] == 1) stridesR[i] = 0;
    }

    NdArray result;
    result.shape = shape;
    size_t total = NdArray::elementCount(shape);
    result.data.resize(total);

    std::vector<size_t> counter(nd, 0);
    for (size_t n = 0; n < total; ++n) {
        size_t offL = 0, offR = 0;
        for (size_t axis = 0; axis < nd; ++axis) {
            offL += counter[axis] * stridesL[axis];
            offR += counter[axis] * stridesR[axis];
        }
        result.data[n] = fn(left.data[offL], right.data[offR]);
        for (size_t axis = nd; axis-- > 0;) {
            if (++counter[axis] < shape[axis]) break;
            counter[axis] = 0;
        }
    }
    return result;
}

// ============================================================================
// Linear algebra
// ============================================================================

static Eigen::MatrixXd toMatrix(const NdArray& array) {
    return Eigen::Map<const RowMatrix>(array.data.data(),
                                       static_cast<Eigen::Index>(array.shape[0]),
                                       static_cast<Eigen::Index>(array.shape[1]));
}

static NdArray fromMatrix(const RowMatrix& m) {
    NdArray result;
    result.shape = {static_cast<size_t>(m.rows()), static_cast<size_t>(m.cols())};
    result.data.assign(m.data(), m.data() + m.size());
    return result;
}

static void requireSquare(const NdArray& array, const std::string& fn) {
    if (array.ndim() != 2 || array.shape[0] != array.shape[1]) {
        throw EvaluationError(fn + ": expected a square matrix, got shape " + shapeToString(array.shape));
    }
    if (array.shape[0] == 0) {
        throw EvaluationError(fn + ": empty matrix");
    }
}

NdArray matmul(const NdArray& left, const NdArray& right) {
    if (left.ndim() == 0 || right.ndim() == 0) {
        throw EvaluationError("matmul: scalar operands are not allowed, use * instead");
    }
    if (left.ndim() > 2 || right.ndim() > 2) {
        throw EvaluationError("matmul: only 1-D and 2-D operands are supported");
    }

    size_t n = left.ndim() == 1 ? 1 : left.shape[0];
    size_t k = left.ndim() == 1 ? left.shape[0] : left.shape[1];
    size_t m = right.ndim() == 1 ? 1 : right.shape[1];
    if (right.shape[0] != k) {
        throw EvaluationError("matmul: shapes " + shapeToString(left.shape) + " and " +
                              shapeToString(right.shape) + " not aligned");
    }

    Eigen::Map<const RowMatrix> a(left.data.data(), static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(k));
    Eigen::Map<const RowMatrix> b(right.data.data(), static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(m));
    RowMatrix c = a * b;

    NdArray result = fromMatrix(c);
    if (left.ndim() == 1 && right.ndim() == 1) {
        result.shape = {};
    } else if (left.ndim() == 1) {
        result.shape = {m};
    } else if (right.ndim() == 1) {
        result.shape = {n};
    }
    return result;
}

NdArray inverse(const NdArray& matrix) {
    requireSquare(matrix, "inv");
    Eigen::FullPivLU<Eigen::MatrixXd> lu(toMatrix(matrix));
    if (!lu.isInvertible()) {
        throw EvaluationError("inv: singular matrix");
    }
    RowMatrix inv = lu.inverse();
    return fromMatrix(inv);
}

double determinant(const NdArray& matrix) {
    requireSquare(matrix, "det");
    return toMatrix(matrix).determinant();
}

static bool isSymmetric(const Eigen::MatrixXd& m) {
    double scale = std::max(1.0, m.cwiseAbs().maxCoeff());
    return (m - m.transpose()).cwiseAbs().maxCoeff() <= 1e-12 * scale;
}

static void decompose(const NdArray& matrix, const std::string& fn,
                      Eigen::VectorXd& values, Eigen::MatrixXd& vectors) {
    requireSquare(matrix, fn);
    Eigen::MatrixXd m = toMatrix(matrix);

    if (isSymmetric(m)) {
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(m);
        if (solver.info() != Eigen::Success) {
            throw EvaluationError(fn + ": eigen-decomposition did not converge");
        }
        values = solver.eigenvalues();
        vectors = solver.eigenvectors();
        return;
    }

    Eigen::EigenSolver<Eigen::MatrixXd> solver(m);
    if (solver.info() != Eigen::Success) {
        throw EvaluationError(fn + ": eigen-decomposition did not converge");
    }
    Eigen::VectorXcd complexValues = solver.eigenvalues();
    double scale = std::max(1.0, complexValues.cwiseAbs().maxCoeff());
    if (complexValues.imag().cwiseAbs().maxCoeff() > 1e-10 * scale) {
        throw EvaluationError(fn + ": matrix has complex eigenvalues");
    }
    values = complexValues.real();
    vectors = solver.eigenvectors().real();
}

NdArray eigenvalues(const NdArray& matrix) {
    Eigen::VectorXd values;
    Eigen::MatrixXd vectors;
    decompose(matrix, "eig", values, vectors);
    return NdArray::vector(std::vector<double>(values.data(), values.data() + values.size()));
}

NdArray eigenvectors(const NdArray& matrix) {
    Eigen::VectorXd values;
    Eigen::MatrixXd vectors;
    decompose(matrix, "eigvec", values, vectors);
    RowMatrix rowMajor = vectors;
    return fromMatrix(rowMajor);
}

// ============================================================================
// Indexing
// ============================================================================

static size_t normalizeIndex(long index, size_t size, size_t axis) {
    long n = static_cast<long>(size);
    long i = index < 0 ? index + n : index;
    if (i < 0 || i >= n) {
        throw EvaluationError("index " + std::to_string(index) + " is out of bounds for axis " +
                              std::to_string(axis) + " with size " + std::to_string(size));
    }
    return static_cast<size_t>(i);
}

// Python slice semantics
static std::vector<size_t> sliceIndices(const IndexSpec& spec, size_t size) {
    long n = static_cast<long>(size);
    long step = spec.step.value_or(1);
    if (step == 0) {
        throw EvaluationError("slice step cannot be zero");
    }

    long start, stop;
    if (step > 0) {
        start = spec.start.value_or(0);
        stop = spec.stop.value_or(n);
        start = start < 0 ? std::max(start + n, 0L) : std::min(start, n);
        stop = stop < 0 ? std::max(stop + n, 0L) : std::min(stop, n);
    } else {
        start = n - 1;
        stop = -1;
        if (spec.start) {
            start = *spec.start < 0 ? std::max(*spec.start + n, -1L) : std::min(*spec.start, n - 1);
        }
        if (spec.stop) {
            stop = *spec.stop < 0 ? std::max(*spec.stop + n, -1L) : std::min(*spec.stop, n - 1);
        }
    }

    std::vector<size_t> indices;
    for (long i = start; step > 0 ? i < stop : i > stop; i += step) {
        indices.push_back(static_cast<size_t>(i));
    }
    return indices;
}

static Value indexArray(const NdArray& array, const std::vector<IndexSpec>& specs, bool asList) {
    size_t nd = array.ndim();
    if (nd == 0) {
        throw EvaluationError("a scalar is not subscriptable");
    }
    if (specs.size() > nd) {
        throw EvaluationError("too many indices for array: array is " + std::to_string(nd) +
                              "-dimensional, but " + std::to_string(specs.size()) + " were indexed");
    }

    std::vector<std::vector<size_t>> selected(nd);
    NdArray result;
    for (size_t axis = 0; axis < nd; ++axis) {
        if (axis < specs.size() && !specs[axis].isSlice) {
            selected[axis] = {normalizeIndex(specs[axis].index, array.shape[axis], axis)};
            continue;
        }
        if (axis < specs.size()) {
            selected[axis] = sliceIndices(specs[axis], array.shape[axis]);
        } else {
            selected[axis].resize(array.shape[axis]);
            std::iota(selected[axis].begin(), selected[axis].end(), 0);
        }
        result.shape.push_back(selected[axis].size());
    }

    auto strides = stridesOf(array.shape);
    size_t total = 1;
    for (const auto& s : selected) total *= s.size();
    result.data.reserve(total);

    std::vector<size_t> counter(nd, 0);
    for (size_t n = 0; n < total; ++n) {
        size_t offset = 0;
        for (size_t axis = 0; axis < nd; ++axis) {
            offset += selected[axis][counter[axis]] * strides[axis];
        }
        result.data.push_back(array.data[offset]);
        for (size_t axis = nd; axis-- > 0;) {
            if (++counter[axis] < selected[axis].size()) break;
            counter[axis] = 0;
        }
    }
    return fromArray(std::move(result), asList);
}

Value indexValue(const Value& target, const std::vector<IndexSpec>& specs) {
    if (specs.empty()) return target;

    if (target.is<NdArray>()) {
        return indexArray(target.as<NdArray>(), specs, false);
    }

    if (target.is<List>()) {
        const auto& items = target.as<List>();
        const auto& first = specs.front();
        if (specs.size() == 1) {
            if (first.isSlice) {
                List out;
                for (size_t i : sliceIndices(first, items.size())) out.push_back(items[i]);
                return Value(std::move(out));
            }
            return items[normalizeIndex(first.index, items.size(), 0)];
        }
        bool allIntegers = std::none_of(specs.begin(), specs.end(),
                                        [](const IndexSpec& s) { return s.isSlice; });
        if (allIntegers) {
            const Value& element = items[normalizeIndex(first.index, items.size(), 0)];
            return indexValue(element, std::vector<IndexSpec>(specs.begin() + 1, specs.end()));
        }
        return indexArray(toArray(target), specs, true);
    }

    if (target.isText() || target.is<PathValue>()) {
        const std::string& text = target.isText() ? target.asText() : target.as<PathValue>().str();
        if (specs.size() != 1) {
            throw EvaluationError("text accepts a single index");
        }
        if (specs.front().isSlice) {
            std::string out;
            for (size_t i : sliceIndices(specs.front(), text.size())) out += text[i];
            return Value(out);
        }
        return Value(std::string(1, text[normalizeIndex(specs.front().index, text.size(), 0)]));
    }

    throw EvaluationError("a " + kindToString(target.kind()) + " value is not subscriptable");
}

}  // namespace paramscript
