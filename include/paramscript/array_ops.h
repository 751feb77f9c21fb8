#pragma once

#include "paramscript/value.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace paramscript {

// ============================================================================
// Conversions
// ============================================================================

// Numbers and booleans
bool isScalar(const Value& value);
double toScalar(const Value& value);

// Integral number (or boolean); throws EvaluationError otherwise
long toInteger(const Value& value, const std::string& what);

/**
 * @brief Convert a scalar, a rectangular numeric list or an array to an
 * NdArray. Scalars become 0-d arrays.
 * @throws EvaluationError for ragged, non-numeric or over-deep input
 */
NdArray toArray(const Value& value);

// 0-d arrays become numbers; asList selects nested lists over an NdArray
Value fromArray(NdArray array, bool asList);

List arrayToList(const NdArray& array);

std::string shapeToString(const std::vector<size_t>& shape);

// ============================================================================
// Shape operations
// ============================================================================

// Stack equally shaped arrays along a new leading axis
NdArray stackArrays(const std::vector<NdArray>& items);

// 0-d -> 1x1, (n) -> (1, n), others unchanged
NdArray atLeast2d(const NdArray& array);

// Reverse the axes
NdArray transposeArray(const NdArray& array);

// ============================================================================
// Element-wise arithmetic
// ============================================================================

NdArray mapArray(const NdArray& array, const std::function<double(double)>& fn);

// Element-wise binary operation with NumPy broadcasting rules
NdArray broadcastBinary(const NdArray& left, const NdArray& right,
                        const std::function<double(double, double)>& fn);

// ============================================================================
// Linear algebra (Eigen)
// ============================================================================

// 1-D and 2-D operands; 1-D @ 1-D gives a 0-d array
NdArray matmul(const NdArray& left, const NdArray& right);
NdArray inverse(const NdArray& matrix);
double determinant(const NdArray& matrix);

// Symmetric input uses the self-adjoint solver (ascending order);
// complex eigenvalues are rejected
NdArray eigenvalues(const NdArray& matrix);
NdArray eigenvectors(const NdArray& matrix);

// ============================================================================
// Indexing
// ============================================================================

struct IndexSpec {
    bool isSlice = false;
    long index = 0;
    std::optional<long> start;
    std::optional<long> stop;
    std::optional<long> step;
};

/**
 * @brief Subscript a list, text or array (0-based, negative from the end).
 *
 * Arrays follow NumPy basic indexing: integers drop an axis, slices keep it.
 * @throws EvaluationError on out-of-range indices or unsubscriptable values
 */
Value indexValue(const Value& target, const std::vector<IndexSpec>& specs);

}  // namespace paramscript
