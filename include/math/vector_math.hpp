#pragma once

#include <cstddef>
#include <vector>

namespace sem {

/**
 * @brief Numeric primitives over dense embedding vectors
 *
 * All binary operations require equal lengths and throw
 * DimensionMismatchError otherwise.
 */
namespace vector_math {

/**
 * @brief Cosine similarity in [-1, 1]
 *
 * Returns 0 when either vector has zero magnitude. Symmetric in its arguments.
 */
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * @brief Per-dimension arithmetic mean
 * @throws InternalError if @p vectors is empty
 */
std::vector<float> centroid(const std::vector<std::vector<float>>& vectors);

/**
 * @brief Centroid of a subset, addressed by index into @p vectors
 */
std::vector<float> centroid(const std::vector<std::vector<float>>& vectors,
                            const std::vector<std::size_t>& indices);

double dot(const std::vector<float>& a, const std::vector<float>& b);

double norm(const std::vector<float>& a);

double squared_distance(const std::vector<float>& a, const std::vector<float>& b);

double euclidean_distance(const std::vector<float>& a, const std::vector<float>& b);

// 1 - cosine_similarity, in [0, 2]
double cosine_distance(const std::vector<float>& a, const std::vector<float>& b);

} // namespace vector_math

} // namespace sem
