#include "math/vector_math.hpp"
#include "core/errors.hpp"
#include <cmath>

namespace sem {
namespace vector_math {

namespace {

void require_same_length(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError(a.size(), b.size());
    }
}

} // anonymous namespace

double dot(const std::vector<float>& a, const std::vector<float>& b) {
    require_same_length(a, b);
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

double norm(const std::vector<float>& a) {
    double sum = 0.0;
    for (float v : a) {
        sum += static_cast<double>(v) * static_cast<double>(v);
    }
    return std::sqrt(sum);
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    require_same_length(a, b);

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i];
        double y = b[i];
        dot_product += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    double sim = dot_product / (std::sqrt(norm_a) * std::sqrt(norm_b));

    // Rounding can push parallel vectors slightly past the bounds
    if (sim > 1.0) return 1.0;
    if (sim < -1.0) return -1.0;
    return sim;
}

double squared_distance(const std::vector<float>& a, const std::vector<float>& b) {
    require_same_length(a, b);
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return sum;
}

double euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
    return std::sqrt(squared_distance(a, b));
}

double cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
    return 1.0 - cosine_similarity(a, b);
}

std::vector<float> centroid(const std::vector<std::vector<float>>& vectors) {
    if (vectors.empty()) {
        throw InternalError("Cannot compute centroid of an empty vector list");
    }

    const size_t dim = vectors.front().size();
    std::vector<double> sum(dim, 0.0);

    for (const auto& v : vectors) {
        if (v.size() != dim) {
            throw DimensionMismatchError(dim, v.size());
        }
        for (size_t i = 0; i < dim; ++i) {
            sum[i] += v[i];
        }
    }

    std::vector<float> result(dim);
    const double n = static_cast<double>(vectors.size());
    for (size_t i = 0; i < dim; ++i) {
        result[i] = static_cast<float>(sum[i] / n);
    }
    return result;
}

std::vector<float> centroid(const std::vector<std::vector<float>>& vectors,
                            const std::vector<std::size_t>& indices) {
    if (indices.empty()) {
        throw InternalError("Cannot compute centroid of an empty vector list");
    }

    const size_t dim = vectors.at(indices.front()).size();
    std::vector<double> sum(dim, 0.0);

    for (size_t idx : indices) {
        const auto& v = vectors.at(idx);
        if (v.size() != dim) {
            throw DimensionMismatchError(dim, v.size());
        }
        for (size_t i = 0; i < dim; ++i) {
            sum[i] += v[i];
        }
    }

    std::vector<float> result(dim);
    const double n = static_cast<double>(indices.size());
    for (size_t i = 0; i < dim; ++i) {
        result[i] = static_cast<float>(sum[i] / n);
    }
    return result;
}

} // namespace vector_math
} // namespace sem
