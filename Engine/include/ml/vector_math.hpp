#pragma once

#include <export.hpp>
#include <vector>

namespace Reef {

/**
 * @brief Dense vector helpers over float32 embeddings (Eigen-backed)
 */
class REEF_API VectorMath {
public:
    /**
     * @brief Cosine similarity in [-1,1]
     *
     * Returns 0 when lengths differ or either vector has zero norm.
     */
    static double cosine(const std::vector<float>& a, const std::vector<float>& b);

    static double dot(const std::vector<float>& a, const std::vector<float>& b);

    static double norm(const std::vector<float>& v);

    /**
     * @brief Unit-length copy
     * @throws ValidationError for a zero or non-finite vector
     */
    static std::vector<float> normalized(const std::vector<float>& v);

    /**
     * @brief Normalized mean of equal-length vectors
     * @throws ValidationError if empty or lengths differ
     */
    static std::vector<float> centroid(const std::vector<std::vector<float>>& vectors);
};

} // namespace Reef
