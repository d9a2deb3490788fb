#include <ml/vector_math.hpp>
#include <core/errors.hpp>
#include <Eigen/Core>
#include <cmath>

namespace Reef {

namespace {

using ConstMap = Eigen::Map<const Eigen::VectorXf>;

ConstMap as_eigen(const std::vector<float>& v) {
    return ConstMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

} // namespace

double VectorMath::dot(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    return static_cast<double>(as_eigen(a).dot(as_eigen(b)));
}

double VectorMath::norm(const std::vector<float>& v) {
    if (v.empty()) return 0.0;
    return static_cast<double>(as_eigen(v).norm());
}

double VectorMath::cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;

    auto ea = as_eigen(a);
    auto eb = as_eigen(b);
    double na = ea.norm();
    double nb = eb.norm();
    if (na == 0.0 || nb == 0.0) return 0.0;

    return static_cast<double>(ea.dot(eb)) / (na * nb);
}

std::vector<float> VectorMath::normalized(const std::vector<float>& v) {
    double n = norm(v);
    if (!(n > 0.0) || !std::isfinite(n)) {
        throw ValidationError("Cannot normalize a zero or non-finite vector");
    }

    std::vector<float> out(v.size());
    Eigen::Map<Eigen::VectorXf>(out.data(), static_cast<Eigen::Index>(out.size())) =
        as_eigen(v) / static_cast<float>(n);
    return out;
}

std::vector<float> VectorMath::centroid(const std::vector<std::vector<float>>& vectors) {
    if (vectors.empty()) {
        throw ValidationError("Centroid of an empty set");
    }

    const size_t dim = vectors.front().size();
    Eigen::VectorXd sum = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(dim));
    for (const auto& v : vectors) {
        if (v.size() != dim) {
            throw ValidationError("Centroid over vectors of different lengths");
        }
        sum += as_eigen(v).cast<double>();
    }

    std::vector<float> mean(dim);
    for (size_t i = 0; i < dim; ++i) {
        mean[i] = static_cast<float>(sum[static_cast<Eigen::Index>(i)] / vectors.size());
    }
    return normalized(mean);
}

} // namespace Reef
