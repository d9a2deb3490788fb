/**
 * @file polyp_scores.hpp
 * @brief Five-dimensional trust scores and their fixed-weight composite
 */

#pragma once

#include <export.hpp>
#include <limits>
#include <string>

namespace Reef {

/**
 * @brief Weights of the composite trust score
 *
 * Must sum to 1.0. Defaults: zk 0.30, semantic 0.25, novelty 0.15,
 * source 0.15, embedding 0.15.
 */
struct REEF_API ScoreWeights {
    double zk_validity = 0.30;
    double semantic_quality = 0.25;
    double novelty = 0.15;
    double source_credibility = 0.15;
    double embedding_quality = 0.15;

    double sum() const {
        return zk_validity + semantic_quality + novelty + source_credibility + embedding_quality;
    }

    /**
     * @brief Check every weight is in [0,1] and the total is 1.0 (tolerance 1e-9)
     * @throws ConfigError
     */
    void validate() const;

    /**
     * @brief Parse "zk,semantic,novelty,source,embedding"
     * @throws ConfigError
     */
    static ScoreWeights parse(const std::string& csv);
};

/**
 * @brief Per-Polyp quality scores, each clamped to [0,1]
 *
 * A dimension that was never computed holds NaN.
 */
struct REEF_API PolypScores {
    static constexpr double kUnset = std::numeric_limits<double>::quiet_NaN();

    double zk_validity = kUnset;
    double semantic_quality = kUnset;
    double novelty = kUnset;
    double source_credibility = kUnset;
    double embedding_quality = kUnset;

    /**
     * @brief Build a score set, clamping each dimension independently
     */
    static PolypScores make(double zk, double semantic, double novelty,
                            double source, double embedding);

    static double clamp_unit(double v);

    bool complete() const;

    /**
     * @brief Fixed dot product with the weights
     *
     * Pure and deterministic; never renormalizes over present dimensions.
     * @throws PolicyError if any dimension is unset
     */
    double weighted_score(const ScoreWeights& weights = ScoreWeights{}) const;
};

} // namespace Reef
