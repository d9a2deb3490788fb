/**
 * @file config.hpp
 * @brief Engine configuration with environment overrides
 */

#pragma once

#include <export.hpp>
#include <scoring/polyp_scores.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Reef {

/**
 * @brief Thresholds driving lifecycle decisions
 */
struct LifecyclePolicy {
    double review_threshold = 0.50;   // Soft -> UnderReview on composite
    double approval_threshold = 0.60; // UnderReview -> Approved on final score
    double min_novelty = 1e-3;        // Approval requires novelty strictly above this
    uint32_t max_review_cycles = 3;   // Deferred reviews before rejection
    size_t min_attestations = 1;      // Finality signal quorum
};

/**
 * @brief HNSW parameters for each model-space partition
 */
struct IndexConfig {
    size_t M = 16;
    size_t ef_construction = 200;
    size_t ef_search = 64;
    size_t initial_capacity = 1024;
};

enum class RankMode {
    Similarity,    // cosine only
    TrustWeighted  // cosine * composite trust
};

struct SearchConfig {
    size_t overfetch_factor = 4;
    RankMode rank_mode = RankMode::Similarity;
};

struct REEF_API ReefConfig {
    LifecyclePolicy lifecycle;
    ScoreWeights weights;
    IndexConfig index;
    SearchConfig search;

    double default_reputation = 0.5;
    size_t sweep_workers = 4;
    size_t db_connections = 4; // PostgreSQL pool size
    uint32_t max_conflict_retries = 4;
    uint64_t blocks_per_epoch = 360;
    std::string log_level = "info";

    /**
     * @brief Defaults overridden by REEF_* environment variables
     * @throws ConfigError naming the variable when a value does not parse
     */
    static ReefConfig from_env();

    /**
     * @throws ConfigError for out-of-range values
     */
    void validate() const;
};

REEF_API const char* rank_mode_name(RankMode mode);
REEF_API RankMode parse_rank_mode(const std::string& name);

} // namespace Reef
