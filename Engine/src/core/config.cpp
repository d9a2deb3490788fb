/**
 * @file config.cpp
 * @brief Environment-driven configuration
 */

#include <core/config.hpp>
#include <core/errors.hpp>
#include <cstdlib>
#include <stdexcept>

namespace Reef {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

double env_double(const char* name, double fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid number in ") + name, v);
    }
}

uint64_t env_uint(const char* name, uint64_t fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    try {
        std::string s(v);
        if (s.empty() || s[0] == '-') throw std::invalid_argument(s);
        size_t used = 0;
        unsigned long long u = std::stoull(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return static_cast<uint64_t>(u);
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid unsigned integer in ") + name, v);
    }
}

void require_unit(const char* what, double v) {
    if (!(v >= 0.0 && v <= 1.0)) {
        throw ConfigError(std::string(what) + " must be within [0,1]", std::to_string(v));
    }
}

} // namespace

const char* rank_mode_name(RankMode mode) {
    return mode == RankMode::TrustWeighted ? "trust" : "similarity";
}

RankMode parse_rank_mode(const std::string& name) {
    if (name == "similarity") return RankMode::Similarity;
    if (name == "trust") return RankMode::TrustWeighted;
    throw ConfigError("Unknown rank mode", name);
}

ReefConfig ReefConfig::from_env() {
    ReefConfig c;

    c.lifecycle.review_threshold = env_double("REEF_REVIEW_THRESHOLD", c.lifecycle.review_threshold);
    c.lifecycle.approval_threshold = env_double("REEF_APPROVAL_THRESHOLD", c.lifecycle.approval_threshold);
    c.lifecycle.min_novelty = env_double("REEF_MIN_NOVELTY", c.lifecycle.min_novelty);
    c.lifecycle.max_review_cycles = static_cast<uint32_t>(
        env_uint("REEF_MAX_REVIEW_CYCLES", c.lifecycle.max_review_cycles));
    c.lifecycle.min_attestations = env_uint("REEF_MIN_ATTESTATIONS", c.lifecycle.min_attestations);

    if (const char* w = env("REEF_SCORE_WEIGHTS")) {
        c.weights = ScoreWeights::parse(w);
    }

    c.index.M = env_uint("REEF_HNSW_M", c.index.M);
    c.index.ef_construction = env_uint("REEF_HNSW_EF_CONSTRUCTION", c.index.ef_construction);
    c.index.ef_search = env_uint("REEF_HNSW_EF_SEARCH", c.index.ef_search);
    c.index.initial_capacity = env_uint("REEF_INDEX_CAPACITY", c.index.initial_capacity);

    c.search.overfetch_factor = env_uint("REEF_OVERFETCH", c.search.overfetch_factor);
    if (const char* mode = env("REEF_RANK_MODE")) {
        c.search.rank_mode = parse_rank_mode(mode);
    }

    c.default_reputation = env_double("REEF_DEFAULT_REPUTATION", c.default_reputation);
    c.sweep_workers = env_uint("REEF_SWEEP_WORKERS", c.sweep_workers);
    c.db_connections = env_uint("REEF_DB_CONNECTIONS", c.db_connections);
    c.max_conflict_retries = static_cast<uint32_t>(
        env_uint("REEF_MAX_CONFLICT_RETRIES", c.max_conflict_retries));
    c.blocks_per_epoch = env_uint("REEF_BLOCKS_PER_EPOCH", c.blocks_per_epoch);

    if (const char* level = env("REEF_LOG_LEVEL")) {
        c.log_level = level;
    }

    c.validate();
    return c;
}

void ReefConfig::validate() const {
    weights.validate();
    require_unit("review_threshold", lifecycle.review_threshold);
    require_unit("approval_threshold", lifecycle.approval_threshold);
    require_unit("min_novelty", lifecycle.min_novelty);
    require_unit("default_reputation", default_reputation);

    if (lifecycle.max_review_cycles == 0) {
        throw ConfigError("max_review_cycles must be at least 1");
    }
    if (index.M < 2 || index.ef_construction == 0 || index.ef_search == 0 || index.initial_capacity == 0) {
        throw ConfigError("HNSW parameters must be positive (M >= 2)");
    }
    if (search.overfetch_factor == 0) {
        throw ConfigError("overfetch_factor must be at least 1");
    }
    if (sweep_workers == 0) {
        throw ConfigError("sweep_workers must be at least 1");
    }
    if (db_connections == 0) {
        throw ConfigError("db_connections must be at least 1");
    }
    if (blocks_per_epoch == 0) {
        throw ConfigError("blocks_per_epoch must be at least 1");
    }
    if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
        log_level != "warning" && log_level != "error") {
        throw ConfigError("Unknown log level", log_level);
    }
}

} // namespace Reef
