/**
 * @file polyp_scores.cpp
 * @brief Composite trust score
 */

#include <scoring/polyp_scores.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace Reef {

void ScoreWeights::validate() const {
    const double parts[] = {zk_validity, semantic_quality, novelty, source_credibility, embedding_quality};
    for (double w : parts) {
        if (!std::isfinite(w) || w < 0.0 || w > 1.0) {
            throw ConfigError("Score weight out of range [0,1]", std::to_string(w));
        }
    }
    if (std::abs(sum() - 1.0) > 1e-9) {
        throw ConfigError("Score weights must sum to 1.0", std::to_string(sum()));
    }
}

ScoreWeights ScoreWeights::parse(const std::string& csv) {
    std::vector<double> parts;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            size_t used = 0;
            double v = std::stod(item, &used);
            if (used == 0) throw std::invalid_argument(item);
            parts.push_back(v);
        } catch (const std::exception&) {
            throw ConfigError("Unparsable score weight", item);
        }
    }
    if (parts.size() != 5) {
        throw ConfigError("Expected five comma-separated score weights", csv);
    }

    ScoreWeights w;
    w.zk_validity = parts[0];
    w.semantic_quality = parts[1];
    w.novelty = parts[2];
    w.source_credibility = parts[3];
    w.embedding_quality = parts[4];
    w.validate();
    return w;
}

double PolypScores::clamp_unit(double v) {
    if (std::isnan(v)) return v;
    return std::clamp(v, 0.0, 1.0);
}

PolypScores PolypScores::make(double zk, double semantic, double novelty,
                              double source, double embedding) {
    PolypScores s;
    s.zk_validity = clamp_unit(zk);
    s.semantic_quality = clamp_unit(semantic);
    s.novelty = clamp_unit(novelty);
    s.source_credibility = clamp_unit(source);
    s.embedding_quality = clamp_unit(embedding);
    return s;
}

bool PolypScores::complete() const {
    return !std::isnan(zk_validity) && !std::isnan(semantic_quality) && !std::isnan(novelty) &&
           !std::isnan(source_credibility) && !std::isnan(embedding_quality);
}

double PolypScores::weighted_score(const ScoreWeights& weights) const {
    if (!complete()) {
        throw PolicyError("Composite requested over an incomplete score set");
    }
    return weights.zk_validity * zk_validity +
           weights.semantic_quality * semantic_quality +
           weights.novelty * novelty +
           weights.source_credibility * source_credibility +
           weights.embedding_quality * embedding_quality;
}

} // namespace Reef
