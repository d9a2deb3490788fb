/**
 * @file polyp.cpp
 * @brief Polyp value types: naming, validation and canonical encoding
 */

#include <core/polyp.hpp>
#include <core/errors.hpp>
#include <cmath>
#include <cstring>

namespace Reef {

namespace {

void append_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void append_str(std::vector<uint8_t>& out, const std::string& s) {
    append_u64(out, s.size());
    out.insert(out.end(), s.begin(), s.end());
}

void append_hash(std::vector<uint8_t>& out, const Hash256& h) {
    out.insert(out.end(), h.begin(), h.end());
}

} // namespace

const char* state_name(PolypState state) {
    switch (state) {
        case PolypState::Draft:       return "draft";
        case PolypState::Soft:        return "soft";
        case PolypState::UnderReview: return "under_review";
        case PolypState::Approved:    return "approved";
        case PolypState::Hardened:    return "hardened";
        case PolypState::Rejected:    return "rejected";
        case PolypState::Molted:      return "molted";
    }
    return "unknown";
}

PolypState parse_state(const std::string& name) {
    static const PolypState all[] = {
        PolypState::Draft, PolypState::Soft, PolypState::UnderReview, PolypState::Approved,
        PolypState::Hardened, PolypState::Rejected, PolypState::Molted
    };
    for (PolypState s : all) {
        if (name == state_name(s)) return s;
    }
    throw ValidationError("Unknown polyp state", name);
}

std::string EmbeddingModelId::key() const {
    return provider + "/" + name + "/" + BLAKE3Pipeline::to_hex(weights_hash) + "/" +
           std::to_string(dimensions);
}

void VectorEmbedding::validate() const {
    if (model_id.dimensions == 0) {
        throw ValidationError("Embedding model declares zero dimensions", model_id.key());
    }
    if (values.size() != model_id.dimensions) {
        throw ValidationError("Vector length does not match model dimensions",
                              std::to_string(values.size()) + " != " + std::to_string(model_id.dimensions));
    }
    if (quantization != "float32") {
        throw ValidationError("Unsupported quantization", quantization);
    }

    double norm_sq = 0.0;
    for (float v : values) {
        if (!std::isfinite(v)) {
            throw ValidationError("Vector contains non-finite values", model_id.key());
        }
        norm_sq += static_cast<double>(v) * v;
    }

    if (normalization == "l2") {
        double norm = std::sqrt(norm_sq);
        if (std::abs(norm - 1.0) > 1e-3) {
            throw ValidationError("Vector is not L2-normalized", "norm=" + std::to_string(norm));
        }
    } else if (normalization == "none") {
        if (norm_sq == 0.0) {
            throw ValidationError("Vector has zero norm", model_id.key());
        }
    } else {
        throw ValidationError("Unsupported normalization", normalization);
    }
}

std::vector<uint8_t> canonical_bytes(const Polyp& polyp) {
    std::vector<uint8_t> out;
    const auto& subject = polyp.subject;
    out.reserve(64 + subject.payload.content.size() + subject.vector.values.size() * 4);

    out.insert(out.end(), polyp.id.bytes().begin(), polyp.id.bytes().end());
    append_str(out, subject.payload.content);
    append_str(out, subject.payload.content_type);
    append_str(out, subject.payload.language.value_or(""));
    append_hash(out, BLAKE3Pipeline::hash_vector(subject.vector.values));
    append_str(out, subject.vector.model_id.key());
    append_hash(out, subject.provenance.creator.hotkey);
    append_str(out, subject.provenance.creator.did);
    append_u64(out, static_cast<uint64_t>(polyp.created_at));
    return out;
}

std::string content_id(const Polyp& polyp) {
    return "b3:" + BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(canonical_bytes(polyp)));
}

bool proof_matches_subject(const PolypSubject& subject, const ZkProof& proof) {
    if (proof.model_id != subject.vector.model_id) return false;
    if (proof.text_hash != BLAKE3Pipeline::hash(subject.payload.content)) return false;
    return proof.vector_hash == BLAKE3Pipeline::hash_vector(subject.vector.values);
}

} // namespace Reef
