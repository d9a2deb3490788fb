/**
 * @file polyp_store.cpp
 * @brief Store-independent validation and the keyset cursor
 */

#include <storage/polyp_store.hpp>
#include <core/errors.hpp>
#include <core/lifecycle.hpp>

namespace Reef {

PolypCursor::PolypCursor(const PolypStore& store, PolypState state, size_t batch_size)
    : store_(store), state_(state), batch_size_(batch_size == 0 ? 1 : batch_size) {}

std::optional<Polyp> PolypCursor::next() {
    if (pos_ >= buffer_.size()) {
        if (exhausted_) return std::nullopt;

        buffer_ = store_.scan(state_, after_, batch_size_);
        pos_ = 0;
        if (buffer_.size() < batch_size_) exhausted_ = true;
        if (buffer_.empty()) return std::nullopt;
    }

    Polyp p = std::move(buffer_[pos_++]);
    after_ = p.id;
    return p;
}

void PolypCursor::resume_after(const PolypId& id) {
    after_ = id;
    buffer_.clear();
    pos_ = 0;
    exhausted_ = false;
}

void PolypStore::validate_new(const PolypSubject& subject, const ZkProof& proof) {
    if (subject.payload.content.empty()) {
        throw ValidationError("Polyp content is empty");
    }
    if (subject.payload.content_type.empty()) {
        throw ValidationError("Polyp content type is empty");
    }
    subject.vector.validate();

    if (proof.model_id != subject.vector.model_id) {
        throw ValidationError("Proof model does not match embedding model",
                              proof.model_id.key() + " vs " + subject.vector.model_id.key());
    }
    if (!proof_matches_subject(subject, proof)) {
        throw ValidationError("Proof hashes are not bound to the submitted text and vector");
    }
}

void PolypStore::check_transition(const PolypId& id, PolypState from, PolypState next) {
    if (!transition_allowed(from, next)) {
        throw InvalidTransitionError(std::string("Transition ") + state_name(from) + " -> " +
                                     state_name(next) + " is not permitted",
                                     id.to_string());
    }
}

} // namespace Reef
