/**
 * @file memory_polyp_store.cpp
 * @brief In-process Polyp store implementation
 */

#include <storage/memory_polyp_store.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Reef {

PolypId MemoryPolypStore::create(const PolypSubject& subject, const ZkProof& proof) {
    validate_new(subject, proof);

    auto e = std::make_shared<Entry>();
    Timestamp now = now_ms();
    e->polyp.id = PolypId::generate();
    e->polyp.state = PolypState::Draft;
    e->polyp.version = 1;
    e->polyp.subject = subject;
    e->polyp.proof = proof;
    e->polyp.created_at = now;
    e->polyp.updated_at = now;
    e->audit.push_back(AuditEntry{e->polyp.id, std::nullopt, PolypState::Draft, 1, "created", "reef", now});

    PolypId id = e->polyp.id;
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        entries_.emplace(id, std::move(e));
    }
    return id;
}

std::shared_ptr<MemoryPolypStore::Entry> MemoryPolypStore::entry(const PolypId& id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

Polyp MemoryPolypStore::get(const PolypId& id) const {
    auto e = entry(id);
    if (!e) {
        throw NotFoundError("Polyp not found", id.to_string());
    }
    std::lock_guard<std::mutex> lock(e->mutex);
    return e->polyp;
}

std::optional<Polyp> MemoryPolypStore::find(const PolypId& id) const {
    auto e = entry(id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->mutex);
    return e->polyp;
}

Polyp MemoryPolypStore::transition(const PolypId& id, PolypState expected, PolypState next,
                                   const TransitionUpdate& update) {
    check_transition(id, expected, next);

    auto e = entry(id);
    if (!e) {
        throw NotFoundError("Polyp not found", id.to_string());
    }

    std::lock_guard<std::mutex> lock(e->mutex);
    Polyp& p = e->polyp;
    if (p.state != expected) {
        throw ConflictError(std::string("Expected state ") + state_name(expected) +
                            " but found " + state_name(p.state), id.to_string());
    }

    // Build the full new record first so a failure leaves the stored one untouched
    Polyp updated = p;
    updated.state = next;
    updated.version = p.version + 1;
    updated.updated_at = std::max(now_ms(), p.updated_at);
    if (update.consensus) updated.consensus = update.consensus;
    if (update.hardening) updated.hardening = update.hardening;
    if (update.successor_id) updated.successor_id = update.successor_id;

    e->audit.push_back(AuditEntry{id, expected, next, updated.version, update.reason,
                                  update.actor, updated.updated_at});
    p = std::move(updated);

    Logger::debug("polyp " + id.to_string() + " " + state_name(expected) + " -> " + state_name(next) +
                  " (v" + std::to_string(p.version) + ")");
    return p;
}

std::vector<Polyp> MemoryPolypStore::scan(PolypState state, const std::optional<PolypId>& after,
                                          size_t limit) const {
    std::vector<std::shared_ptr<Entry>> candidates;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = after ? entries_.upper_bound(*after) : entries_.begin();
        for (; it != entries_.end(); ++it) {
            candidates.push_back(it->second);
        }
    }

    std::vector<Polyp> out;
    for (const auto& e : candidates) {
        if (out.size() >= limit) break;
        std::lock_guard<std::mutex> lock(e->mutex);
        if (e->polyp.state == state) out.push_back(e->polyp);
    }
    return out;
}

size_t MemoryPolypStore::count(PolypState state) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    size_t n = 0;
    for (const auto& [id, e] : entries_) {
        std::lock_guard<std::mutex> entry_lock(e->mutex);
        if (e->polyp.state == state) ++n;
    }
    return n;
}

std::vector<AuditEntry> MemoryPolypStore::audit_log(const PolypId& id) const {
    auto e = entry(id);
    if (!e) {
        throw NotFoundError("Polyp not found", id.to_string());
    }
    std::lock_guard<std::mutex> lock(e->mutex);
    return e->audit;
}

size_t MemoryPolypStore::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return entries_.size();
}

} // namespace Reef
