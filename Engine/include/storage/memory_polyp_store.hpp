/**
 * @file memory_polyp_store.hpp
 * @brief In-process Polyp store
 */

#pragma once

#include <storage/polyp_store.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace Reef {

/**
 * @brief Polyp store held in memory
 *
 * The map lock guards structure only (insertions); each record carries its
 * own mutex so transitions on different Polyps never contend.
 */
class REEF_API MemoryPolypStore : public PolypStore {
public:
    MemoryPolypStore() = default;

    PolypId create(const PolypSubject& subject, const ZkProof& proof) override;
    Polyp get(const PolypId& id) const override;
    std::optional<Polyp> find(const PolypId& id) const override;
    Polyp transition(const PolypId& id, PolypState expected, PolypState next,
                     const TransitionUpdate& update) override;
    std::vector<Polyp> scan(PolypState state, const std::optional<PolypId>& after,
                            size_t limit) const override;
    size_t count(PolypState state) const override;
    std::vector<AuditEntry> audit_log(const PolypId& id) const override;

    size_t size() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        Polyp polyp;
        std::vector<AuditEntry> audit;
    };

    std::shared_ptr<Entry> entry(const PolypId& id) const;

    mutable std::shared_mutex map_mutex_;
    std::map<PolypId, std::shared_ptr<Entry>> entries_;
};

} // namespace Reef
