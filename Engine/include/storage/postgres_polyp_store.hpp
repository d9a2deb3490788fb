/**
 * @file postgres_polyp_store.hpp
 * @brief PostgreSQL-backed Polyp store
 */

#pragma once

#include <storage/polyp_store.hpp>
#include <database/connection_pool.hpp>

namespace Reef {

/**
 * @brief Polyp store persisted in PostgreSQL
 *
 * Transitions are a conditional UPDATE (WHERE state = expected) executed in
 * one transaction with the metadata rows and the audit insert, so concurrent
 * writers in other processes also get exactly-one-winner semantics. Every
 * call leases its own connection from the pool; the conditional UPDATE is the
 * only serialization between writers.
 *
 * Tables: reef_polyp, reef_pipeline_step, reef_pipeline_param, reef_consensus,
 * reef_validator_score, reef_hardening, reef_attestation, reef_audit.
 */
class REEF_API PostgresPolypStore : public PolypStore {
public:
    /**
     * @param pool Connections owned by the caller, shared with other stores if desired
     * @param create_schema Run CREATE TABLE IF NOT EXISTS on construction
     */
    explicit PostgresPolypStore(PostgresConnectionPool& pool, bool create_schema = true);

    void ensure_schema();

    PolypId create(const PolypSubject& subject, const ZkProof& proof) override;
    Polyp get(const PolypId& id) const override;
    std::optional<Polyp> find(const PolypId& id) const override;
    Polyp transition(const PolypId& id, PolypState expected, PolypState next,
                     const TransitionUpdate& update) override;
    std::vector<Polyp> scan(PolypState state, const std::optional<PolypId>& after,
                            size_t limit) const override;
    size_t count(PolypState state) const override;
    std::vector<AuditEntry> audit_log(const PolypId& id) const override;

private:
    std::optional<Polyp> load(PostgresConnection& db, const PolypId& id) const;
    void write_consensus(PostgresConnection& db, const PolypId& id, const ConsensusMetadata& meta);
    void write_hardening(PostgresConnection& db, const PolypId& id, const HardeningLineage& lineage);
    void write_audit(PostgresConnection& db, const AuditEntry& entry);

    PostgresConnectionPool& pool_;
};

} // namespace Reef
