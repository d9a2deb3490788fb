/**
 * @file postgres_polyp_store.cpp
 * @brief PostgreSQL Polyp store implementation
 */

#include <storage/postgres_polyp_store.hpp>
#include <storage/format_utils.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <sstream>

namespace Reef {

namespace {

using Row = PostgresConnection::Row;

const std::string& required(const Row& row, size_t i) {
    if (!row[i]) {
        throw StorageError("Unexpected NULL in column " + std::to_string(i));
    }
    return *row[i];
}

std::string join_hashes(const std::vector<Hash256>& hashes) {
    std::string out;
    for (size_t i = 0; i < hashes.size(); ++i) {
        if (i) out += ',';
        out += BLAKE3Pipeline::to_hex(hashes[i]);
    }
    return out;
}

std::vector<Hash256> split_hashes(const std::string& text) {
    std::vector<Hash256> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(BLAKE3Pipeline::from_hex(item));
    }
    return out;
}

const char* k_schema = R"SQL(
CREATE TABLE IF NOT EXISTS reef_polyp (
    id                   UUID PRIMARY KEY,
    state                TEXT NOT NULL,
    version              BIGINT NOT NULL,
    content              TEXT NOT NULL,
    content_type         TEXT NOT NULL,
    language             TEXT,
    embedding            REAL[] NOT NULL,
    model_provider       TEXT NOT NULL,
    model_name           TEXT NOT NULL,
    model_weights        BYTEA NOT NULL,
    model_dimensions     INTEGER NOT NULL,
    quantization         TEXT NOT NULL,
    normalization        TEXT NOT NULL,
    creator_hotkey       BYTEA NOT NULL,
    creator_did          TEXT NOT NULL,
    source_cid           TEXT,
    source_url           TEXT,
    source_title         TEXT,
    source_license       TEXT,
    source_accessed_at   BIGINT NOT NULL,
    pipeline_duration_ms BIGINT NOT NULL,
    proof_type           TEXT NOT NULL,
    proof_bytes          BYTEA NOT NULL,
    proof_vk_hash        BYTEA NOT NULL,
    proof_text_hash      BYTEA NOT NULL,
    proof_vector_hash    BYTEA NOT NULL,
    proof_created_at     BIGINT NOT NULL,
    successor_id         UUID,
    created_at           BIGINT NOT NULL,
    updated_at           BIGINT NOT NULL
);
CREATE INDEX IF NOT EXISTS reef_polyp_state_idx ON reef_polyp (state, id);

CREATE TABLE IF NOT EXISTS reef_pipeline_step (
    polyp_id UUID NOT NULL REFERENCES reef_polyp (id),
    ordinal  INTEGER NOT NULL,
    name     TEXT NOT NULL,
    version  TEXT NOT NULL,
    PRIMARY KEY (polyp_id, ordinal)
);

CREATE TABLE IF NOT EXISTS reef_pipeline_param (
    polyp_id UUID NOT NULL REFERENCES reef_polyp (id),
    ordinal  INTEGER NOT NULL,
    key      TEXT NOT NULL,
    value    TEXT NOT NULL,
    PRIMARY KEY (polyp_id, ordinal, key)
);

CREATE TABLE IF NOT EXISTS reef_consensus (
    polyp_id           UUID PRIMARY KEY REFERENCES reef_polyp (id),
    epoch              BIGINT NOT NULL,
    zk_validity        DOUBLE PRECISION NOT NULL,
    semantic_quality   DOUBLE PRECISION NOT NULL,
    novelty            DOUBLE PRECISION NOT NULL,
    source_credibility DOUBLE PRECISION NOT NULL,
    embedding_quality  DOUBLE PRECISION NOT NULL,
    composite          DOUBLE PRECISION NOT NULL,
    final_score        DOUBLE PRECISION NOT NULL,
    review_cycles      INTEGER NOT NULL,
    hardened           BOOLEAN NOT NULL,
    finalized_at       BIGINT NOT NULL
);

CREATE TABLE IF NOT EXISTS reef_validator_score (
    polyp_id      UUID NOT NULL REFERENCES reef_polyp (id),
    ordinal       INTEGER NOT NULL,
    validator_did TEXT NOT NULL,
    score         DOUBLE PRECISION NOT NULL,
    stake         BIGINT NOT NULL,
    PRIMARY KEY (polyp_id, ordinal)
);

CREATE TABLE IF NOT EXISTS reef_hardening (
    polyp_id     UUID PRIMARY KEY REFERENCES reef_polyp (id),
    cid          TEXT NOT NULL,
    merkle_root  BYTEA NOT NULL,
    merkle_proof TEXT NOT NULL,
    anchor_tx    TEXT,
    epoch        BIGINT NOT NULL,
    hardened_at  BIGINT NOT NULL
);

CREATE TABLE IF NOT EXISTS reef_attestation (
    polyp_id    UUID NOT NULL REFERENCES reef_polyp (id),
    ordinal     INTEGER NOT NULL,
    node_did    TEXT NOT NULL,
    attested_at BIGINT NOT NULL,
    PRIMARY KEY (polyp_id, ordinal)
);

CREATE TABLE IF NOT EXISTS reef_audit (
    seq        BIGSERIAL PRIMARY KEY,
    polyp_id   UUID NOT NULL REFERENCES reef_polyp (id),
    from_state TEXT,
    to_state   TEXT NOT NULL,
    version    BIGINT NOT NULL,
    reason     TEXT NOT NULL,
    actor      TEXT NOT NULL,
    at         BIGINT NOT NULL
);
CREATE INDEX IF NOT EXISTS reef_audit_polyp_idx ON reef_audit (polyp_id, seq);
)SQL";

} // namespace

PostgresPolypStore::PostgresPolypStore(PostgresConnectionPool& pool, bool create_schema) : pool_(pool) {
    if (create_schema) ensure_schema();
}

void PostgresPolypStore::ensure_schema() {
    auto db = pool_.acquire();
    db->execute(k_schema);
}

PolypId PostgresPolypStore::create(const PolypSubject& subject, const ZkProof& proof) {
    validate_new(subject, proof);

    PolypId id = PolypId::generate();
    Timestamp now = now_ms();
    const std::string id_text = id.to_string();
    const auto& model = subject.vector.model_id;
    const auto& prov = subject.provenance;

    auto lease = pool_.acquire();
    PostgresConnection& db = *lease;
    PostgresConnection::Transaction txn(db);

    db.execute(
        "INSERT INTO reef_polyp (id, state, version, content, content_type, language, embedding, "
        "model_provider, model_name, model_weights, model_dimensions, quantization, normalization, "
        "creator_hotkey, creator_did, source_cid, source_url, source_title, source_license, source_accessed_at, "
        "pipeline_duration_ms, proof_type, proof_bytes, proof_vk_hash, proof_text_hash, proof_vector_hash, "
        "proof_created_at, successor_id, created_at, updated_at) "
        "VALUES ($1::uuid, $2, 1, $3, $4, $5, $6::real[], $7, $8, $9::bytea, $10::integer, $11, $12, "
        "$13::bytea, $14, $15, $16, $17, $18, $19::bigint, $20::bigint, $21, $22::bytea, $23::bytea, "
        "$24::bytea, $25::bytea, $26::bigint, NULL, $27::bigint, $27::bigint)",
        {
            id_text, std::string(state_name(PolypState::Draft)),
            subject.payload.content, subject.payload.content_type, subject.payload.language,
            float_array_literal(subject.vector.values),
            model.provider, model.name, hash_to_bytea_hex(model.weights_hash),
            std::to_string(model.dimensions), subject.vector.quantization, subject.vector.normalization,
            hash_to_bytea_hex(prov.creator.hotkey), prov.creator.did,
            prov.source.source_cid, prov.source.source_url, prov.source.title, prov.source.license,
            std::to_string(prov.source.accessed_at), std::to_string(prov.pipeline.duration_ms),
            proof.proof_type, bytes_to_bytea_hex(proof.proof_bytes.data(), proof.proof_bytes.size()),
            hash_to_bytea_hex(proof.vk_hash), hash_to_bytea_hex(proof.text_hash),
            hash_to_bytea_hex(proof.vector_hash), std::to_string(proof.created_at),
            std::to_string(now)
        });

    for (size_t i = 0; i < prov.pipeline.steps.size(); ++i) {
        const auto& step = prov.pipeline.steps[i];
        db.execute("INSERT INTO reef_pipeline_step (polyp_id, ordinal, name, version) "
                    "VALUES ($1::uuid, $2::integer, $3, $4)",
                    {id_text, std::to_string(i), step.name, step.version});
        for (const auto& [key, value] : step.params) {
            db.execute("INSERT INTO reef_pipeline_param (polyp_id, ordinal, key, value) "
                        "VALUES ($1::uuid, $2::integer, $3, $4)",
                        {id_text, std::to_string(i), key, value});
        }
    }

    write_audit(db, AuditEntry{id, std::nullopt, PolypState::Draft, 1, "created", "reef", now});
    txn.commit();
    return id;
}

Polyp PostgresPolypStore::get(const PolypId& id) const {
    auto p = find(id);
    if (!p) {
        throw NotFoundError("Polyp not found", id.to_string());
    }
    return std::move(*p);
}

std::optional<Polyp> PostgresPolypStore::find(const PolypId& id) const {
    auto db = pool_.acquire();
    return load(*db, id);
}

std::optional<Polyp> PostgresPolypStore::load(PostgresConnection& db, const PolypId& id) const {
    const std::string id_text = id.to_string();
    std::optional<Polyp> result;

    db.query(
        "SELECT state, version, content, content_type, language, embedding, model_provider, model_name, "
        "model_weights, model_dimensions, quantization, normalization, creator_hotkey, creator_did, "
        "source_cid, source_url, source_title, source_license, source_accessed_at, pipeline_duration_ms, "
        "proof_type, proof_bytes, proof_vk_hash, proof_text_hash, proof_vector_hash, proof_created_at, "
        "successor_id, created_at, updated_at FROM reef_polyp WHERE id = $1::uuid",
        {id_text},
        [&](const Row& row) {
            Polyp p;
            p.id = id;
            p.state = parse_state(required(row, 0));
            p.version = std::stoull(required(row, 1));

            auto& payload = p.subject.payload;
            payload.content = required(row, 2);
            payload.content_type = required(row, 3);
            payload.language = row[4];

            auto& vec = p.subject.vector;
            vec.values = parse_float_array(required(row, 5));
            vec.model_id.provider = required(row, 6);
            vec.model_id.name = required(row, 7);
            vec.model_id.weights_hash = bytea_hex_to_hash(required(row, 8));
            vec.model_id.dimensions = static_cast<uint32_t>(std::stoul(required(row, 9)));
            vec.quantization = required(row, 10);
            vec.normalization = required(row, 11);

            auto& prov = p.subject.provenance;
            prov.creator.hotkey = bytea_hex_to_hash(required(row, 12));
            prov.creator.did = required(row, 13);
            prov.source.source_cid = row[14];
            prov.source.source_url = row[15];
            prov.source.title = row[16];
            prov.source.license = row[17];
            prov.source.accessed_at = std::stoll(required(row, 18));
            prov.pipeline.duration_ms = std::stoull(required(row, 19));

            p.proof.proof_type = required(row, 20);
            p.proof.proof_bytes = bytea_hex_to_bytes(required(row, 21));
            p.proof.vk_hash = bytea_hex_to_hash(required(row, 22));
            p.proof.text_hash = bytea_hex_to_hash(required(row, 23));
            p.proof.vector_hash = bytea_hex_to_hash(required(row, 24));
            p.proof.created_at = std::stoll(required(row, 25));
            // Creation rejects proofs whose model differs from the subject's
            p.proof.model_id = vec.model_id;

            if (row[26]) p.successor_id = PolypId::parse(*row[26]);
            p.created_at = std::stoll(required(row, 27));
            p.updated_at = std::stoll(required(row, 28));
            result = std::move(p);
        });

    if (!result) return std::nullopt;
    Polyp& p = *result;

    db.query("SELECT ordinal, name, version FROM reef_pipeline_step WHERE polyp_id = $1::uuid ORDER BY ordinal",
              {id_text},
              [&](const Row& row) {
                  p.subject.provenance.pipeline.steps.push_back(
                      PipelineStep{required(row, 1), required(row, 2), {}});
              });
    db.query("SELECT ordinal, key, value FROM reef_pipeline_param WHERE polyp_id = $1::uuid",
              {id_text},
              [&](const Row& row) {
                  size_t ordinal = std::stoul(required(row, 0));
                  auto& steps = p.subject.provenance.pipeline.steps;
                  if (ordinal < steps.size()) {
                      steps[ordinal].params[required(row, 1)] = required(row, 2);
                  }
              });

    db.query("SELECT epoch, zk_validity, semantic_quality, novelty, source_credibility, embedding_quality, "
              "composite, final_score, review_cycles, hardened, finalized_at "
              "FROM reef_consensus WHERE polyp_id = $1::uuid",
              {id_text},
              [&](const Row& row) {
                  ConsensusMetadata m;
                  m.epoch = std::stoull(required(row, 0));
                  m.scores.zk_validity = parse_double(required(row, 1));
                  m.scores.semantic_quality = parse_double(required(row, 2));
                  m.scores.novelty = parse_double(required(row, 3));
                  m.scores.source_credibility = parse_double(required(row, 4));
                  m.scores.embedding_quality = parse_double(required(row, 5));
                  m.composite = parse_double(required(row, 6));
                  m.final_score = parse_double(required(row, 7));
                  m.review_cycles = static_cast<uint32_t>(std::stoul(required(row, 8)));
                  m.hardened = required(row, 9) == "t";
                  m.finalized_at = std::stoll(required(row, 10));
                  p.consensus = std::move(m);
              });
    if (p.consensus) {
        db.query("SELECT validator_did, score, stake FROM reef_validator_score "
                  "WHERE polyp_id = $1::uuid ORDER BY ordinal",
                  {id_text},
                  [&](const Row& row) {
                      p.consensus->validator_scores.push_back(
                          ValidatorScore{required(row, 0), parse_double(required(row, 1)),
                                         std::stoull(required(row, 2))});
                  });
    }

    db.query("SELECT cid, merkle_root, merkle_proof, anchor_tx, epoch, hardened_at "
              "FROM reef_hardening WHERE polyp_id = $1::uuid",
              {id_text},
              [&](const Row& row) {
                  HardeningLineage h;
                  h.cid = required(row, 0);
                  h.merkle_root = bytea_hex_to_hash(required(row, 1));
                  h.merkle_proof = split_hashes(required(row, 2));
                  h.anchor_tx = row[3];
                  h.epoch = std::stoull(required(row, 4));
                  h.hardened_at = std::stoll(required(row, 5));
                  p.hardening = std::move(h);
              });
    if (p.hardening) {
        db.query("SELECT node_did, attested_at FROM reef_attestation WHERE polyp_id = $1::uuid ORDER BY ordinal",
                  {id_text},
                  [&](const Row& row) {
                      p.hardening->attestations.push_back(
                          Attestation{required(row, 0), std::stoll(required(row, 1))});
                  });
    }

    return result;
}

void PostgresPolypStore::write_consensus(PostgresConnection& db, const PolypId& id, const ConsensusMetadata& m) {
    const std::string id_text = id.to_string();
    db.execute(
        "INSERT INTO reef_consensus (polyp_id, epoch, zk_validity, semantic_quality, novelty, "
        "source_credibility, embedding_quality, composite, final_score, review_cycles, hardened, finalized_at) "
        "VALUES ($1::uuid, $2::bigint, $3::float8, $4::float8, $5::float8, $6::float8, $7::float8, "
        "$8::float8, $9::float8, $10::integer, $11::boolean, $12::bigint) "
        "ON CONFLICT (polyp_id) DO UPDATE SET epoch = EXCLUDED.epoch, zk_validity = EXCLUDED.zk_validity, "
        "semantic_quality = EXCLUDED.semantic_quality, novelty = EXCLUDED.novelty, "
        "source_credibility = EXCLUDED.source_credibility, embedding_quality = EXCLUDED.embedding_quality, "
        "composite = EXCLUDED.composite, final_score = EXCLUDED.final_score, "
        "review_cycles = EXCLUDED.review_cycles, hardened = EXCLUDED.hardened, "
        "finalized_at = EXCLUDED.finalized_at",
        {
            id_text, std::to_string(m.epoch),
            format_double(m.scores.zk_validity), format_double(m.scores.semantic_quality),
            format_double(m.scores.novelty), format_double(m.scores.source_credibility),
            format_double(m.scores.embedding_quality), format_double(m.composite),
            format_double(m.final_score), std::to_string(m.review_cycles),
            std::string(m.hardened ? "true" : "false"), std::to_string(m.finalized_at)
        });

    db.execute("DELETE FROM reef_validator_score WHERE polyp_id = $1::uuid", {id_text});
    for (size_t i = 0; i < m.validator_scores.size(); ++i) {
        const auto& v = m.validator_scores[i];
        db.execute("INSERT INTO reef_validator_score (polyp_id, ordinal, validator_did, score, stake) "
                    "VALUES ($1::uuid, $2::integer, $3, $4::float8, $5::bigint)",
                    {id_text, std::to_string(i), v.validator_did, format_double(v.score),
                     std::to_string(v.stake)});
    }
}

void PostgresPolypStore::write_hardening(PostgresConnection& db, const PolypId& id, const HardeningLineage& h) {
    const std::string id_text = id.to_string();
    db.execute(
        "INSERT INTO reef_hardening (polyp_id, cid, merkle_root, merkle_proof, anchor_tx, epoch, hardened_at) "
        "VALUES ($1::uuid, $2, $3::bytea, $4, $5, $6::bigint, $7::bigint) "
        "ON CONFLICT (polyp_id) DO UPDATE SET cid = EXCLUDED.cid, merkle_root = EXCLUDED.merkle_root, "
        "merkle_proof = EXCLUDED.merkle_proof, anchor_tx = EXCLUDED.anchor_tx, epoch = EXCLUDED.epoch, "
        "hardened_at = EXCLUDED.hardened_at",
        {id_text, h.cid, hash_to_bytea_hex(h.merkle_root), join_hashes(h.merkle_proof), h.anchor_tx,
         std::to_string(h.epoch), std::to_string(h.hardened_at)});

    db.execute("DELETE FROM reef_attestation WHERE polyp_id = $1::uuid", {id_text});
    for (size_t i = 0; i < h.attestations.size(); ++i) {
        db.execute("INSERT INTO reef_attestation (polyp_id, ordinal, node_did, attested_at) "
                    "VALUES ($1::uuid, $2::integer, $3, $4::bigint)",
                    {id_text, std::to_string(i), h.attestations[i].node_did,
                     std::to_string(h.attestations[i].attested_at)});
    }
}

void PostgresPolypStore::write_audit(PostgresConnection& db, const AuditEntry& e) {
    std::optional<std::string> from;
    if (e.from_state) from = std::string(state_name(*e.from_state));
    db.execute("INSERT INTO reef_audit (polyp_id, from_state, to_state, version, reason, actor, at) "
                "VALUES ($1::uuid, $2, $3, $4::bigint, $5, $6, $7::bigint)",
                {e.polyp_id.to_string(), from, std::string(state_name(e.to_state)),
                 std::to_string(e.version), e.reason, e.actor, std::to_string(e.at)});
}

Polyp PostgresPolypStore::transition(const PolypId& id, PolypState expected, PolypState next,
                                     const TransitionUpdate& update) {
    check_transition(id, expected, next);

    const std::string id_text = id.to_string();
    std::optional<std::string> successor;
    if (update.successor_id) successor = update.successor_id->to_string();

    auto lease = pool_.acquire();
    PostgresConnection& db = *lease;
    PostgresConnection::Transaction txn(db);

    std::optional<std::string> new_version;
    std::optional<std::string> updated_at;
    db.query(
        "UPDATE reef_polyp SET state = $3, version = version + 1, "
        "updated_at = GREATEST(updated_at, $4::bigint), successor_id = COALESCE($5::uuid, successor_id) "
        "WHERE id = $1::uuid AND state = $2 RETURNING version, updated_at",
        {id_text, std::string(state_name(expected)), std::string(state_name(next)),
         std::to_string(now_ms()), successor},
        [&](const Row& row) {
            new_version = row[0];
            updated_at = row[1];
        });

    if (!new_version) {
        auto current = db.query_single("SELECT state FROM reef_polyp WHERE id = $1::uuid", {id_text});
        if (!current) {
            throw NotFoundError("Polyp not found", id_text);
        }
        throw ConflictError(std::string("Expected state ") + state_name(expected) + " but found " + *current,
                            id_text);
    }

    if (update.consensus) write_consensus(db, id, *update.consensus);
    if (update.hardening) write_hardening(db, id, *update.hardening);

    write_audit(db, AuditEntry{id, expected, next, std::stoull(*new_version), update.reason, update.actor,
                           updated_at ? std::stoll(*updated_at) : now_ms()});
    txn.commit();

    Logger::debug("polyp " + id_text + " " + state_name(expected) + " -> " + state_name(next) +
                  " (v" + *new_version + ")");

    auto p = load(db, id);
    if (!p) {
        throw StorageError("Polyp vanished after transition", id_text);
    }
    return std::move(*p);
}

std::vector<Polyp> PostgresPolypStore::scan(PolypState state, const std::optional<PolypId>& after,
                                            size_t limit) const {
    auto lease = pool_.acquire();
    PostgresConnection& db = *lease;

    std::vector<PolypId> ids;
    std::optional<std::string> after_text;
    if (after) after_text = after->to_string();

    db.query("SELECT id FROM reef_polyp WHERE state = $1 AND ($2::uuid IS NULL OR id > $2::uuid) "
              "ORDER BY id LIMIT $3::bigint",
              {std::string(state_name(state)), after_text, std::to_string(limit)},
              [&](const Row& row) { ids.push_back(PolypId::parse(required(row, 0))); });

    std::vector<Polyp> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        auto p = load(db, id);
        if (p && p->state == state) out.push_back(std::move(*p));
    }
    return out;
}

size_t PostgresPolypStore::count(PolypState state) const {
    auto db = pool_.acquire();
    auto n = db->query_single("SELECT COUNT(*) FROM reef_polyp WHERE state = $1",
                              {std::string(state_name(state))});
    return n ? std::stoul(*n) : 0;
}

std::vector<AuditEntry> PostgresPolypStore::audit_log(const PolypId& id) const {
    auto lease = pool_.acquire();
    PostgresConnection& db = *lease;
    const std::string id_text = id.to_string();

    if (!db.query_single("SELECT 1 FROM reef_polyp WHERE id = $1::uuid", {id_text})) {
        throw NotFoundError("Polyp not found", id_text);
    }

    std::vector<AuditEntry> out;
    db.query("SELECT from_state, to_state, version, reason, actor, at FROM reef_audit "
              "WHERE polyp_id = $1::uuid ORDER BY seq",
              {id_text},
              [&](const Row& row) {
                  AuditEntry e;
                  e.polyp_id = id;
                  if (row[0]) e.from_state = parse_state(*row[0]);
                  e.to_state = parse_state(required(row, 1));
                  e.version = std::stoull(required(row, 2));
                  e.reason = required(row, 3);
                  e.actor = required(row, 4);
                  e.at = std::stoll(required(row, 5));
                  out.push_back(std::move(e));
              });
    return out;
}

} // namespace Reef
