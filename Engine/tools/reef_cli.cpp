/**
 * @file reef_cli.cpp
 * @brief Command-line front end for a Reef node
 */

#include <adapters/attestation.hpp>
#include <adapters/feature_hash_embedder.hpp>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <database/connection_pool.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <service/reef_service.hpp>
#include <storage/memory_polyp_store.hpp>
#include <storage/postgres_polyp_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace Reef;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [args]\n"
              << "\nCommands:\n"
              << "  demo                     In-memory walkthrough of the full lifecycle\n"
              << "  submit <text>            Embed, prove and ingest a text\n"
              << "  search <query> [top_k]   Semantic search over Approved and Hardened Polyps\n"
              << "  get <id>                 Show a Polyp and its audit log\n"
              << "  sweep [block]            Re-evaluate pending Polyps\n"
              << "  finalize [block]         Harden Polyps approved in earlier epochs\n"
              << "\nEnvironment:\n"
              << "  PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD   database (default dbname reef)\n"
              << "  REEF_ATTESTATION_KEY     64 hex chars, node attestation key\n"
              << "  REEF_NODE_DID            node identity (default did:reef:local)\n"
              << "  REEF_*                   engine tuning, see config.hpp\n";
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

Hash256 attestation_key() {
    const char* hex = std::getenv("REEF_ATTESTATION_KEY");
    if (hex && *hex) {
        try {
            return BLAKE3Pipeline::from_hex(hex);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("REEF_ATTESTATION_KEY: ") + e.what());
        }
    }
    Logger::warn("REEF_ATTESTATION_KEY not set, using the development key");
    return BLAKE3Pipeline::hash("reef-development-node");
}

/// Block height from the argument, else wall clock at 12 s per block
uint64_t block_arg(int argc, char** argv, int pos) {
    if (argc > pos) return std::stoull(argv[pos]);
    return static_cast<uint64_t>(now_ms() / 12000);
}

std::unique_ptr<ReefService> make_service(const ReefConfig& config, std::shared_ptr<PolypStore> store) {
    Hash256 key = attestation_key();
    auto prover = std::make_shared<AttestationProver>(key);
    auto verifier = std::make_shared<AttestationVerifier>();
    verifier->trust(key);

    NodeIdentity node;
    node.did = env_or("REEF_NODE_DID", "did:reef:local");
    node.hotkey = prover->vk_hash();

    return std::make_unique<ReefService>(config, std::move(store), std::make_shared<FeatureHashEmbedder>(),
                                         std::move(verifier), std::move(prover), std::move(node));
}

void print_result(size_t rank, const SearchResult& r) {
    std::cout << std::setw(2) << rank << ". [" << std::fixed << std::setprecision(4) << r.similarity
              << " sim, " << std::setprecision(3) << r.trust_score << " trust, " << state_name(r.state) << "] "
              << r.payload.content << "\n"
              << "    " << r.polyp_id.to_string();
    if (r.hardened_epoch) std::cout << "  epoch " << *r.hardened_epoch;
    if (r.cid) std::cout << "  " << *r.cid;
    std::cout << "\n";
}

void print_polyp(const Polyp& p, const std::vector<AuditEntry>& audit) {
    std::cout << "Polyp " << p.id.to_string() << "\n"
              << "  state:    " << state_name(p.state) << " (v" << p.version << ")\n"
              << "  content:  " << p.subject.payload.content << "\n"
              << "  model:    " << p.subject.vector.model_id.key() << "\n"
              << "  creator:  " << p.subject.provenance.creator.did << "\n";
    if (p.consensus) {
        const auto& c = *p.consensus;
        std::cout << std::fixed << std::setprecision(3)
                  << "  scores:   zk " << c.scores.zk_validity << ", semantic " << c.scores.semantic_quality
                  << ", novelty " << c.scores.novelty << ", source " << c.scores.source_credibility
                  << ", embedding " << c.scores.embedding_quality << "\n"
                  << "  trust:    " << c.composite << " (final " << c.final_score << ", epoch " << c.epoch
                  << ", reviews " << c.review_cycles << ")\n";
    }
    if (p.hardening) {
        std::cout << "  cid:      " << p.hardening->cid << "\n"
                  << "  root:     " << BLAKE3Pipeline::to_hex(p.hardening->merkle_root) << "\n";
    }
    if (p.successor_id) {
        std::cout << "  molted into " << p.successor_id->to_string() << "\n";
    }
    std::cout << "  audit:\n";
    for (const auto& a : audit) {
        std::cout << "    v" << a.version << " " << (a.from_state ? state_name(*a.from_state) : "-")
                  << " -> " << state_name(a.to_state) << "  " << a.reason << "\n";
    }
}

int run_demo(const ReefConfig& config) {
    auto store = std::make_shared<MemoryPolypStore>();
    auto reef = make_service(config, store);

    Logger::step("Submitting");
    PolypId light = reef->submit({"The speed of light is 299792458 m/s"}, reef->context_at(0));
    reef->submit({"Water boils at 100 degrees Celsius at sea level"}, reef->context_at(0));
    reef->submit({"The Pacific is the largest ocean on Earth"}, reef->context_at(0));

    Logger::step("Epoch 0 review");
    reef->run_sweep(reef->context_at(0));

    Logger::step("Epoch 1 finalization");
    reef->finalize_epoch(reef->context_at(config.blocks_per_epoch));

    Logger::step("Search: how fast is light");
    auto response = reef->search("how fast is light", 5);
    for (size_t i = 0; i < response.results.size(); ++i) print_result(i + 1, response.results[i]);

    Logger::step("Resubmitting a duplicate");
    PolypId dup = reef->submit({"The speed of light is 299792458 m/s"}, reef->context_at(config.blocks_per_epoch));
    for (uint32_t i = 0; i < config.lifecycle.max_review_cycles; ++i) {
        reef->run_sweep(reef->context_at(config.blocks_per_epoch + i));
    }

    std::cout << "\n";
    print_polyp(reef->get(light), reef->audit_log(light));
    std::cout << "\n";
    print_polyp(reef->get(dup), reef->audit_log(dup));
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    try {
        ReefConfig config = ReefConfig::from_env();
        config.validate();
        Logger::set_level(Logger::parse_level(config.log_level));

        const std::string command = argv[1];
        if (command == "demo") {
            return run_demo(config);
        }

        PostgresConnectionPool pool(config.db_connections);
        auto store = std::make_shared<PostgresPolypStore>(pool);
        auto reef = make_service(config, store);
        size_t indexed = reef->rebuild_index();
        Logger::debug("Indexed " + std::to_string(indexed) + " Polyps");

        if (command == "submit" && argc >= 3) {
            uint64_t block = block_arg(argc, argv, 3);
            PolypId id = reef->submit({argv[2]}, reef->context_at(block));
            Polyp p = reef->get(id);
            std::cout << id.to_string() << " " << state_name(p.state) << "\n";
        } else if (command == "search" && argc >= 3) {
            size_t top_k = argc >= 4 ? std::stoul(argv[3]) : 10;
            auto response = reef->search(argv[2], top_k);
            if (response.empty_index) {
                std::cout << "Index is empty.\n";
            }
            for (size_t i = 0; i < response.results.size(); ++i) print_result(i + 1, response.results[i]);
            std::cout << std::fixed << std::setprecision(2) << response.search_time_ms << " ms\n";
        } else if (command == "get" && argc >= 3) {
            PolypId id = PolypId::parse(argv[2]);
            print_polyp(reef->get(id), reef->audit_log(id));
        } else if (command == "sweep") {
            auto report = reef->run_sweep(reef->context_at(block_arg(argc, argv, 2)));
            std::cout << report.evaluated << " evaluated, " << report.changed << " changed, "
                      << report.deferred << " deferred, " << report.failed << " failed\n";
            return report.failed == 0 ? 0 : 1;
        } else if (command == "finalize") {
            auto hardened = reef->finalize_epoch(reef->context_at(block_arg(argc, argv, 2)));
            for (const auto& p : hardened) {
                std::cout << p.id.to_string() << " " << p.hardening->cid << "\n";
            }
            std::cout << hardened.size() << " hardened\n";
        } else {
            usage(argv[0]);
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
