/**
 * @file vector_index.hpp
 * @brief Approximate nearest-neighbour index partitioned by embedding model
 */

#pragma once

#include <export.hpp>
#include <core/config.hpp>
#include <core/polyp.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Reef {

class PolypStore;

enum class IndexTier : uint8_t {
    Approved = 0,
    Hardened = 1
};

struct IndexHit {
    PolypId id;
    double similarity = 0.0;
};

/**
 * @brief HNSW cosine index with one partition per model space
 *
 * Vectors from different models never share a partition, so a query only
 * ever sees vectors embedded by the same model. Entries are keyed by PolypId;
 * the index owns no Polyp data and can be rebuilt from the store.
 *
 * Mutations lock only their partition; queries take shared locks. Callers
 * serialize concurrent upserts of the same id (the store's state check does).
 */
class REEF_API VectorIndex {
public:
    explicit VectorIndex(IndexConfig config = IndexConfig{});
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /**
     * @brief Insert or replace the vector for id
     *
     * If the id lives under another model it is removed from there first.
     * @throws ValidationError if the embedding is malformed
     */
    void upsert(const PolypId& id, const VectorEmbedding& embedding, IndexTier tier);

    /**
     * @brief Remove id from whichever partition holds it
     * @return false if it was not indexed
     */
    bool remove(const PolypId& id);

    /**
     * @brief k nearest entries by cosine similarity
     *
     * Ordered by similarity descending, ties by id ascending. Returns an empty
     * list for an unknown or empty model space.
     * @param hardened_only Restrict to entries in the Hardened tier
     * @throws ValidationError if the query length differs from the model dimensions
     */
    std::vector<IndexHit> query(const std::vector<float>& vector, const EmbeddingModelId& model,
                                size_t k, bool hardened_only = false) const;

    bool contains(const PolypId& id) const;

    /// Live entries in one model space
    size_t size(const EmbeddingModelId& model) const;

    /// Live entries across all spaces
    size_t size() const;

    /// Partition keys (EmbeddingModelId::key) currently present
    std::vector<std::string> spaces() const;

    /**
     * @brief Persist each partition as <dir>/<space>.hnsw plus a label map
     * @throws StorageError on I/O failure
     */
    void save(const std::string& directory) const;

    /**
     * @brief Replace contents with partitions saved by save()
     * @throws StorageError on missing or corrupt files
     */
    void load(const std::string& directory);

    /**
     * @brief Drop everything and re-index every Approved and Hardened Polyp
     * @return Number of entries indexed
     */
    size_t rebuild(const PolypStore& store);

    void clear();

private:
    struct Partition;

    struct BatchItem {
        PolypId id;
        std::vector<float> vector; // normalized
        IndexTier tier;
    };

    // Callers hold the returned partition alive across clear() and load()
    std::shared_ptr<Partition> find_partition(const std::string& key) const;
    std::shared_ptr<Partition> partition_for(const EmbeddingModelId& model);
    void add_batch(Partition& part, std::vector<BatchItem>& items);
    std::shared_ptr<Partition> make_partition(const EmbeddingModelId& model) const;

    IndexConfig config_;

    mutable std::shared_mutex partitions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Partition>> partitions_;

    mutable std::mutex locations_mutex_;
    std::unordered_map<PolypId, std::string, PolypIdHash> locations_;
};

} // namespace Reef
