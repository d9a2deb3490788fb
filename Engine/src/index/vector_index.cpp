/**
 * @file vector_index.cpp
 * @brief hnswlib-backed partitioned cosine index
 */

#include <index/vector_index.hpp>
#include <core/errors.hpp>
#include <ml/vector_math.hpp>
#include <storage/polyp_store.hpp>
#include <utils/logger.hpp>
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <queue>

namespace Reef {

namespace fs = std::filesystem;

/**
 * @brief One model space
 *
 * Vectors are stored L2-normalized in an inner-product space, so
 * 1 - distance is the cosine similarity. Labels are dense per partition.
 */
struct VectorIndex::Partition {
    EmbeddingModelId model;
    std::unique_ptr<hnswlib::InnerProductSpace> space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
    std::unordered_map<PolypId, hnswlib::labeltype, PolypIdHash> labels;
    std::vector<PolypId> ids;   // by label
    std::vector<uint8_t> tiers; // by label
    std::vector<uint8_t> live;  // by label
    size_t live_count = 0;
    mutable std::shared_mutex mutex;
};

namespace {

class HardenedOnlyFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit HardenedOnlyFilter(const std::vector<uint8_t>& tiers) : tiers_(tiers) {}

    bool operator()(hnswlib::labeltype label) override {
        return label < tiers_.size() && tiers_[label] == static_cast<uint8_t>(IndexTier::Hardened);
    }

private:
    const std::vector<uint8_t>& tiers_;
};

std::string segment_stem(const std::string& key) {
    return BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(key)).substr(0, 24);
}

} // namespace

VectorIndex::VectorIndex(IndexConfig config) : config_(config) {}

VectorIndex::~VectorIndex() = default;

std::shared_ptr<VectorIndex::Partition> VectorIndex::make_partition(const EmbeddingModelId& model) const {
    auto part = std::make_shared<Partition>();
    part->model = model;
    part->space = std::make_unique<hnswlib::InnerProductSpace>(model.dimensions);
    part->hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        part->space.get(), config_.initial_capacity, config_.M, config_.ef_construction);
    part->hnsw->setEf(config_.ef_search);
    return part;
}

std::shared_ptr<VectorIndex::Partition> VectorIndex::find_partition(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
    auto it = partitions_.find(key);
    return it == partitions_.end() ? nullptr : it->second;
}

std::shared_ptr<VectorIndex::Partition> VectorIndex::partition_for(const EmbeddingModelId& model) {
    const std::string key = model.key();
    if (auto existing = find_partition(key)) return existing;

    std::unique_lock<std::shared_mutex> lock(partitions_mutex_);
    auto it = partitions_.find(key);
    if (it == partitions_.end()) {
        it = partitions_.emplace(key, make_partition(model)).first;
        Logger::info("Created vector index partition " + key);
    }
    return it->second;
}

void VectorIndex::add_batch(Partition& part, std::vector<BatchItem>& items) {
    std::vector<hnswlib::labeltype> assigned(items.size());
    size_t fresh = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        auto it = part.labels.find(items[i].id);
        if (it != part.labels.end()) {
            assigned[i] = it->second;
            continue;
        }
        hnswlib::labeltype label = part.ids.size();
        part.ids.push_back(items[i].id);
        part.tiers.push_back(0);
        part.live.push_back(0);
        part.labels.emplace(items[i].id, label);
        assigned[i] = label;
        ++fresh;
    }

    size_t needed = part.hnsw->getCurrentElementCount() + fresh;
    if (needed > part.hnsw->getMaxElements()) {
        part.hnsw->resizeIndex(std::max(part.hnsw->getMaxElements() * 2, needed));
    }

    std::exception_ptr failure;
    const long long n = static_cast<long long>(items.size());

    #pragma omp parallel for schedule(dynamic, 64) if (n > 256)
    for (long long i = 0; i < n; ++i) {
        try {
            part.hnsw->addPoint(items[i].vector.data(), assigned[i]);
        } catch (...) {
            #pragma omp critical
            {
                if (!failure) failure = std::current_exception();
            }
        }
    }

    if (failure) std::rethrow_exception(failure);

    for (size_t i = 0; i < items.size(); ++i) {
        hnswlib::labeltype label = assigned[i];
        if (!part.live[label]) {
            part.live[label] = 1;
            ++part.live_count;
        }
        part.tiers[label] = static_cast<uint8_t>(items[i].tier);
    }
}

void VectorIndex::upsert(const PolypId& id, const VectorEmbedding& embedding, IndexTier tier) {
    embedding.validate();
    const std::string key = embedding.model_id.key();

    bool moved = false;
    {
        std::lock_guard<std::mutex> lock(locations_mutex_);
        auto it = locations_.find(id);
        moved = it != locations_.end() && it->second != key;
    }
    if (moved) remove(id);

    auto part = partition_for(embedding.model_id);
    std::vector<BatchItem> items;
    items.push_back(BatchItem{id, VectorMath::normalized(embedding.values), tier});
    {
        std::unique_lock<std::shared_mutex> lock(part->mutex);
        add_batch(*part, items);
    }

    std::lock_guard<std::mutex> lock(locations_mutex_);
    locations_[id] = key;
}

bool VectorIndex::remove(const PolypId& id) {
    std::string key;
    {
        std::lock_guard<std::mutex> lock(locations_mutex_);
        auto it = locations_.find(id);
        if (it == locations_.end()) return false;
        key = it->second;
        locations_.erase(it);
    }

    auto part = find_partition(key);
    if (!part) return false;

    std::unique_lock<std::shared_mutex> lock(part->mutex);
    auto it = part->labels.find(id);
    if (it == part->labels.end() || !part->live[it->second]) return false;

    part->hnsw->markDelete(it->second);
    part->live[it->second] = 0;
    --part->live_count;
    return true;
}

std::vector<IndexHit> VectorIndex::query(const std::vector<float>& vector, const EmbeddingModelId& model,
                                         size_t k, bool hardened_only) const {
    if (vector.size() != model.dimensions) {
        throw ValidationError("Query vector length does not match model dimensions",
                              std::to_string(vector.size()) + " != " + std::to_string(model.dimensions));
    }

    auto part = find_partition(model.key());
    if (!part || k == 0) return {};

    std::vector<float> q = VectorMath::normalized(vector);

    std::shared_lock<std::shared_mutex> lock(part->mutex);
    if (part->live_count == 0) return {};

    // Fetch a margin past k so equal-similarity neighbours at the cut are ordered by id
    size_t fetch = std::min(part->live_count, k + std::max<size_t>(k / 2, 4));

    std::priority_queue<std::pair<float, hnswlib::labeltype>> result;
    if (hardened_only) {
        HardenedOnlyFilter filter(part->tiers);
        result = part->hnsw->searchKnn(q.data(), fetch, &filter);
    } else {
        result = part->hnsw->searchKnn(q.data(), fetch);
    }

    std::vector<IndexHit> hits;
    hits.reserve(result.size());
    while (!result.empty()) {
        hnswlib::labeltype label = result.top().second;
        result.pop();
        if (label >= part->ids.size() || !part->live[label]) continue;
        // Re-score exactly; the graph distance is float and would blur ties
        std::vector<float> stored = part->hnsw->template getDataByLabel<float>(label);
        double similarity = std::clamp(VectorMath::dot(q, stored), -1.0, 1.0);
        hits.push_back(IndexHit{part->ids[label], similarity});
    }

    std::sort(hits.begin(), hits.end(), [](const IndexHit& a, const IndexHit& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.id < b.id;
    });
    if (hits.size() > k) hits.resize(k);
    return hits;
}

bool VectorIndex::contains(const PolypId& id) const {
    std::lock_guard<std::mutex> lock(locations_mutex_);
    return locations_.count(id) > 0;
}

size_t VectorIndex::size(const EmbeddingModelId& model) const {
    auto part = find_partition(model.key());
    if (!part) return 0;
    std::shared_lock<std::shared_mutex> lock(part->mutex);
    return part->live_count;
}

size_t VectorIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
    size_t total = 0;
    for (const auto& [key, part] : partitions_) {
        std::shared_lock<std::shared_mutex> part_lock(part->mutex);
        total += part->live_count;
    }
    return total;
}

std::vector<std::string> VectorIndex::spaces() const {
    std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
    std::vector<std::string> keys;
    keys.reserve(partitions_.size());
    for (const auto& [key, part] : partitions_) keys.push_back(key);
    std::sort(keys.begin(), keys.end());
    return keys;
}

void VectorIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(partitions_mutex_);
    std::lock_guard<std::mutex> loc_lock(locations_mutex_);
    partitions_.clear();
    locations_.clear();
}

void VectorIndex::save(const std::string& directory) const {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw StorageError("Cannot create index directory", directory + ": " + ec.message());
    }

    std::shared_lock<std::shared_mutex> lock(partitions_mutex_);
    for (const auto& [key, part] : partitions_) {
        std::shared_lock<std::shared_mutex> part_lock(part->mutex);
        const fs::path stem = fs::path(directory) / segment_stem(key);

        part->hnsw->saveIndex(fs::path(stem).replace_extension(".hnsw").string());

        const std::string labels_path = fs::path(stem).replace_extension(".labels").string();
        std::ofstream out(labels_path, std::ios::trunc);
        out << "reef-index 1\n"
            << std::quoted(part->model.provider) << ' ' << std::quoted(part->model.name) << ' '
            << BLAKE3Pipeline::to_hex(part->model.weights_hash) << ' ' << part->model.dimensions << '\n'
            << part->ids.size() << '\n';
        for (size_t label = 0; label < part->ids.size(); ++label) {
            out << part->ids[label].to_string() << ' ' << static_cast<int>(part->tiers[label]) << ' '
                << static_cast<int>(part->live[label]) << '\n';
        }
        if (!out) {
            throw StorageError("Failed writing index label map", labels_path);
        }
    }
}

void VectorIndex::load(const std::string& directory) {
    if (!fs::is_directory(directory)) {
        throw StorageError("Index directory does not exist", directory);
    }

    std::unordered_map<std::string, std::shared_ptr<Partition>> loaded;
    std::unordered_map<PolypId, std::string, PolypIdHash> locations;

    for (const auto& entry : fs::directory_iterator(directory)) {
        if (entry.path().extension() != ".labels") continue;
        const std::string labels_path = entry.path().string();

        try {
            std::ifstream in(labels_path);
            std::string magic;
            int format = 0;
            in >> magic >> format;
            if (magic != "reef-index" || format != 1) {
                throw StorageError("Unrecognized index label map");
            }

            EmbeddingModelId model;
            std::string weights_hex;
            size_t count = 0;
            in >> std::quoted(model.provider) >> std::quoted(model.name) >> weights_hex >> model.dimensions >> count;
            if (!in) throw StorageError("Truncated index header");
            model.weights_hash = BLAKE3Pipeline::from_hex(weights_hex);

            auto part = std::make_shared<Partition>();
            part->model = model;
            part->ids.reserve(count);
            for (size_t label = 0; label < count; ++label) {
                std::string id_text;
                int tier = 0;
                int live = 0;
                in >> id_text >> tier >> live;
                if (!in) throw StorageError("Truncated label map");
                PolypId id = PolypId::parse(id_text);
                part->ids.push_back(id);
                part->tiers.push_back(static_cast<uint8_t>(tier));
                part->live.push_back(static_cast<uint8_t>(live ? 1 : 0));
                part->labels.emplace(id, label);
                if (live) {
                    ++part->live_count;
                    locations[id] = model.key();
                }
            }

            const std::string hnsw_path = fs::path(entry.path()).replace_extension(".hnsw").string();
            if (!fs::exists(hnsw_path)) throw StorageError("Missing HNSW segment", hnsw_path);

            part->space = std::make_unique<hnswlib::InnerProductSpace>(model.dimensions);
            part->hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(
                part->space.get(), hnsw_path, false, std::max(count, config_.initial_capacity));
            part->hnsw->setEf(config_.ef_search);

            loaded.emplace(model.key(), std::move(part));
        } catch (const StorageError&) {
            throw;
        } catch (const std::exception& e) {
            throw StorageError("Corrupt index segment", labels_path + ": " + e.what());
        }
    }

    std::unique_lock<std::shared_mutex> lock(partitions_mutex_);
    std::lock_guard<std::mutex> loc_lock(locations_mutex_);
    partitions_ = std::move(loaded);
    locations_ = std::move(locations);
    Logger::info("Loaded " + std::to_string(partitions_.size()) + " vector index partition(s) from " + directory);
}

size_t VectorIndex::rebuild(const PolypStore& store) {
    clear();

    std::unordered_map<std::string, std::vector<BatchItem>> batches;
    std::unordered_map<std::string, EmbeddingModelId> models;

    const std::pair<PolypState, IndexTier> tiers[] = {
        {PolypState::Approved, IndexTier::Approved},
        {PolypState::Hardened, IndexTier::Hardened}
    };
    for (const auto& [state, tier] : tiers) {
        auto cursor = store.list_by_state(state);
        while (auto p = cursor.next()) {
            const auto& vec = p->subject.vector;
            const std::string key = vec.model_id.key();
            batches[key].push_back(BatchItem{p->id, VectorMath::normalized(vec.values), tier});
            models.emplace(key, vec.model_id);
        }
    }

    size_t total = 0;
    for (auto& [key, items] : batches) {
        auto part = partition_for(models.at(key));
        {
            std::unique_lock<std::shared_mutex> lock(part->mutex);
            add_batch(*part, items);
        }
        std::lock_guard<std::mutex> lock(locations_mutex_);
        for (const auto& item : items) locations_[item.id] = key;
        total += items.size();
    }

    Logger::info("Rebuilt vector index: " + std::to_string(total) + " entries across " +
                 std::to_string(batches.size()) + " model space(s)");
    return total;
}

} // namespace Reef
