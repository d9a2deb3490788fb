/**
 * @file merkle_tree.hpp
 * @brief BLAKE3 Merkle tree over a hardening batch
 */

#pragma once

#include <export.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <string>
#include <vector>

namespace Reef {

/**
 * @brief Binary Merkle tree, interior node = BLAKE3(left || right)
 *
 * A level with an odd count pairs its last node with itself, so a proof is
 * always one sibling per level and verifies from the leaf index alone.
 */
class REEF_API MerkleTree {
public:
    /**
     * @throws ValidationError for an empty leaf set
     */
    explicit MerkleTree(std::vector<Hash256> leaves);

    const Hash256& root() const { return levels_.back().front(); }

    size_t size() const { return levels_.front().size(); }

    /**
     * @brief Sibling hashes from leaf to root
     * @throws ValidationError for an out-of-range index
     */
    std::vector<Hash256> proof(size_t index) const;

    static bool verify(const Hash256& leaf, size_t index, const std::vector<Hash256>& proof,
                       const Hash256& root);

    /// Leaf hash of a hardened Polyp: BLAKE3(id bytes || cid)
    static Hash256 leaf(const uint8_t* id_bytes, size_t id_len, const std::string& cid);

private:
    std::vector<std::vector<Hash256>> levels_;
};

} // namespace Reef
