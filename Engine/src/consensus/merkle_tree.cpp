#include <consensus/merkle_tree.hpp>
#include <core/errors.hpp>

namespace Reef {

MerkleTree::MerkleTree(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        throw ValidationError("Merkle tree needs at least one leaf");
    }

    levels_.push_back(std::move(leaves));
    while (levels_.back().size() > 1) {
        const auto& below = levels_.back();
        std::vector<Hash256> above;
        above.reserve((below.size() + 1) / 2);
        for (size_t i = 0; i < below.size(); i += 2) {
            const Hash256& right = (i + 1 < below.size()) ? below[i + 1] : below[i];
            above.push_back(BLAKE3Pipeline::hash_pair(below[i], right));
        }
        levels_.push_back(std::move(above));
    }
}

std::vector<Hash256> MerkleTree::proof(size_t index) const {
    if (index >= size()) {
        throw ValidationError("Merkle leaf index out of range", std::to_string(index));
    }

    std::vector<Hash256> path;
    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& nodes = levels_[level];
        size_t sibling = index ^ 1;
        path.push_back(sibling < nodes.size() ? nodes[sibling] : nodes[index]);
        index >>= 1;
    }
    return path;
}

bool MerkleTree::verify(const Hash256& leaf, size_t index, const std::vector<Hash256>& proof,
                        const Hash256& root) {
    Hash256 node = leaf;
    for (const auto& sibling : proof) {
        node = (index & 1) ? BLAKE3Pipeline::hash_pair(sibling, node)
                           : BLAKE3Pipeline::hash_pair(node, sibling);
        index >>= 1;
    }
    return node == root;
}

Hash256 MerkleTree::leaf(const uint8_t* id_bytes, size_t id_len, const std::string& cid) {
    std::vector<uint8_t> buf(id_bytes, id_bytes + id_len);
    buf.insert(buf.end(), cid.begin(), cid.end());
    return BLAKE3Pipeline::hash(buf);
}

} // namespace Reef
