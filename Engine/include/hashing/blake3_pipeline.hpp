/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing pipeline for content binding and addressing
 */

#pragma once

#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Reef {

/**
 * @brief BLAKE3-256 hashing helpers
 *
 * Every binding in the Reef (proof text/vector hashes, content ids, Merkle
 * nodes) is a 32-byte BLAKE3 digest.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 32; // 256 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 32-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    /**
     * @brief Hash a float vector as little-endian IEEE-754 float32 bytes
     *
     * Byte order is fixed so the digest is identical on every host.
     */
    static Hash hash_vector(const std::vector<float>& values);

    /**
     * @brief Keyed hash (BLAKE3 keyed mode)
     * @param key 32-byte key
     */
    static Hash keyed_hash(const Hash& key, const void* data, size_t len);

    /**
     * @brief Hash the concatenation of two digests (Merkle interior node)
     */
    static Hash hash_pair(const Hash& left, const Hash& right);

    /**
     * @brief Batch hash multiple inputs (parallel)
     * @return Vector of hashes (same order)
     */
    static std::vector<Hash> hash_batch(const std::vector<std::string>& inputs);

    static std::string to_hex(const Hash& hash);

    /**
     * @brief Convert 64-character hex string to hash
     * @throws std::invalid_argument on bad length or characters
     */
    static Hash from_hex(const std::string& hex);

    static bool equal(const Hash& a, const Hash& b) {
        return a == b;
    }
};

using Hash256 = BLAKE3Pipeline::Hash;

} // namespace Reef
