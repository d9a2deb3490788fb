/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <algorithm>

namespace Reef {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_vector(const std::vector<float>& values) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);

    // Serialize explicitly so big-endian hosts produce the same bytes
    uint8_t chunk[4 * 256];
    size_t filled = 0;
    for (float v : values) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        chunk[filled++] = static_cast<uint8_t>(bits & 0xFF);
        chunk[filled++] = static_cast<uint8_t>((bits >> 8) & 0xFF);
        chunk[filled++] = static_cast<uint8_t>((bits >> 16) & 0xFF);
        chunk[filled++] = static_cast<uint8_t>((bits >> 24) & 0xFF);
        if (filled == sizeof(chunk)) {
            blake3_hasher_update(&hasher, chunk, filled);
            filled = 0;
        }
    }
    if (filled > 0) {
        blake3_hasher_update(&hasher, chunk, filled);
    }

    Hash result;
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);
    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::keyed_hash(const Hash& key, const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init_keyed(&hasher, key.data());
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_pair(const Hash& left, const Hash& right) {
    uint8_t buf[HASH_SIZE * 2];
    std::memcpy(buf, left.data(), HASH_SIZE);
    std::memcpy(buf + HASH_SIZE, right.data(), HASH_SIZE);
    return hash(buf, sizeof(buf));
}

std::vector<BLAKE3Pipeline::Hash> BLAKE3Pipeline::hash_batch(const std::vector<std::string>& inputs) {
    std::vector<Hash> results(inputs.size());

    const size_t num_threads = std::min(
        (size_t)std::thread::hardware_concurrency(),
        inputs.size()
    );

    if (num_threads <= 1 || inputs.size() < 100) {
        for (size_t i = 0; i < inputs.size(); ++i) {
            results[i] = hash(inputs[i]);
        }
    } else {
        std::vector<std::thread> threads;
        size_t chunk_size = (inputs.size() + num_threads - 1) / num_threads;

        for (size_t t = 0; t < num_threads; ++t) {
            size_t start = t * chunk_size;
            size_t end = std::min(start + chunk_size, inputs.size());

            if (start >= inputs.size()) break;

            threads.emplace_back([&, start, end]() {
                for (size_t i = start; i < end; ++i) {
                    results[i] = hash(inputs[i]);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }
    }

    return results;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    static constexpr char lut[] = "0123456789abcdef";
    std::string out(HASH_SIZE * 2, '0');
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        out[i * 2] = lut[(hash[i] >> 4) & 0xF];
        out[i * 2 + 1] = lut[hash[i] & 0xF];
    }
    return out;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) +
                                    ". Expected 64 (256-bit).");
    }

    Hash result{};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character in: " + hex);
        }
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return result;
}

} // namespace Reef
