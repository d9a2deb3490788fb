/**
 * @file polyp_id.hpp
 * @brief Time-sortable 128-bit Polyp identifiers (UUIDv7 layout)
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

namespace Reef {

/**
 * @brief UUIDv7 identifier
 *
 * Layout: 48-bit Unix milliseconds, version nibble 7, 12-bit sequence,
 * RFC 4122 variant, 62 random bits. Byte order equals creation order.
 */
class REEF_API PolypId {
public:
    using Bytes = std::array<uint8_t, 16>;

    PolypId() : bytes_{} {}
    explicit PolypId(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Generate a new id
     *
     * Ids generated in the same millisecond by this process are strictly
     * increasing (the 12-bit sequence is bumped, spilling into the timestamp).
     */
    static PolypId generate();

    /**
     * @brief Parse canonical text form xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     * @throws ValidationError on malformed input
     */
    static PolypId parse(const std::string& text);

    std::string to_string() const;

    const Bytes& bytes() const { return bytes_; }

    /// Embedded creation time in Unix milliseconds
    int64_t timestamp_ms() const;

    bool is_nil() const {
        for (uint8_t b : bytes_) if (b != 0) return false;
        return true;
    }

    bool operator==(const PolypId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const PolypId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const PolypId& other) const { return bytes_ < other.bytes_; }
    bool operator>(const PolypId& other) const { return other.bytes_ < bytes_; }

private:
    Bytes bytes_;
};

struct PolypIdHash {
    size_t operator()(const PolypId& id) const noexcept {
        // Low 8 bytes are random
        uint64_t v;
        std::memcpy(&v, id.bytes().data() + 8, sizeof(v));
        return std::hash<uint64_t>{}(v);
    }
};

} // namespace Reef
