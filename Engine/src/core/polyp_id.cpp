/**
 * @file polyp_id.cpp
 * @brief UUIDv7 generation and parsing
 */

#include <core/polyp_id.hpp>
#include <core/errors.hpp>
#include <utils/time.hpp>
#include <mutex>
#include <random>

namespace Reef {

namespace {

constexpr char k_hex[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

struct IdState {
    std::mutex mutex;
    int64_t last_ms = 0;
    uint16_t sequence = 0;
    std::mt19937_64 rng{std::random_device{}()};
};

IdState& id_state() {
    static IdState state;
    return state;
}

} // namespace

PolypId PolypId::generate() {
    IdState& state = id_state();

    int64_t ms;
    uint16_t seq;
    uint64_t rand_b;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        ms = now_ms();
        if (ms <= state.last_ms) {
            ms = state.last_ms;
            if (++state.sequence > 0x0FFF) {
                // Sequence exhausted: borrow the next millisecond
                ++ms;
                state.sequence = 0;
            }
        } else {
            state.sequence = 0;
        }
        state.last_ms = ms;
        seq = state.sequence;
        rand_b = state.rng();
    }

    Bytes b{};
    for (int i = 0; i < 6; ++i) {
        b[i] = static_cast<uint8_t>((static_cast<uint64_t>(ms) >> (40 - 8 * i)) & 0xFF);
    }
    b[6] = static_cast<uint8_t>(0x70 | ((seq >> 8) & 0x0F));
    b[7] = static_cast<uint8_t>(seq & 0xFF);
    for (int i = 0; i < 8; ++i) {
        b[8 + i] = static_cast<uint8_t>((rand_b >> (56 - 8 * i)) & 0xFF);
    }
    b[8] = static_cast<uint8_t>(0x80 | (b[8] & 0x3F));

    return PolypId(b);
}

PolypId PolypId::parse(const std::string& text) {
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        throw ValidationError("Malformed polyp id", text);
    }

    Bytes b{};
    size_t out = 0;
    for (size_t i = 0; i < text.size(); ) {
        if (text[i] == '-') { ++i; continue; }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0 || out >= b.size()) {
            throw ValidationError("Malformed polyp id", text);
        }
        b[out++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    if (out != b.size()) {
        throw ValidationError("Malformed polyp id", text);
    }
    return PolypId(b);
}

std::string PolypId::to_string() const {
    char buf[37];
    char* p = buf;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) *p++ = '-';
        *p++ = k_hex[(bytes_[i] >> 4) & 0xF];
        *p++ = k_hex[bytes_[i] & 0xF];
    }
    return std::string(buf, 36);
}

int64_t PolypId::timestamp_ms() const {
    uint64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes_[i];
    }
    return static_cast<int64_t>(ms);
}

} // namespace Reef
