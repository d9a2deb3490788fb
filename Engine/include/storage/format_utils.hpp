#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace Reef {

// Shared text encodings for the PostgreSQL store (text-format parameters and results).

inline constexpr char k_hex_lut[] = "0123456789abcdef";

inline int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Format bytes as a bytea hex literal (\x...) for text-mode parameters
inline std::string bytes_to_bytea_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(2 + len * 2);
    out += "\\x";
    for (size_t i = 0; i < len; ++i) {
        out += k_hex_lut[(data[i] >> 4) & 0xF];
        out += k_hex_lut[data[i] & 0xF];
    }
    return out;
}

inline std::string hash_to_bytea_hex(const Hash256& hash) {
    return bytes_to_bytea_hex(hash.data(), hash.size());
}

// Parse bytea text output (hex format, \x prefix)
inline std::vector<uint8_t> bytea_hex_to_bytes(const std::string& text) {
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x' || (text.size() % 2) != 0) {
        throw std::invalid_argument("Not a hex bytea value");
    }
    std::vector<uint8_t> out;
    out.reserve((text.size() - 2) / 2);
    for (size_t i = 2; i < text.size(); i += 2) {
        int hi = hex_nibble(text[i]);
        int lo = hex_nibble(text[i + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid hex digit in bytea value");
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

inline Hash256 bytea_hex_to_hash(const std::string& text) {
    auto bytes = bytea_hex_to_bytes(text);
    if (bytes.size() != BLAKE3Pipeline::HASH_SIZE) {
        throw std::invalid_argument("bytea value is not a 32-byte hash");
    }
    Hash256 h;
    std::copy(bytes.begin(), bytes.end(), h.begin());
    return h;
}

// Round-trip exact float formatting (9 significant digits)
inline std::string float_array_literal(const std::vector<float>& values) {
    std::string out = "{";
    char buf[32];
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ',';
        std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(values[i]));
        out += buf;
    }
    out += '}';
    return out;
}

inline std::vector<float> parse_float_array(const std::string& text) {
    if (text.size() < 2 || text.front() != '{' || text.back() != '}') {
        throw std::invalid_argument("Not an array literal");
    }
    std::vector<float> out;
    const char* p = text.c_str() + 1;
    const char* end = text.c_str() + text.size() - 1;
    while (p < end) {
        char* next = nullptr;
        float v = std::strtof(p, &next);
        if (next == p) throw std::invalid_argument("Invalid array element");
        out.push_back(v);
        p = next;
        if (p < end && *p == ',') ++p;
    }
    return out;
}

// Doubles as text; NaN spelled the way PostgreSQL accepts it
inline std::string format_double(double v) {
    if (std::isnan(v)) return "NaN";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

inline double parse_double(const std::string& text) {
    if (text == "NaN") return std::nan("");
    return std::strtod(text.c_str(), nullptr);
}

} // namespace Reef
