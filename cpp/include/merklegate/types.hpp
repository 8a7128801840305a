#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <cstring>
#include <optional>
#include <vector>

namespace merklegate {

// Width of a raw account identifier in bytes
inline constexpr size_t ADDRESS_BYTES = 20;

// Width of a Keccak-256 digest in bytes
inline constexpr size_t DIGEST_BYTES = 32;

using AddressBytes = std::array<uint8_t, ADDRESS_BYTES>;

// =============================================================================
// Digest - 32-byte Keccak-256 output
// =============================================================================
//
// Ordering is byte-lexicographic, which is the ordering the sorted-pair rule
// uses when combining two children.
//
struct Digest {
    std::array<uint8_t, DIGEST_BYTES> bytes;

    constexpr Digest() noexcept : bytes{} {}

    // Copy from raw pointer
    explicit Digest(const uint8_t* data) noexcept {
        std::memcpy(bytes.data(), data, DIGEST_BYTES);
    }

    bool operator==(const Digest& other) const noexcept {
        return bytes == other.bytes;
    }

    bool operator!=(const Digest& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Digest& other) const noexcept {
        return bytes < other.bytes;
    }

    bool operator<=(const Digest& other) const noexcept {
        return bytes <= other.bytes;
    }

    bool operator>(const Digest& other) const noexcept {
        return bytes > other.bytes;
    }

    bool operator>=(const Digest& other) const noexcept {
        return bytes >= other.bytes;
    }

    // 0x-prefixed lowercase hex, the form every artifact uses
    std::string to_hex() const {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(2 + DIGEST_BYTES * 2);
        result += "0x";
        for (uint8_t b : bytes) {
            result.push_back(hex_chars[b >> 4]);
            result.push_back(hex_chars[b & 0x0F]);
        }
        return result;
    }

    // Accepts 64 hex digits with or without a 0x prefix
    static std::optional<Digest> from_hex(std::string_view hex);

    // Raw bytes access
    constexpr const uint8_t* data() const noexcept { return bytes.data(); }
    constexpr uint8_t* data() noexcept { return bytes.data(); }
    static constexpr size_t size() noexcept { return DIGEST_BYTES; }

    constexpr bool is_zero() const noexcept {
        for (uint8_t b : bytes) if (b != 0) return false;
        return true;
    }
};

// Ordered sibling digests from a leaf up to the root
using Proof = std::vector<Digest>;

} // namespace merklegate
