#pragma once

#include "merklegate/types.hpp"
#include <span>
#include <string_view>
#include <memory>

namespace merklegate {

/**
 * Keccak-256 hashing (original Keccak padding, as used by Ethereum)
 *
 * Used for:
 * 1. Leaf hashing: hash of the 20 raw identifier bytes
 * 2. Node hashing: hash of two sorted 32-byte child digests
 * 3. Identifier checksums: hash of the 40 lowercase hex digits
 *
 * This is NOT FIPS-202 SHA3-256: the padding domain byte is 0x01, not 0x06,
 * so digests differ from SHA3 for every input.
 */
class Keccak256Hasher {
public:
    /**
     * Hash arbitrary data
     * @param data Input bytes
     * @return 32-byte Keccak-256 digest
     */
    static Digest hash(std::span<const uint8_t> data) noexcept;

    /**
     * Hash a string (its bytes, no terminator)
     */
    static Digest hash(std::string_view str) noexcept;

    /**
     * Hash the concatenation a || b
     */
    static Digest hash_concat(const Digest& a, const Digest& b) noexcept;

    /**
     * Incremental hasher for streaming data
     */
    class Incremental {
    public:
        Incremental() noexcept;
        ~Incremental();

        Incremental(const Incremental&) = delete;
        Incremental& operator=(const Incremental&) = delete;
        Incremental(Incremental&&) noexcept;
        Incremental& operator=(Incremental&&) noexcept;

        void update(std::span<const uint8_t> data) noexcept;
        void update(std::string_view str) noexcept;
        Digest finalize() noexcept;
        void reset() noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
};

} // namespace merklegate
