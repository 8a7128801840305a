#pragma once

#include "merklegate/address.hpp"
#include "merklegate/types.hpp"

#include <vector>

namespace merklegate {

// Batches smaller than this are hashed on the calling thread
inline constexpr size_t PARALLEL_LEAF_THRESHOLD = 4096;

/**
 * Leaf digest = keccak256 of the 20 raw identifier bytes (not the text form),
 * matching abi.encodePacked(address) on the verifying side.
 */
Digest hash_leaf(const Address& address) noexcept;

// Requested worker count clamped to [1, min(hardware threads, leaf_count)]
size_t effective_hash_threads(size_t requested, size_t leaf_count) noexcept;

/**
 * Hash a batch of identifiers. Output order equals input order.
 * @param threads requested worker count, clamped by effective_hash_threads();
 *                0 or 1 hashes on the calling thread
 * Throws MerklegateException(INTERNAL_ERROR) if a worker cannot be started.
 */
std::vector<Digest> hash_leaves(const std::vector<Address>& addresses, size_t threads = 1);

} // namespace merklegate
