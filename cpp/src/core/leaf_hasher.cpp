#include "merklegate/leaf_hasher.hpp"
#include "merklegate/error.hpp"
#include "merklegate/keccak.hpp"
#include "merklegate/logging.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <thread>

namespace merklegate {

Digest hash_leaf(const Address& address) noexcept {
    const auto& raw = address.bytes();
    return Keccak256Hasher::hash(std::span<const uint8_t>(raw.data(), raw.size()));
}

size_t effective_hash_threads(size_t requested, size_t leaf_count) noexcept {
    size_t threads = requested;
    const size_t hw = std::thread::hardware_concurrency();
    if (hw > 0) threads = std::min(threads, hw);
    threads = std::min(threads, leaf_count);
    return std::max<size_t>(threads, 1);
}

std::vector<Digest> hash_leaves(const std::vector<Address>& addresses, size_t threads) {
    std::vector<Digest> leaves(addresses.size());
    threads = effective_hash_threads(threads, addresses.size());

    if (threads <= 1 || addresses.size() < PARALLEL_LEAF_THRESHOLD) {
        for (size_t i = 0; i < addresses.size(); ++i) {
            leaves[i] = hash_leaf(addresses[i]);
        }
        return leaves;
    }

    // Each worker owns a disjoint slice of the output, so no locking
    const size_t n = addresses.size();
    const size_t chunk_size = (n + threads - 1) / threads;
    std::vector<std::thread> workers;
    workers.reserve(threads);

    try {
        for (size_t t = 0; t < threads; ++t) {
            size_t t_start = t * chunk_size;
            size_t t_end = std::min(t_start + chunk_size, n);
            if (t_start >= t_end) break;
            workers.emplace_back([t_start, t_end, &addresses, &leaves]() {
                for (size_t i = t_start; i < t_end; ++i) {
                    leaves[i] = hash_leaf(addresses[i]);
                }
            });
        }
    } catch (const std::system_error& e) {
        for (auto& th : workers) th.join();
        throw MerklegateException(ErrorCode::INTERNAL_ERROR,
                                  "Cannot start leaf hashing thread " + std::to_string(workers.size() + 1) +
                                      " of " + std::to_string(threads),
                                  e.what(), "Lower --threads / MG_MAX_THREADS");
    }

    for (auto& th : workers) th.join();

    LOG_DEBUG("Hashed ", n, " leaves on ", workers.size(), " threads");
    return leaves;
}

} // namespace merklegate
