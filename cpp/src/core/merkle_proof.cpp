#include "merklegate/merkle_proof.hpp"
#include "merklegate/merkle_tree.hpp"

namespace merklegate {

Digest compute_root(const Digest& leaf, const Proof& proof) noexcept {
    Digest current = leaf;
    for (const auto& sibling : proof) {
        current = hash_pair(current, sibling);
    }
    return current;
}

bool verify_proof(const Digest& leaf, const Proof& proof, const Digest& root) noexcept {
    return compute_root(leaf, proof) == root;
}

} // namespace merklegate
