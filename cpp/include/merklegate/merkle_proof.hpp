#pragma once

#include "merklegate/types.hpp"

namespace merklegate {

/**
 * Fold a leaf digest up through its proof with the sorted-pair rule and
 * compare against the expected root. No position information is needed.
 * An empty proof verifies iff leaf == root.
 */
bool verify_proof(const Digest& leaf, const Proof& proof, const Digest& root) noexcept;

// The root that `proof` implies for `leaf`
Digest compute_root(const Digest& leaf, const Proof& proof) noexcept;

} // namespace merklegate
