#pragma once

#include "merklegate/types.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace merklegate {

/**
 * Parent digest under the sorted-pair rule:
 *   keccak256(min(a, b) || max(a, b))
 * with byte-lexicographic ordering. hash_pair(a, b) == hash_pair(b, a).
 */
Digest hash_pair(const Digest& a, const Digest& b) noexcept;

// View of one position in the level history
struct MerkleNode {
    Digest digest;
    size_t level = 0;      // 0 = leaves
    size_t index = 0;      // position within the level
    // Positions (in level - 1) of the two children; empty for leaves and carried nodes
    std::optional<std::pair<size_t, size_t>> children;
    bool carried = false;  // unpaired node promoted unchanged from level - 1
};

/**
 * Binary Merkle tree over an ordered leaf sequence.
 *
 * Levels are built bottom-up by pairing consecutive digests. An odd trailing
 * digest is carried into the next level unchanged (never duplicated). Every
 * level is retained so proofs can be read off without rehashing.
 *
 * The root depends on leaf order: pairing is positional even though each
 * pair hash is order-independent. Sort the leaves first when only the set
 * should matter.
 */
class MerkleTree {
public:
    // Throws InvalidArgumentError on an empty leaf sequence
    static MerkleTree build(std::vector<Digest> leaves);

    const Digest& root() const noexcept { return levels_.back().front(); }

    // ceil(log2(leaf_count)); 0 for a single leaf
    size_t height() const noexcept { return levels_.size() - 1; }

    size_t leaf_count() const noexcept { return levels_.front().size(); }
    const std::vector<Digest>& leaves() const noexcept { return levels_.front(); }
    const std::vector<std::vector<Digest>>& levels() const noexcept { return levels_; }

    // Throws InvalidArgumentError if (level, index) is outside the tree
    MerkleNode node(size_t level, size_t index) const;

    // First leaf position holding this digest
    std::optional<size_t> index_of(const Digest& leaf) const noexcept;

    /**
     * Sibling digests from leaf `index` to the root, lowest level first.
     * Levels where the node is carried contribute nothing, so the proof can
     * be shorter than height().
     */
    Proof proof(size_t index) const;

    // Index of the first leaf whose proof does not verify, if any
    std::optional<size_t> verify_all() const;

private:
    explicit MerkleTree(std::vector<std::vector<Digest>> levels)
        : levels_(std::move(levels)) {}

    std::vector<std::vector<Digest>> levels_;
};

} // namespace merklegate
