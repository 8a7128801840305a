#include "merklegate/merkle_tree.hpp"
#include "merklegate/merkle_proof.hpp"
#include "merklegate/keccak.hpp"
#include "merklegate/error.hpp"
#include "merklegate/logging.hpp"

#include <string>

namespace merklegate {

Digest hash_pair(const Digest& a, const Digest& b) noexcept {
    return (b < a) ? Keccak256Hasher::hash_concat(b, a)
                   : Keccak256Hasher::hash_concat(a, b);
}

MerkleTree MerkleTree::build(std::vector<Digest> leaves) {
    MERKLEGATE_CHECK_ARGUMENT(!leaves.empty(), "Cannot build a Merkle tree with no leaves");

    std::vector<std::vector<Digest>> levels;
    levels.push_back(std::move(leaves));

    while (levels.back().size() > 1) {
        const auto& current = levels.back();
        std::vector<Digest> next;
        next.reserve((current.size() + 1) / 2);

        for (size_t i = 0; i + 1 < current.size(); i += 2) {
            next.push_back(hash_pair(current[i], current[i + 1]));
        }
        if (current.size() % 2 == 1) {
            next.push_back(current.back());
        }

        levels.push_back(std::move(next));
    }

    LOG_DEBUG("Built tree: ", levels.front().size(), " leaves, height ", levels.size() - 1);
    return MerkleTree(std::move(levels));
}

MerkleNode MerkleTree::node(size_t level, size_t index) const {
    MERKLEGATE_CHECK_ARGUMENT(level < levels_.size(),
                              "Level " + std::to_string(level) + " outside tree of height " +
                              std::to_string(height()));
    MERKLEGATE_CHECK_ARGUMENT(index < levels_[level].size(),
                              "Index " + std::to_string(index) + " outside level " +
                              std::to_string(level));

    MerkleNode n;
    n.digest = levels_[level][index];
    n.level = level;
    n.index = index;

    if (level > 0) {
        size_t left = index * 2;
        size_t below = levels_[level - 1].size();
        if (left + 1 < below) {
            n.children = std::make_pair(left, left + 1);
        } else {
            n.carried = true;
        }
    }
    return n;
}

std::optional<size_t> MerkleTree::index_of(const Digest& leaf) const noexcept {
    const auto& base = levels_.front();
    for (size_t i = 0; i < base.size(); ++i) {
        if (base[i] == leaf) return i;
    }
    return std::nullopt;
}

Proof MerkleTree::proof(size_t index) const {
    MERKLEGATE_CHECK_ARGUMENT(index < leaf_count(),
                              "Leaf index " + std::to_string(index) + " out of range (" +
                              std::to_string(leaf_count()) + " leaves)");

    Proof path;
    path.reserve(height());

    size_t pos = index;
    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& current = levels_[level];
        size_t sibling = pos ^ 1;
        if (sibling < current.size()) {
            path.push_back(current[sibling]);
        }
        // A carried node has no sibling and keeps its digest; pos/2 still locates it
        pos /= 2;
    }
    return path;
}

std::optional<size_t> MerkleTree::verify_all() const {
    for (size_t i = 0; i < leaf_count(); ++i) {
        if (!verify_proof(levels_.front()[i], proof(i), root())) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace merklegate
