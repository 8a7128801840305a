#pragma once

#include "merklegate/deduplicator.hpp"
#include "merklegate/merkle_tree.hpp"
#include "merklegate/record_parser.hpp"
#include "merklegate/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace merklegate {

enum class LeafOrder {
    INPUT,    // survivor order; the root depends on input order
    SORTED    // ascending leaf digest; the root depends only on the set
};

struct CommitmentOptions {
    LeafOrder leaf_order = LeafOrder::INPUT;
    size_t hash_threads = 1;
};

/**
 * Everything one build run produces. accepted[i], leaves[i] and proofs[i]
 * describe the same identifier.
 */
struct CommitmentReport {
    std::vector<AcceptedIdentifier> accepted;
    std::vector<RejectionRecord> rejections;
    std::vector<Digest> leaves;
    std::vector<Proof> proofs;
    Digest root;
    size_t height = 0;
    size_t lines_processed = 0;   // data lines, header excluded
    bool header_detected = false;
    LeafOrder leaf_order = LeafOrder::INPUT;

    // nullptr if the identifier is not committed
    const Proof* proof_for(const Address& address) const noexcept;
};

/**
 * Commitment pipeline: parse -> normalize/dedup -> hash leaves -> build tree
 * -> generate proofs -> self-verify every proof.
 *
 * Fatal conditions throw and nothing is returned:
 *   - InputError(EMPTY_INPUT)            blank input
 *   - InputError(NO_VALID_IDENTIFIERS)   nothing survived normalization/dedup
 *   - VerificationError                  a generated proof failed to verify
 *   - IOError                            (build_from_file) unreadable source
 *
 * No console output; callers decide how to present the report.
 */
class CommitmentBuilder {
public:
    explicit CommitmentBuilder(CommitmentOptions options = {}) : options_(options) {}

    CommitmentReport build(std::string_view text, const RecordAdapter& adapter) const;

    CommitmentReport build_from_file(const std::filesystem::path& path,
                                     const RecordAdapter& adapter) const;

    const CommitmentOptions& options() const noexcept { return options_; }

private:
    CommitmentOptions options_;
};

// Whole file as text; IOError(FILE_NOT_FOUND / PERMISSION_DENIED) on failure
std::string read_text_file(const std::filesystem::path& path);

} // namespace merklegate
