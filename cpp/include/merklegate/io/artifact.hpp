// =============================================================================
// artifact.hpp - Root/proof artifact serialization
// =============================================================================
// Two JSON layouts are produced from a CommitmentReport:
//
//   MERKLE  { "root", "leaves": [...], "proofs": { address: [...] } }
//   VOTERS  { "merkleRoot", "totalVoters", "voterProofs": [...], "generatedAt" }
//
// Writes go to "<path>.tmp" first and are renamed into place, so a failed run
// never leaves a truncated artifact behind.
// =============================================================================

#pragma once

#include "merklegate/commitment.hpp"
#include "merklegate/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace merklegate {
namespace io {

enum class ArtifactFormat {
    MERKLE,
    VOTERS
};

// "merkle" / "voters"; throws InvalidArgumentError otherwise
ArtifactFormat parse_artifact_format(const std::string& name);
const char* artifact_format_name(ArtifactFormat format) noexcept;

struct ArtifactOptions {
    ArtifactFormat format = ArtifactFormat::MERKLE;
    // Also write merkleRoot.txt and proofs/<address>.json beside the artifact
    bool split_proofs = false;
};

// MERKLE layout read back for proof lookups
struct MerkleArtifact {
    Digest root;
    std::vector<Digest> leaves;
    std::vector<std::pair<std::string, Proof>> proofs;   // address text -> proof

    // Case-insensitive address lookup; nullptr if absent
    const Proof* find_proof(std::string_view address) const;
};

std::string render_merkle_json(const CommitmentReport& report);

// generated_at: ISO-8601 UTC timestamp
std::string render_voters_json(const CommitmentReport& report, const std::string& generated_at);

std::string render_voter_proof_json(const CommitmentReport& report, size_t index);

/**
 * Serialize the report to `path`, creating parent directories.
 *
 * With split_proofs, proofs/ is rebuilt from scratch (stale files from an
 * earlier run are dropped) and merkleRoot.txt is rewritten. Companion files
 * land first and the main artifact last; if any step fails, everything this
 * call wrote is removed and IOError(WRITE_FAILED) is thrown.
 */
void write_artifact(const CommitmentReport& report, const std::filesystem::path& path,
                    const ArtifactOptions& options = {});

/**
 * Parse a MERKLE-layout artifact.
 * Throws IOError when unreadable and InputError(MALFORMED_ARTIFACT) when the
 * root, leaves or proofs section is missing or holds malformed digests.
 */
MerkleArtifact read_merkle_artifact(const std::filesystem::path& path);
MerkleArtifact parse_merkle_json(const std::string& content);

// Write `content` to `path` atomically (temp file + rename)
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Swap directory `to` for `from` (an empty `to` if `from` is absent).
// Throws IOError(WRITE_FAILED) if `to` exists and is not a directory.
void replace_directory(const std::filesystem::path& from, const std::filesystem::path& to);

std::string json_escape(std::string_view s);

std::string utc_timestamp_iso8601();

} // namespace io
} // namespace merklegate
