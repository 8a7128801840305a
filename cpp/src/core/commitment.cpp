#include "merklegate/commitment.hpp"
#include "merklegate/error.hpp"
#include "merklegate/leaf_hasher.hpp"
#include "merklegate/logging.hpp"

#include <algorithm>
#include <fstream>
#include <numeric>
#include <sstream>
#include <string>
#include <system_error>

namespace merklegate {

const Proof* CommitmentReport::proof_for(const Address& address) const noexcept {
    for (size_t i = 0; i < accepted.size(); ++i) {
        if (accepted[i].address == address) return &proofs[i];
    }
    return nullptr;
}

std::string read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Input file not found: " + path.string(),
                      "read_text_file", "Check the --input path");
    }
    if (std::filesystem::is_directory(path, ec)) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Input path is a directory: " + path.string(),
                      "read_text_file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError(ErrorCode::PERMISSION_DENIED, "Cannot open input file: " + path.string(),
                      "read_text_file", "Check file permissions");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw IOError(ErrorCode::PERMISSION_DENIED, "Failed reading input file: " + path.string(),
                      "read_text_file");
    }
    return buffer.str();
}

CommitmentReport CommitmentBuilder::build(std::string_view text, const RecordAdapter& adapter) const {
    ParsedInput parsed = adapter.parse(text);

    Deduplicator dedup;
    dedup.offer_all(parsed.records);

    CommitmentReport report;
    report.header_detected = parsed.header_detected;
    report.lines_processed = parsed.records.size();
    report.leaf_order = options_.leaf_order;
    report.rejections = dedup.take_rejections();
    report.accepted = dedup.take_survivors();

    LOG_DEBUG("Parsed ", report.lines_processed, " records: ", report.accepted.size(),
              " accepted, ", report.rejections.size(), " rejected");

    if (report.accepted.empty()) {
        throw InputError(ErrorCode::NO_VALID_IDENTIFIERS,
                         "No valid identifiers found in input",
                         std::to_string(report.rejections.size()) + " line(s) rejected",
                         "Each data line must start with 0x followed by 40 hex digits");
    }

    std::vector<Address> addresses;
    addresses.reserve(report.accepted.size());
    for (const auto& a : report.accepted) addresses.push_back(a.address);

    std::vector<Digest> leaves = hash_leaves(addresses, options_.hash_threads);

    if (options_.leaf_order == LeafOrder::SORTED) {
        std::vector<size_t> order(leaves.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&leaves](size_t a, size_t b) { return leaves[a] < leaves[b]; });

        std::vector<AcceptedIdentifier> accepted_sorted;
        std::vector<Digest> leaves_sorted;
        accepted_sorted.reserve(order.size());
        leaves_sorted.reserve(order.size());
        for (size_t i : order) {
            accepted_sorted.push_back(std::move(report.accepted[i]));
            leaves_sorted.push_back(leaves[i]);
        }
        report.accepted = std::move(accepted_sorted);
        leaves = std::move(leaves_sorted);
    }

    MerkleTree tree = MerkleTree::build(leaves);

    if (auto bad = tree.verify_all()) {
        throw VerificationError(
            "Generated proof failed self-verification",
            "leaf " + std::to_string(*bad) + " (" + report.accepted[*bad].address.checksummed() +
                ", line " + std::to_string(report.accepted[*bad].line_number) + ")",
            "Builder and verifier disagree; this is an implementation defect");
    }

    report.proofs.reserve(tree.leaf_count());
    for (size_t i = 0; i < tree.leaf_count(); ++i) {
        report.proofs.push_back(tree.proof(i));
    }

    report.leaves = std::move(leaves);
    report.root = tree.root();
    report.height = tree.height();
    return report;
}

CommitmentReport CommitmentBuilder::build_from_file(const std::filesystem::path& path,
                                                    const RecordAdapter& adapter) const {
    std::string text = read_text_file(path);
    return build(text, adapter);
}

} // namespace merklegate
