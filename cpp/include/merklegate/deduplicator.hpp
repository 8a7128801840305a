#pragma once

#include "merklegate/address.hpp"
#include "merklegate/record_parser.hpp"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace merklegate {

enum class RejectionReason {
    EMPTY,
    INVALID_FORMAT,
    DUPLICATE
};

// "empty", "invalid format", "duplicate"
const char* to_string(RejectionReason reason) noexcept;

struct RejectionRecord {
    size_t line_number = 0;
    RejectionReason reason = RejectionReason::INVALID_FORMAT;
    std::string detail;     // offending token, or canonical address for duplicates
};

struct AcceptedIdentifier {
    Address address;
    size_t line_number;
    std::vector<std::string> fields;
};

/**
 * Normalizes each candidate record and keeps the first occurrence of every
 * identifier. Identity is the 20 raw bytes, so letter case never creates a
 * second leaf. Survivors stay in first-acceptance order.
 */
class Deduplicator {
public:
    // true if accepted; otherwise a RejectionRecord is appended
    bool offer(const RawRecord& record);

    void offer_all(const std::vector<RawRecord>& records) {
        for (const auto& r : records) offer(r);
    }

    const std::vector<AcceptedIdentifier>& survivors() const noexcept { return survivors_; }
    const std::vector<RejectionRecord>& rejections() const noexcept { return rejections_; }

    std::vector<AcceptedIdentifier> take_survivors() { return std::move(survivors_); }
    std::vector<RejectionRecord> take_rejections() { return std::move(rejections_); }

private:
    std::unordered_set<Address, AddressHash> seen_;
    std::vector<AcceptedIdentifier> survivors_;
    std::vector<RejectionRecord> rejections_;
};

} // namespace merklegate
