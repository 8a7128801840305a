#include "merklegate/deduplicator.hpp"
#include "merklegate/logging.hpp"

namespace merklegate {

const char* to_string(RejectionReason reason) noexcept {
    switch (reason) {
        case RejectionReason::EMPTY:          return "empty";
        case RejectionReason::INVALID_FORMAT: return "invalid format";
        case RejectionReason::DUPLICATE:      return "duplicate";
    }
    return "unknown";
}

bool Deduplicator::offer(const RawRecord& record) {
    if (record.identifier.empty()) {
        rejections_.push_back({record.line_number, RejectionReason::EMPTY, ""});
        return false;
    }

    auto address = Address::parse(record.identifier);
    if (!address) {
        rejections_.push_back({record.line_number, RejectionReason::INVALID_FORMAT, record.identifier});
        return false;
    }

    if (!seen_.insert(*address).second) {
        LOG_DEBUG("Line ", record.line_number, ": duplicate ", address->checksummed());
        rejections_.push_back({record.line_number, RejectionReason::DUPLICATE, address->checksummed()});
        return false;
    }

    survivors_.push_back({std::move(*address), record.line_number, record.fields});
    return true;
}

} // namespace merklegate
