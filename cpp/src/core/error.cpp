#include "merklegate/error.hpp"

namespace merklegate {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:                   return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:          return "INVALID_ARGUMENT";
        case ErrorCode::NOT_IMPLEMENTED:           return "NOT_IMPLEMENTED";
        case ErrorCode::EMPTY_INPUT:               return "EMPTY_INPUT";
        case ErrorCode::NO_VALID_IDENTIFIERS:      return "NO_VALID_IDENTIFIERS";
        case ErrorCode::MALFORMED_ARTIFACT:        return "MALFORMED_ARTIFACT";
        case ErrorCode::PROOF_VERIFICATION_FAILED: return "PROOF_VERIFICATION_FAILED";
        case ErrorCode::FILE_NOT_FOUND:            return "FILE_NOT_FOUND";
        case ErrorCode::PERMISSION_DENIED:         return "PERMISSION_DENIED";
        case ErrorCode::WRITE_FAILED:              return "WRITE_FAILED";
        case ErrorCode::INTERNAL_ERROR:            return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

} // namespace merklegate
