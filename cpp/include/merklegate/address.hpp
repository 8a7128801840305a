#pragma once

#include "merklegate/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace merklegate {

/**
 * Validated 20-byte account identifier.
 *
 * The only way to obtain an Address is through parse() / parse_strict(), so a
 * value of this type never holds a malformed identifier. Validation happens
 * once, here; later pipeline stages trust the type.
 *
 * Accepted text: the literal prefix "0x" followed by exactly 40 hex digits,
 * any letter case. Surrounding whitespace is ignored.
 */
class Address {
public:
    static constexpr size_t HEX_DIGITS = ADDRESS_BYTES * 2;

    /**
     * Validate and canonicalize.
     * @return std::nullopt if the token is not "0x" + 40 hex digits
     */
    static std::optional<Address> parse(std::string_view text);

    /**
     * Like parse(), but a mixed-case token must also carry the correct
     * checksum case pattern. All-lowercase and all-uppercase tokens carry no
     * checksum and are accepted.
     */
    static std::optional<Address> parse_strict(std::string_view text);

    /**
     * Checksum case mask over 40 lowercase hex digits (no prefix).
     * Letter i is upper-cased iff nibble i of keccak256(digits) is >= 8.
     * @return the 40 digits with checksum casing applied, no prefix
     */
    static std::string checksum(std::string_view lowercase_hex40);

    const AddressBytes& bytes() const noexcept { return bytes_; }

    // "0x" + checksummed digits, the canonical text form
    const std::string& checksummed() const noexcept { return checksummed_; }

    // "0x" + lowercase digits
    std::string lowercase() const;

    bool operator==(const Address& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Address& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const Address& other) const noexcept { return bytes_ < other.bytes_; }

private:
    Address(const AddressBytes& bytes, std::string checksummed)
        : bytes_(bytes), checksummed_(std::move(checksummed)) {}

    AddressBytes bytes_;
    std::string checksummed_;
};

struct AddressHash {
    size_t operator()(const Address& a) const noexcept;
};

} // namespace merklegate
