#include "merklegate/address.hpp"
#include "merklegate/keccak.hpp"
#include "merklegate/util/hex.hpp"

#include <cctype>
#include <cstring>

namespace merklegate {

namespace {

// Lowercased 40 digits if the token has the exact "0x" + 40 hex shape
std::optional<std::string> canonical_digits(std::string_view text) {
    text = util::trim(text);
    if (text.size() != 2 + Address::HEX_DIGITS) return std::nullopt;
    if (text[0] != '0' || text[1] != 'x') return std::nullopt;

    std::string_view digits = text.substr(2);
    if (!util::is_hex_string(digits)) return std::nullopt;
    return util::to_lower(digits);
}

bool has_mixed_case(std::string_view digits) {
    bool upper = false;
    bool lower = false;
    for (char c : digits) {
        if (c >= 'A' && c <= 'F') upper = true;
        if (c >= 'a' && c <= 'f') lower = true;
    }
    return upper && lower;
}

} // anonymous namespace

std::string Address::checksum(std::string_view lowercase_hex40) {
    Digest h = Keccak256Hasher::hash(lowercase_hex40);

    std::string out(lowercase_hex40);
    for (size_t i = 0; i < out.size(); ++i) {
        uint8_t byte = h.bytes[i / 2];
        uint8_t nibble = (i % 2 == 0) ? (byte >> 4) : (byte & 0x0F);
        if (nibble >= 8 && out[i] >= 'a' && out[i] <= 'f') {
            out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i])));
        }
    }
    return out;
}

std::optional<Address> Address::parse(std::string_view text) {
    auto digits = canonical_digits(text);
    if (!digits) return std::nullopt;

    auto raw = util::hex_decode(*digits);
    if (!raw || raw->size() != ADDRESS_BYTES) return std::nullopt;

    AddressBytes bytes;
    std::memcpy(bytes.data(), raw->data(), ADDRESS_BYTES);
    return Address(bytes, "0x" + checksum(*digits));
}

std::optional<Address> Address::parse_strict(std::string_view text) {
    auto addr = parse(text);
    if (!addr) return std::nullopt;

    std::string_view digits = util::trim(text).substr(2);
    if (has_mixed_case(digits) && digits != std::string_view(addr->checksummed()).substr(2)) {
        return std::nullopt;
    }
    return addr;
}

std::string Address::lowercase() const {
    return util::hex_encode(bytes_.data(), bytes_.size(), true);
}

size_t AddressHash::operator()(const Address& a) const noexcept {
    // Leading identifier bytes
    size_t h;
    std::memcpy(&h, a.bytes().data(), sizeof(h));
    return h;
}

} // namespace merklegate
