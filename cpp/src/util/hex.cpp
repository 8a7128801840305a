#include "merklegate/util/hex.hpp"
#include "merklegate/types.hpp"

#include <algorithm>
#include <cctype>

namespace merklegate::util {

int hex_nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

bool is_hex_string(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(), [](char c) { return hex_nibble(c) >= 0; });
}

std::string_view strip_hex_prefix(std::string_view s) noexcept {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }
    return s;
}

std::string hex_encode(const uint8_t* data, size_t size, bool prefix) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2 + (prefix ? 2 : 0));
    if (prefix) result += "0x";
    for (size_t i = 0; i < size; ++i) {
        result.push_back(hex_chars[data[i] >> 4]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::optional<std::vector<uint8_t>> hex_decode(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_nibble(hex[i]);
        int lo = hex_nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace merklegate::util

namespace merklegate {

std::optional<Digest> Digest::from_hex(std::string_view hex) {
    auto raw = util::hex_decode(hex);
    if (!raw || raw->size() != DIGEST_BYTES) return std::nullopt;
    return Digest(raw->data());
}

} // namespace merklegate
