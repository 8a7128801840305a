#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace merklegate::util {

// Value of a single hex digit, or -1
int hex_nibble(char c) noexcept;

bool is_hex_string(std::string_view s) noexcept;

// Strip a leading "0x" / "0X" if present
std::string_view strip_hex_prefix(std::string_view s) noexcept;

// Lowercase hex, optionally 0x-prefixed
std::string hex_encode(const uint8_t* data, size_t size, bool prefix = true);

inline std::string hex_encode(const std::vector<uint8_t>& data, bool prefix = true) {
    return hex_encode(data.data(), data.size(), prefix);
}

// Strict decode: even length, hex digits only, optional 0x prefix.
// Returns std::nullopt on any malformed input.
std::optional<std::vector<uint8_t>> hex_decode(std::string_view hex);

// Whitespace trimming shared by the record parser and the CLI
std::string_view trim(std::string_view s) noexcept;

std::string to_lower(std::string_view s);

} // namespace merklegate::util
