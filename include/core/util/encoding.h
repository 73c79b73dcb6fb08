/**
 * @file encoding.h
 * @brief Hex, base58 (Bitcoin alphabet) and base64 codecs for key material and wire blobs.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tradegate::util {

using Bytes = std::vector<std::uint8_t>;

std::string hex_encode(const std::uint8_t* data, std::size_t len, bool with_prefix = false);
inline std::string hex_encode(const Bytes& data, bool with_prefix = false) {
    return hex_encode(data.data(), data.size(), with_prefix);
}

// Accepts an optional "0x"/"0X" prefix; rejects odd length and non-hex characters.
std::optional<Bytes> hex_decode(std::string_view s);

std::string base58_encode(const std::uint8_t* data, std::size_t len);
inline std::string base58_encode(const Bytes& data) { return base58_encode(data.data(), data.size()); }
std::optional<Bytes> base58_decode(std::string_view s);

std::string base64_encode(const Bytes& data);
std::optional<Bytes> base64_decode(std::string_view s);

} // namespace tradegate::util
