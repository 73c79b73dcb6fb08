/**
 * @file keccak.h
 * @brief Keccak-256 (original padding, as used by Ethereum and EIP-712).
 *
 * OpenSSL's SHA3-256 uses the FIPS 202 padding byte (0x06) and yields a
 * different digest, so it cannot be used for EVM hashing.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tradegate::crypto {

using Hash256 = std::array<std::uint8_t, 32>;

void keccak_256(const std::uint8_t* data, std::size_t len, std::uint8_t out[32]);

inline Hash256 keccak_256(const std::vector<std::uint8_t>& data) {
    Hash256 out{};
    keccak_256(data.data(), data.size(), out.data());
    return out;
}

inline Hash256 keccak_256(std::string_view data) {
    Hash256 out{};
    keccak_256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size(), out.data());
    return out;
}

} // namespace tradegate::crypto
