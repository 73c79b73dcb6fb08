/**
 * @file ed25519.h
 * @brief Ed25519 signing via OpenSSL EVP (raw 32-byte seeds).
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tradegate::crypto {

using Ed25519Signature = std::array<std::uint8_t, 64>;
using Ed25519PublicKey = std::array<std::uint8_t, 32>;

/// @throws SigningError if the seed is not 32 bytes or OpenSSL rejects it.
Ed25519PublicKey ed25519_public_key(const std::vector<std::uint8_t>& seed);

/// @throws SigningError on any OpenSSL failure.
Ed25519Signature ed25519_sign(const std::vector<std::uint8_t>& seed,
                              const std::uint8_t* message, std::size_t len);

bool ed25519_verify(const Ed25519PublicKey& public_key,
                    const std::uint8_t* message, std::size_t len,
                    const Ed25519Signature& signature);

} // namespace tradegate::crypto
