/**
 * @file secp256k1.h
 * @brief Recoverable ECDSA over secp256k1 on top of OpenSSL's BN/EC primitives.
 *
 * Signatures are normalized to low-s and carry a recovery id so a verifier
 * can derive the signer's Ethereum address from (digest, r, s, v).
 */

#pragma once

#include "core/crypto/keccak.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tradegate::crypto {

struct RecoverableSignature {
    std::array<std::uint8_t, 32> r{};
    std::array<std::uint8_t, 32> s{};
    std::uint8_t recovery_id{0};   ///< 0..3

    int v() const { return 27 + recovery_id; }
};

class Secp256k1Signer {
public:
    /**
     * @brief Build a signer from a raw 32-byte secret.
     * @throws SigningError when the scalar is zero or not below the curve order.
     */
    explicit Secp256k1Signer(const std::vector<std::uint8_t>& secret);
    ~Secp256k1Signer();

    Secp256k1Signer(Secp256k1Signer&&) noexcept;
    Secp256k1Signer& operator=(Secp256k1Signer&&) noexcept;
    Secp256k1Signer(const Secp256k1Signer&) = delete;
    Secp256k1Signer& operator=(const Secp256k1Signer&) = delete;

    /// Sign a 32-byte digest. The digest is used as-is (no extra hashing).
    RecoverableSignature sign_digest(const Hash256& digest) const;

    /// Lowercase "0x"-prefixed address derived from the public key.
    const std::string& address() const noexcept;

    /// 65-byte uncompressed SEC1 public key (0x04 || X || Y).
    const std::vector<std::uint8_t>& public_key() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Ethereum address (lowercase, "0x"-prefixed) of an uncompressed SEC1 public key.
std::string eth_address_from_public_key(const std::vector<std::uint8_t>& uncompressed);

/**
 * @brief Recover the signer address from a digest and signature.
 * @throws SigningError when the signature does not describe a valid curve point.
 */
std::string recover_eth_address(const Hash256& digest, const RecoverableSignature& sig);

} // namespace tradegate::crypto
