/**
 * @file solana_keypair.h
 * @brief Ed25519 wallet keypair decoded from user-supplied key text.
 */

#pragma once

#include "core/crypto/ed25519.h"
#include "core/util/encoding.h"

#include <string>
#include <string_view>

namespace tradegate::solana {

/**
 * @class SolanaKeypair
 * @brief Holds the 32-byte seed and derived public key.
 *
 * Accepted key text: hex, base58 or a JSON byte array encoding either the
 * 32-byte seed or the 64-byte seed||pubkey secret key (the pubkey half must
 * match the seed).
 */
class SolanaKeypair {
public:
    /// @throws InputError("invalid key format") if no encoding yields a valid key.
    static SolanaKeypair from_text(std::string_view key_text);

    explicit SolanaKeypair(util::Bytes seed);

    const crypto::Ed25519PublicKey& public_key() const { return public_key_; }
    std::string address() const;

    crypto::Ed25519Signature sign(const std::uint8_t* message, std::size_t len) const;

private:
    util::Bytes seed_;
    crypto::Ed25519PublicKey public_key_{};
};

} // namespace tradegate::solana
