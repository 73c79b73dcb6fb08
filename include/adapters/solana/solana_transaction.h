/**
 * @file solana_transaction.h
 * @brief Minimal wire-format view of a Solana transaction (legacy or v0) for signing.
 *
 * Wire layout: shortvec(num_signatures) | signatures[64] | message.
 * Message: [0x80|version] | header(3) | shortvec(num_keys) | keys[32] | ...
 * Only the parts needed to locate signer slots are decoded; the message
 * bytes are signed and re-emitted verbatim.
 */

#pragma once

#include "core/crypto/ed25519.h"
#include "core/util/encoding.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradegate::solana {

class SolanaKeypair;

// Solana "shortvec" (compact-u16) length prefix.
void encode_shortvec(std::uint16_t value, util::Bytes& out);
std::optional<std::uint16_t> decode_shortvec(const util::Bytes& in, std::size_t& offset);

class SolanaTransaction {
public:
    using PublicKey = std::array<std::uint8_t, 32>;

    /// @throws SigningError on truncated or inconsistent input.
    static SolanaTransaction parse(const util::Bytes& wire);

    util::Bytes serialize() const;

    bool versioned() const { return versioned_; }
    std::uint8_t num_required_signatures() const { return num_required_signatures_; }
    const std::vector<crypto::Ed25519Signature>& signatures() const { return signatures_; }
    const std::vector<PublicKey>& account_keys() const { return account_keys_; }
    const util::Bytes& message() const { return message_; }

    /// Slot of `key` among the required signers, if present.
    std::optional<std::size_t> signer_index(const PublicKey& key) const;

    /**
     * @brief Sign the message and place the signature in the keypair's slot.
     * @throws SigningError if the keypair is not a required signer.
     */
    void sign(const SolanaKeypair& keypair);

    /// base58 of the first signature; the transaction id once broadcast.
    std::string id() const;

private:
    bool versioned_{false};
    std::uint8_t num_required_signatures_{0};
    std::vector<crypto::Ed25519Signature> signatures_;
    std::vector<PublicKey> account_keys_;
    util::Bytes message_;
};

} // namespace tradegate::solana
