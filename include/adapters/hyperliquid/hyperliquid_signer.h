/**
 * @file hyperliquid_signer.h
 * @brief Hyperliquid L1 action signing (msgpack action hash, phantom agent, EIP-712).
 */

#pragma once

#include "core/crypto/keccak.h"
#include "core/crypto/secp256k1.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace tradegate::hyperliquid {

struct HlSignature {
    std::string r; // hex, lowercase, 0x-prefixed, 32 bytes
    std::string s; // hex, lowercase, 0x-prefixed, 32 bytes
    int v{27};     // 27 or 28
};

/**
 * @brief keccak256(msgpack(action) || nonce_be64 || 0x00) without a vault,
 *        keccak256(... || 0x01 || vault20) with one.
 * @throws InputError when the vault address is not 20 bytes of hex.
 */
crypto::Hash256 action_hash(const nlohmann::ordered_json& action,
                            const std::optional<std::string>& vault_address,
                            std::uint64_t nonce);

/// @throws InputError("invalid vault address") unless absent or 20 bytes of hex.
void validate_vault_address(const std::optional<std::string>& vault_address);

/// EIP-712 digest of the phantom agent {source: "a"|"b", connectionId: hash}.
crypto::Hash256 l1_signing_digest(const crypto::Hash256& connection_id, bool is_mainnet);

class IHyperliquidSigner {
public:
    virtual ~IHyperliquidSigner() = default;

    virtual HlSignature sign_l1_action(const nlohmann::ordered_json& action,
                                       const std::optional<std::string>& vault_address,
                                       std::uint64_t nonce,
                                       bool is_mainnet) const = 0;

    /// Lowercase 0x address of the signing key.
    virtual const std::string& address() const = 0;
};

class HyperliquidSigner final : public IHyperliquidSigner {
public:
    /// @throws InputError("invalid key format") / SigningError on unusable key text.
    explicit HyperliquidSigner(const std::string& private_key_text);

    HlSignature sign_l1_action(const nlohmann::ordered_json& action,
                               const std::optional<std::string>& vault_address,
                               std::uint64_t nonce,
                               bool is_mainnet) const override;

    const std::string& address() const override { return key_.address(); }

private:
    crypto::Secp256k1Signer key_;
};

} // namespace tradegate::hyperliquid
