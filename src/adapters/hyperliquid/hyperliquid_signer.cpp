/**
 * @file hyperliquid_signer.cpp
 */

#include "adapters/hyperliquid/hyperliquid_signer.h"
#include "core/auth/key_decoder.h"
#include "core/errors.h"
#include "core/util/encoding.h"

#include <spdlog/spdlog.h>
#include <cstring>

namespace tradegate::hyperliquid {

namespace {

using util::Bytes;

void append(Bytes& out, const std::uint8_t* data, std::size_t len) {
    out.insert(out.end(), data, data + len);
}

void append(Bytes& out, const crypto::Hash256& h) {
    append(out, h.data(), h.size());
}

// uint256 big-endian word
void append_uint256(Bytes& out, std::uint64_t value) {
    std::uint8_t word[32] = {0};
    for (int i = 0; i < 8; ++i) {
        word[31 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
    append(out, word, sizeof(word));
}

const crypto::Hash256& domain_separator() {
    static const crypto::Hash256 sep = [] {
        Bytes enc;
        append(enc, crypto::keccak_256(std::string_view(
            "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)")));
        append(enc, crypto::keccak_256(std::string_view("Exchange")));
        append(enc, crypto::keccak_256(std::string_view("1")));
        append_uint256(enc, 1337);
        append_uint256(enc, 0); // verifyingContract = address(0)
        return crypto::keccak_256(enc);
    }();
    return sep;
}

Bytes vault_bytes(const std::string& vault_address) {
    auto bytes = util::hex_decode(vault_address);
    if (!bytes || bytes->size() != 20) {
        throw InputError("invalid vault address");
    }
    return std::move(*bytes);
}

} // namespace

void validate_vault_address(const std::optional<std::string>& vault_address) {
    if (vault_address) vault_bytes(*vault_address);
}

crypto::Hash256 action_hash(const nlohmann::ordered_json& action,
                            const std::optional<std::string>& vault_address,
                            std::uint64_t nonce) {
    Bytes data = nlohmann::ordered_json::to_msgpack(action);
    for (int i = 7; i >= 0; --i) {
        data.push_back(static_cast<std::uint8_t>(nonce >> (8 * i)));
    }
    if (vault_address) {
        data.push_back(0x01);
        const auto vault = vault_bytes(*vault_address);
        append(data, vault.data(), vault.size());
    } else {
        data.push_back(0x00);
    }
    return crypto::keccak_256(data);
}

crypto::Hash256 l1_signing_digest(const crypto::Hash256& connection_id, bool is_mainnet) {
    Bytes agent;
    append(agent, crypto::keccak_256(std::string_view("Agent(string source,bytes32 connectionId)")));
    append(agent, crypto::keccak_256(std::string_view(is_mainnet ? "a" : "b")));
    append(agent, connection_id);
    const auto struct_hash = crypto::keccak_256(agent);

    Bytes msg = {0x19, 0x01};
    append(msg, domain_separator());
    append(msg, struct_hash);
    return crypto::keccak_256(msg);
}

HyperliquidSigner::HyperliquidSigner(const std::string& private_key_text)
    : key_(auth::decode_private_key(private_key_text,
                                    [](const Bytes& b) { return b.size() == 32; })) {}

HlSignature HyperliquidSigner::sign_l1_action(const nlohmann::ordered_json& action,
                                              const std::optional<std::string>& vault_address,
                                              std::uint64_t nonce,
                                              bool is_mainnet) const {
    const auto hash = action_hash(action, vault_address, nonce);
    const auto digest = l1_signing_digest(hash, is_mainnet);
    const auto sig = key_.sign_digest(digest);
    spdlog::debug("[HyperliquidSigner] signed nonce={} connectionId={}", nonce,
                  util::hex_encode(hash.data(), hash.size(), true));
    return HlSignature{
        .r = util::hex_encode(sig.r.data(), sig.r.size(), true),
        .s = util::hex_encode(sig.s.data(), sig.s.size(), true),
        .v = sig.v(),
    };
}

} // namespace tradegate::hyperliquid
