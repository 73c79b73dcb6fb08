/**
 * @file solana_transaction.cpp
 */

#include "adapters/solana/solana_transaction.h"
#include "adapters/solana/solana_keypair.h"
#include "core/errors.h"

#include <algorithm>

namespace tradegate::solana {

void encode_shortvec(std::uint16_t value, util::Bytes& out) {
    std::uint32_t rem = value;
    for (;;) {
        std::uint8_t elem = rem & 0x7f;
        rem >>= 7;
        if (rem == 0) {
            out.push_back(elem);
            return;
        }
        out.push_back(static_cast<std::uint8_t>(elem | 0x80));
    }
}

std::optional<std::uint16_t> decode_shortvec(const util::Bytes& in, std::size_t& offset) {
    std::uint32_t value = 0;
    for (int i = 0; i < 3; ++i) {
        if (offset >= in.size()) return std::nullopt;
        const std::uint8_t byte = in[offset++];
        value |= static_cast<std::uint32_t>(byte & 0x7f) << (7 * i);
        if ((byte & 0x80) == 0) {
            if (value > 0xffff) return std::nullopt;
            return static_cast<std::uint16_t>(value);
        }
    }
    return std::nullopt;
}

SolanaTransaction SolanaTransaction::parse(const util::Bytes& wire) {
    SolanaTransaction tx;
    std::size_t offset = 0;
    const auto num_sigs = decode_shortvec(wire, offset);
    if (!num_sigs) throw SigningError("transaction: bad signature count");
    if (wire.size() < offset + static_cast<std::size_t>(*num_sigs) * 64) {
        throw SigningError("transaction: truncated signatures");
    }
    tx.signatures_.resize(*num_sigs);
    for (auto& sig : tx.signatures_) {
        std::copy_n(wire.begin() + static_cast<std::ptrdiff_t>(offset), 64, sig.begin());
        offset += 64;
    }
    tx.message_.assign(wire.begin() + static_cast<std::ptrdiff_t>(offset), wire.end());

    std::size_t m = 0;
    const auto& msg = tx.message_;
    if (msg.empty()) throw SigningError("transaction: empty message");
    if (msg[0] & 0x80) {
        if ((msg[0] & 0x7f) != 0) {
            throw SigningError("transaction: unsupported message version " + std::to_string(msg[0] & 0x7f));
        }
        tx.versioned_ = true;
        ++m;
    }
    if (msg.size() < m + 3) throw SigningError("transaction: truncated header");
    tx.num_required_signatures_ = msg[m];
    m += 3;
    const auto num_keys = decode_shortvec(msg, m);
    if (!num_keys || msg.size() < m + static_cast<std::size_t>(*num_keys) * 32) {
        throw SigningError("transaction: truncated account keys");
    }
    tx.account_keys_.resize(*num_keys);
    for (auto& key : tx.account_keys_) {
        std::copy_n(msg.begin() + static_cast<std::ptrdiff_t>(m), 32, key.begin());
        m += 32;
    }
    if (tx.num_required_signatures_ != tx.signatures_.size() ||
        tx.num_required_signatures_ > tx.account_keys_.size()) {
        throw SigningError("transaction: signature count does not match header");
    }
    return tx;
}

util::Bytes SolanaTransaction::serialize() const {
    util::Bytes out;
    out.reserve(3 + signatures_.size() * 64 + message_.size());
    encode_shortvec(static_cast<std::uint16_t>(signatures_.size()), out);
    for (const auto& sig : signatures_) out.insert(out.end(), sig.begin(), sig.end());
    out.insert(out.end(), message_.begin(), message_.end());
    return out;
}

std::optional<std::size_t> SolanaTransaction::signer_index(const PublicKey& key) const {
    for (std::size_t i = 0; i < num_required_signatures_; ++i) {
        if (account_keys_[i] == key) return i;
    }
    return std::nullopt;
}

void SolanaTransaction::sign(const SolanaKeypair& keypair) {
    const auto slot = signer_index(keypair.public_key());
    if (!slot) throw SigningError("wallet " + keypair.address() + " is not a required signer");
    signatures_[*slot] = keypair.sign(message_.data(), message_.size());
}

std::string SolanaTransaction::id() const {
    if (signatures_.empty()) return {};
    return util::base58_encode(signatures_[0].data(), signatures_[0].size());
}

} // namespace tradegate::solana
