/**
 * @file solana_keypair.cpp
 */

#include "adapters/solana/solana_keypair.h"
#include "core/auth/key_decoder.h"
#include "core/errors.h"

#include <algorithm>

namespace tradegate::solana {

namespace {

bool is_valid_secret(const util::Bytes& bytes) {
    if (bytes.size() == 32) return true;
    if (bytes.size() != 64) return false;
    const util::Bytes seed(bytes.begin(), bytes.begin() + 32);
    try {
        const auto pub = crypto::ed25519_public_key(seed);
        return std::equal(pub.begin(), pub.end(), bytes.begin() + 32);
    } catch (const SigningError&) {
        return false;
    }
}

} // namespace

SolanaKeypair SolanaKeypair::from_text(std::string_view key_text) {
    auto bytes = auth::decode_private_key(key_text, is_valid_secret);
    bytes.resize(32);
    return SolanaKeypair(std::move(bytes));
}

SolanaKeypair::SolanaKeypair(util::Bytes seed) : seed_(std::move(seed)) {
    if (seed_.size() != 32) throw InputError("invalid key format");
    public_key_ = crypto::ed25519_public_key(seed_);
}

std::string SolanaKeypair::address() const {
    return util::base58_encode(public_key_.data(), public_key_.size());
}

crypto::Ed25519Signature SolanaKeypair::sign(const std::uint8_t* message, std::size_t len) const {
    return crypto::ed25519_sign(seed_, message, len);
}

} // namespace tradegate::solana
