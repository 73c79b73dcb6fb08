/**
 * @file ed25519.cpp
 */

#include "core/crypto/ed25519.h"
#include "core/errors.h"

#include <openssl/evp.h>
#include <memory>

namespace tradegate::crypto {

namespace {

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct MdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr load_private(const std::vector<std::uint8_t>& seed) {
    if (seed.size() != 32) throw SigningError("ed25519 seed must be 32 bytes");
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) throw SigningError("ed25519 key import failed");
    return key;
}

} // namespace

Ed25519PublicKey ed25519_public_key(const std::vector<std::uint8_t>& seed) {
    auto key = load_private(seed);
    Ed25519PublicKey out{};
    std::size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), out.data(), &len) != 1 || len != out.size()) {
        throw SigningError("ed25519 public key export failed");
    }
    return out;
}

Ed25519Signature ed25519_sign(const std::vector<std::uint8_t>& seed,
                              const std::uint8_t* message, std::size_t len) {
    auto key = load_private(seed);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) throw SigningError("EVP_MD_CTX_new failed");
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        throw SigningError("ed25519 sign init failed");
    }
    Ed25519Signature sig{};
    std::size_t sig_len = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message, len) != 1 || sig_len != sig.size()) {
        throw SigningError("ed25519 signing failed");
    }
    return sig;
}

bool ed25519_verify(const Ed25519PublicKey& public_key,
                    const std::uint8_t* message, std::size_t len,
                    const Ed25519Signature& signature) {
    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
    if (!key) return false;
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return false;
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) return false;
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message, len) == 1;
}

} // namespace tradegate::crypto
