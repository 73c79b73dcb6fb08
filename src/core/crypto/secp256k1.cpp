/**
 * @file secp256k1.cpp
 */

#include "core/crypto/secp256k1.h"
#include "core/errors.h"
#include "core/util/encoding.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <cstring>

namespace tradegate::crypto {

namespace {

struct BnDeleter { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
struct BnCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

BnPtr new_bn() {
    BnPtr bn(BN_new());
    if (!bn) throw SigningError("BN_new failed");
    return bn;
}

BnPtr bn_from_bytes(const std::uint8_t* data, std::size_t len) {
    BnPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) throw SigningError("BN_bin2bn failed");
    return bn;
}

void bn_to_32be(const BIGNUM* bn, std::uint8_t out[32]) {
    if (BN_bn2binpad(bn, out, 32) != 32) throw SigningError("scalar does not fit in 32 bytes");
}

GroupPtr new_group() {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) throw SigningError("secp256k1 curve unavailable");
    return group;
}

BnCtxPtr new_ctx() {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) throw SigningError("BN_CTX_new failed");
    return ctx;
}

std::vector<std::uint8_t> point_to_uncompressed(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
    std::vector<std::uint8_t> out(65, 0);
    const std::size_t n = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                             out.data(), out.size(), ctx);
    if (n != 65) throw SigningError("failed to serialize public key");
    return out;
}

} // namespace

struct Secp256k1Signer::Impl {
    GroupPtr group;
    BnPtr secret;
    BnPtr order;
    BnPtr half_order;
    std::vector<std::uint8_t> public_key;
    std::string address;
};

Secp256k1Signer::Secp256k1Signer(const std::vector<std::uint8_t>& secret)
    : impl_(std::make_unique<Impl>()) {
    if (secret.size() != 32) throw SigningError("secp256k1 secret must be 32 bytes");

    auto ctx = new_ctx();
    impl_->group = new_group();
    impl_->order = new_bn();
    if (EC_GROUP_get_order(impl_->group.get(), impl_->order.get(), ctx.get()) != 1) {
        throw SigningError("EC_GROUP_get_order failed");
    }
    impl_->half_order = new_bn();
    BN_rshift1(impl_->half_order.get(), impl_->order.get());

    impl_->secret = bn_from_bytes(secret.data(), secret.size());
    if (BN_is_zero(impl_->secret.get()) || BN_cmp(impl_->secret.get(), impl_->order.get()) >= 0) {
        throw SigningError("secp256k1 secret out of range");
    }

    PointPtr pub(EC_POINT_new(impl_->group.get()));
    if (!pub || EC_POINT_mul(impl_->group.get(), pub.get(), impl_->secret.get(), nullptr, nullptr, ctx.get()) != 1) {
        throw SigningError("public key derivation failed");
    }
    impl_->public_key = point_to_uncompressed(impl_->group.get(), pub.get(), ctx.get());
    impl_->address = eth_address_from_public_key(impl_->public_key);
}

Secp256k1Signer::~Secp256k1Signer() = default;
Secp256k1Signer::Secp256k1Signer(Secp256k1Signer&&) noexcept = default;
Secp256k1Signer& Secp256k1Signer::operator=(Secp256k1Signer&&) noexcept = default;

const std::string& Secp256k1Signer::address() const noexcept { return impl_->address; }

const std::vector<std::uint8_t>& Secp256k1Signer::public_key() const noexcept { return impl_->public_key; }

RecoverableSignature Secp256k1Signer::sign_digest(const Hash256& digest) const {
    const EC_GROUP* group = impl_->group.get();
    const BIGNUM* n = impl_->order.get();
    auto ctx = new_ctx();

    auto z = bn_from_bytes(digest.data(), digest.size());
    auto k = new_bn();
    auto rx = new_bn();
    auto ry = new_bn();
    auto r = new_bn();
    auto s = new_bn();
    auto tmp = new_bn();
    PointPtr point(EC_POINT_new(group));
    if (!point) throw SigningError("EC_POINT_new failed");

    for (int attempt = 0; attempt < 64; ++attempt) {
        if (BN_priv_rand_range(k.get(), n) != 1) throw SigningError("nonce generation failed");
        if (BN_is_zero(k.get())) continue;

        if (EC_POINT_mul(group, point.get(), k.get(), nullptr, nullptr, ctx.get()) != 1 ||
            EC_POINT_get_affine_coordinates(group, point.get(), rx.get(), ry.get(), ctx.get()) != 1) {
            throw SigningError("nonce point computation failed");
        }
        if (BN_nnmod(r.get(), rx.get(), n, ctx.get()) != 1) throw SigningError("BN_nnmod failed");
        if (BN_is_zero(r.get())) continue;

        BnPtr k_inv(BN_mod_inverse(nullptr, k.get(), n, ctx.get()));
        if (!k_inv) throw SigningError("nonce inversion failed");

        // s = k^-1 * (z + r * d) mod n
        if (BN_mod_mul(tmp.get(), r.get(), impl_->secret.get(), n, ctx.get()) != 1 ||
            BN_mod_add(tmp.get(), tmp.get(), z.get(), n, ctx.get()) != 1 ||
            BN_mod_mul(s.get(), k_inv.get(), tmp.get(), n, ctx.get()) != 1) {
            throw SigningError("signature arithmetic failed");
        }
        if (BN_is_zero(s.get())) continue;

        std::uint8_t recid = BN_is_odd(ry.get()) ? 1 : 0;
        if (BN_cmp(rx.get(), n) >= 0) recid |= 2;

        if (BN_cmp(s.get(), impl_->half_order.get()) > 0) {
            if (BN_sub(s.get(), n, s.get()) != 1) throw SigningError("low-s normalization failed");
            recid ^= 1;
        }

        RecoverableSignature sig;
        bn_to_32be(r.get(), sig.r.data());
        bn_to_32be(s.get(), sig.s.data());
        sig.recovery_id = recid;
        return sig;
    }
    throw SigningError("could not produce a valid signature");
}

std::string eth_address_from_public_key(const std::vector<std::uint8_t>& uncompressed) {
    if (uncompressed.size() != 65 || uncompressed[0] != 0x04) {
        throw SigningError("expected 65-byte uncompressed public key");
    }
    std::uint8_t hash[32];
    keccak_256(uncompressed.data() + 1, 64, hash);
    return util::hex_encode(hash + 12, 20, true);
}

std::string recover_eth_address(const Hash256& digest, const RecoverableSignature& sig) {
    if (sig.recovery_id > 3) throw SigningError("recovery id out of range");

    auto group = new_group();
    auto ctx = new_ctx();
    auto n = new_bn();
    auto p = new_bn();
    auto a = new_bn();
    auto b = new_bn();
    if (EC_GROUP_get_order(group.get(), n.get(), ctx.get()) != 1 ||
        EC_GROUP_get_curve(group.get(), p.get(), a.get(), b.get(), ctx.get()) != 1) {
        throw SigningError("curve parameters unavailable");
    }

    auto r = bn_from_bytes(sig.r.data(), sig.r.size());
    auto s = bn_from_bytes(sig.s.data(), sig.s.size());
    if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
        BN_cmp(r.get(), n.get()) >= 0 || BN_cmp(s.get(), n.get()) >= 0) {
        throw SigningError("signature scalars out of range");
    }

    auto x = new_bn();
    if (!BN_copy(x.get(), r.get())) throw SigningError("BN_copy failed");
    if (sig.recovery_id & 2) {
        if (BN_add(x.get(), x.get(), n.get()) != 1) throw SigningError("BN_add failed");
    }
    if (BN_cmp(x.get(), p.get()) >= 0) throw SigningError("recovered x outside field");

    PointPtr big_r(EC_POINT_new(group.get()));
    if (!big_r || EC_POINT_set_compressed_coordinates(group.get(), big_r.get(), x.get(),
                                                      sig.recovery_id & 1, ctx.get()) != 1) {
        throw SigningError("signature R is not on the curve");
    }

    // Q = r^-1 * (s*R - z*G) = (-z * r^-1)*G + (s * r^-1)*R
    auto z = bn_from_bytes(digest.data(), digest.size());
    if (BN_nnmod(z.get(), z.get(), n.get(), ctx.get()) != 1) throw SigningError("BN_nnmod failed");
    BnPtr r_inv(BN_mod_inverse(nullptr, r.get(), n.get(), ctx.get()));
    if (!r_inv) throw SigningError("r inversion failed");

    auto u1 = new_bn();
    auto u2 = new_bn();
    auto neg_z = new_bn();
    if (BN_mod_sub(neg_z.get(), n.get(), z.get(), n.get(), ctx.get()) != 1 ||
        BN_mod_mul(u1.get(), neg_z.get(), r_inv.get(), n.get(), ctx.get()) != 1 ||
        BN_mod_mul(u2.get(), s.get(), r_inv.get(), n.get(), ctx.get()) != 1) {
        throw SigningError("recovery arithmetic failed");
    }

    PointPtr q(EC_POINT_new(group.get()));
    if (!q || EC_POINT_mul(group.get(), q.get(), u1.get(), big_r.get(), u2.get(), ctx.get()) != 1) {
        throw SigningError("public key recovery failed");
    }
    if (EC_POINT_is_at_infinity(group.get(), q.get())) throw SigningError("recovered point at infinity");

    return eth_address_from_public_key(point_to_uncompressed(group.get(), q.get(), ctx.get()));
}

} // namespace tradegate::crypto
