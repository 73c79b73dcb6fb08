/**
 * @file keccak.cpp
 */

#include "core/crypto/keccak.h"
#include <cstring>

namespace tradegate::crypto {

namespace {

constexpr std::size_t kRate = 136; // 1088-bit rate for a 256-bit digest

constexpr std::uint64_t kRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

constexpr int kRotations[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44,
};

constexpr int kPiLanes[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1,
};

inline std::uint64_t rotl64(std::uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

void keccakf(std::uint64_t st[25]) {
    std::uint64_t bc[5];
    for (int round = 0; round < 24; ++round) {
        // theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            const std::uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) st[j + i] ^= t;
        }

        // rho and pi
        std::uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            const int j = kPiLanes[i];
            const std::uint64_t tmp = st[j];
            st[j] = rotl64(t, kRotations[i]);
            t = tmp;
        }

        // chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) bc[i] = st[j + i];
            for (int i = 0; i < 5; ++i) st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
        }

        // iota
        st[0] ^= kRoundConstants[round];
    }
}

void absorb_block(std::uint64_t st[25], const std::uint8_t* block) {
    for (std::size_t i = 0; i < kRate / 8; ++i) {
        std::uint64_t lane = 0;
        for (int b = 0; b < 8; ++b) {
            lane |= static_cast<std::uint64_t>(block[i * 8 + b]) << (8 * b);
        }
        st[i] ^= lane;
    }
    keccakf(st);
}

} // namespace

void keccak_256(const std::uint8_t* data, std::size_t len, std::uint8_t out[32]) {
    std::uint64_t st[25] = {0};

    while (len >= kRate) {
        absorb_block(st, data);
        data += kRate;
        len -= kRate;
    }

    std::uint8_t last[kRate];
    std::memset(last, 0, sizeof(last));
    if (len > 0) std::memcpy(last, data, len);
    last[len] ^= 0x01;
    last[kRate - 1] ^= 0x80;
    absorb_block(st, last);

    for (int i = 0; i < 4; ++i) {
        for (int b = 0; b < 8; ++b) {
            out[i * 8 + b] = static_cast<std::uint8_t>(st[i] >> (8 * b));
        }
    }
}

} // namespace tradegate::crypto
