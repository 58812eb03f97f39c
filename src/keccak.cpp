#include "keccak.hpp"
#include <cstring>

namespace {

constexpr size_t kRate = 136;

const uint64_t kRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

const int kRotations[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

const int kPiLane[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

uint64_t rotl(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

void keccak_f(uint64_t st[25]) {
    uint64_t bc[5];
    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ rotl(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) st[j + i] ^= t;
        }

        // Rho + Pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = kPiLane[i];
            uint64_t tmp = st[j];
            st[j] = rotl(t, kRotations[i]);
            t = tmp;
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) bc[i] = st[j + i];
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= kRoundConstants[round];
    }
}

void absorb_block(uint64_t st[25], const uint8_t* block) {
    for (size_t lane = 0; lane < kRate / 8; ++lane) {
        uint64_t v = 0;
        for (int b = 7; b >= 0; --b) {
            v = (v << 8) | block[lane * 8 + b];
        }
        st[lane] ^= v;
    }
    keccak_f(st);
}

} // namespace

Hash256 keccak256(const uint8_t* data, size_t len) {
    uint64_t st[25] = {0};

    while (len >= kRate) {
        absorb_block(st, data);
        data += kRate;
        len -= kRate;
    }

    uint8_t last[kRate];
    std::memset(last, 0, kRate);
    if (len > 0) std::memcpy(last, data, len);
    last[len] ^= 0x01;
    last[kRate - 1] ^= 0x80;
    absorb_block(st, last);

    Hash256 out;
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(st[i / 8] >> (8 * (i % 8)));
    }
    return out;
}

Hash256 keccak256(const std::string& data) {
    return keccak256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string to_hex(const Hash256& hash) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + hash.size() * 2);
    for (uint8_t b : hash) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0xf]);
    }
    return out;
}
