// LUMENCRYPT - Keccak-256 Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Reference: The Keccak reference, version 3.0 (Bertoni, Daemen, Peeters,
// Van Assche). Lanes are loaded and stored little-endian.

#include "lumencrypt/crypto/keccak.h"
#include "lumencrypt/crypto/secure.h"
#include <cstring>

namespace lumencrypt {

// ============================================================================
// Keccak-f[1600] Constants
// ============================================================================

namespace {

/// Iota round constants
constexpr uint64_t ROUND_CONSTANTS[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

/// Rho rotation offsets, in pi traversal order
constexpr int RHO_OFFSETS[24] = {
    1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
    27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44
};

/// Pi lane permutation, in traversal order starting from lane 1
constexpr int PI_LANES[24] = {
    10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1
};

inline uint64_t ROTL64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

inline uint64_t ReadLE64(const Byte* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline void WriteLE64(Byte* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<Byte>(v >> (8 * i));
    }
}

} // anonymous namespace

namespace detail {

void KeccakF1600(uint64_t state[25]) {
    uint64_t bc[5];

    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = state[i] ^ state[i + 5] ^ state[i + 10] ^ state[i + 15] ^ state[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ ROTL64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                state[j + i] ^= t;
            }
        }

        // Rho and Pi
        uint64_t carry = state[1];
        for (int i = 0; i < 24; ++i) {
            int lane = PI_LANES[i];
            uint64_t next = state[lane];
            state[lane] = ROTL64(carry, RHO_OFFSETS[i]);
            carry = next;
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = state[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                state[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        state[0] ^= ROUND_CONSTANTS[round];
    }
}

} // namespace detail

// ============================================================================
// Keccak256 Implementation
// ============================================================================

Keccak256::Keccak256() {
    Reset();
}

Keccak256::~Keccak256() {
    SecureZero(state_, sizeof(state_));
    SecureZero(buffer_, sizeof(buffer_));
}

Keccak256& Keccak256::Reset() {
    std::memset(state_, 0, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
    bufferLen_ = 0;
    return *this;
}

void Keccak256::AbsorbBlock(const Byte block[RATE]) {
    for (size_t i = 0; i < RATE / 8; ++i) {
        state_[i] ^= ReadLE64(block + i * 8);
    }
    detail::KeccakF1600(state_);
}

Keccak256& Keccak256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }

    // Fill partial buffer first
    if (bufferLen_ > 0) {
        size_t toCopy = std::min(len, RATE - bufferLen_);
        std::memcpy(buffer_ + bufferLen_, data, toCopy);
        bufferLen_ += toCopy;
        data += toCopy;
        len -= toCopy;

        if (bufferLen_ < RATE) {
            return *this;
        }
        AbsorbBlock(buffer_);
        bufferLen_ = 0;
    }

    // Absorb full blocks directly
    while (len >= RATE) {
        AbsorbBlock(data);
        data += RATE;
        len -= RATE;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        bufferLen_ = len;
    }

    return *this;
}

void Keccak256::Finalize(Byte hash[OUTPUT_SIZE]) {
    // pad10*1 with the original Keccak domain byte
    std::memset(buffer_ + bufferLen_, 0, RATE - bufferLen_);
    buffer_[bufferLen_] ^= 0x01;
    buffer_[RATE - 1] ^= 0x80;
    AbsorbBlock(buffer_);

    for (size_t i = 0; i < OUTPUT_SIZE / 8; ++i) {
        WriteLE64(hash + i * 8, state_[i]);
    }

    Reset();
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 Keccak256Hash(const Byte* data, size_t len) {
    Keccak256 hasher;
    Hash256 hash;

    hasher.Write(data, len);
    hasher.Finalize(hash.data());

    return hash;
}

} // namespace lumencrypt
