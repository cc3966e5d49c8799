// LUMENCRYPT - Keccak-256 Hash Function
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Keccak-256 as used by Ethereum and the Solana ecosystem: the original
// Keccak submission with 0x01 domain padding. This is NOT NIST SHA3-256,
// which pads with 0x06 and produces different digests.

#ifndef LUMENCRYPT_CRYPTO_KECCAK_H
#define LUMENCRYPT_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include "lumencrypt/core/types.h"

namespace lumencrypt {

/// Keccak-256 hasher with incremental Write/Finalize
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;

    Keccak256();
    ~Keccak256();

    /// Absorb data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    Keccak256& Write(ByteSpan data) { return Write(data.data(), data.size()); }

    /// Pad, squeeze 32 bytes into hash, then reset
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    Keccak256& Reset();

private:
    /// Sponge state (5x5 lanes of 64 bits)
    uint64_t state_[25];

    /// Partial block awaiting absorption
    Byte buffer_[RATE];

    /// Bytes currently held in buffer_
    size_t bufferLen_;

    /// XOR one full block into the state and permute
    void AbsorbBlock(const Byte block[RATE]);
};

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

/// Compute Keccak-256 of a byte view
inline Hash256 Keccak256Hash(ByteSpan data) {
    return Keccak256Hash(data.data(), data.size());
}

namespace detail {

/// The Keccak-f[1600] permutation (24 rounds)
void KeccakF1600(uint64_t state[25]);

} // namespace detail

} // namespace lumencrypt

#endif // LUMENCRYPT_CRYPTO_KECCAK_H
