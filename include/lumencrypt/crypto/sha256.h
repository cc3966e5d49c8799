// LUMENCRYPT - SHA256 Hash Function
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// SHA-256 (FIPS 180-4) backed by OpenSSL's EVP digest interface.

#ifndef LUMENCRYPT_CRYPTO_SHA256_H
#define LUMENCRYPT_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include "lumencrypt/core/types.h"

namespace lumencrypt {

/// SHA-256 hasher class with incremental Write/Finalize
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Block size in bytes
    static constexpr size_t BLOCK_SIZE = 64;

    /// Default constructor - initializes to empty state
    /// @throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    SHA256(SHA256&& other) noexcept;
    SHA256& operator=(SHA256&& other) noexcept;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(ByteSpan data) { return Write(data.data(), data.size()); }

    /// Finalize the hash and write to output; the hasher is reset afterwards
    /// @param hash Output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a byte view
inline Hash256 SHA256Hash(ByteSpan data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace lumencrypt

#endif // LUMENCRYPT_CRYPTO_SHA256_H
