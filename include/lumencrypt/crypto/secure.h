// LUMENCRYPT - Secure Memory Helpers
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Scrubbing and page locking for key material.

#ifndef LUMENCRYPT_CRYPTO_SECURE_H
#define LUMENCRYPT_CRYPTO_SECURE_H

#include "lumencrypt/core/types.h"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace lumencrypt {

/// Securely zero memory (not elided by the optimizer)
void SecureZero(void* ptr, size_t size);

/// Zero and release a byte vector
inline void SecureWipe(std::vector<Byte>& data) {
    SecureZero(data.data(), data.size());
    std::vector<Byte>().swap(data);
}

/// Zero and release a string
inline void SecureWipe(std::string& data) {
    SecureZero(&data[0], data.size());
    std::string().swap(data);
}

/// Lock memory pages (prevent swapping). Best effort.
bool LockMemory(void* ptr, size_t size);

/// Unlock memory pages
bool UnlockMemory(void* ptr, size_t size);

// ============================================================================
// Secure Memory Container
// ============================================================================

/**
 * Fixed-size container for sensitive data that:
 * - Locks memory to prevent swapping
 * - Securely zeros memory on destruction
 */
template<typename T, size_t N>
class SecureArray {
public:
    SecureArray() {
        LockMemory(data_.data(), sizeof(data_));
        data_.fill(0);
    }

    SecureArray(const T* src, size_t len) : SecureArray() {
        std::memcpy(data_.data(), src, std::min(len, N) * sizeof(T));
    }

    ~SecureArray() {
        SecureZero(data_.data(), sizeof(data_));
        UnlockMemory(data_.data(), sizeof(data_));
    }

    // Non-copyable
    SecureArray(const SecureArray&) = delete;
    SecureArray& operator=(const SecureArray&) = delete;

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }
    constexpr size_t size() const { return N; }

    T& operator[](size_t i) { return data_[i]; }
    const T& operator[](size_t i) const { return data_[i]; }

    auto begin() const { return data_.begin(); }
    auto end() const { return data_.end(); }

    /// Read-only view of the bytes
    Span<const T> View() const { return Span<const T>(data_.data(), N); }

    /// View of the bytes in [offset, offset + count)
    Span<const T> View(size_t offset, size_t count) const {
        return Span<const T>(data_.data() + offset, count);
    }

    /// Zero the contents in place
    void Wipe() { SecureZero(data_.data(), sizeof(data_)); }

private:
    std::array<T, N> data_;
};

} // namespace lumencrypt

#endif // LUMENCRYPT_CRYPTO_SECURE_H
