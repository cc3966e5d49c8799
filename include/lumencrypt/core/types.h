// LUMENCRYPT - Core Types Header
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// This file defines fundamental byte and fixed-width value types used
// throughout LUMENCRYPT.

#ifndef LUMENCRYPT_CORE_TYPES_H
#define LUMENCRYPT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <type_traits>

namespace lumencrypt {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer (plaintexts, ciphertext blobs)
using Bytes = std::vector<Byte>;

// ============================================================================
// Span - Non-owning view of contiguous memory
// ============================================================================

template<typename T>
class Span {
public:
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using iterator = pointer;
    using size_type = std::size_t;

    constexpr Span() noexcept : data_(nullptr), size_(0) {}

    constexpr Span(pointer data, size_type size) noexcept
        : data_(data), size_(size) {}

    template<size_t N>
    constexpr Span(std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    template<size_t N>
    constexpr Span(const std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    Span(std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    Span(const std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    constexpr pointer data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr reference operator[](size_type idx) const { return data_[idx]; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

    /// Sub-view; offset and count must lie inside the view
    constexpr Span subspan(size_type offset, size_type count) const {
        return Span(data_ + offset, count);
    }

    /// Everything from offset to the end
    constexpr Span subspan(size_type offset) const {
        return Span(data_ + offset, size_ - offset);
    }

    constexpr Span first(size_type count) const {
        return Span(data_, count);
    }

    /// Copy the viewed bytes into an owned vector
    std::vector<std::remove_const_t<T>> ToVector() const {
        return std::vector<std::remove_const_t<T>>(data_, data_ + size_);
    }

private:
    pointer data_;
    size_type size_;
};

/// Read-only byte view
using ByteSpan = Span<const Byte>;

/// View the bytes of a string
inline ByteSpan AsBytes(const std::string& str) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(str.data()), str.size());
}

// ============================================================================
// Fixed-size Byte Values
// ============================================================================

/// Fixed-size byte value (digests, keys, nonces)
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - all zeros
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes; shorter input is zero-padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if value is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set value to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lowercase hex in storage order (no byte reversal)
    std::string ToHex() const;

    /// Parse hex in storage order
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

    /// Copy into an owned vector
    Bytes ToBytes() const { return Bytes(data_.begin(), data_.end()); }

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit value (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& other) : BaseHash<256>(other) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

} // namespace lumencrypt

#endif // LUMENCRYPT_CORE_TYPES_H
