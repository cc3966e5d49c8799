// LUMENCRYPT - SHA256 Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace lumencrypt {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("Failed to create digest context");
        }
        Init();
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize SHA-256");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256::SHA256(SHA256&& other) noexcept = default;
SHA256& SHA256::operator=(SHA256&& other) noexcept = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("SHA-256 finalize failed");
    }
    impl_->Init();
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    Hash256 hash;

    hasher.Write(data, len);
    hasher.Finalize(hash.data());

    return hash;
}

} // namespace lumencrypt
