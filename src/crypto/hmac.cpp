// LUMENCRYPT - HMAC Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/crypto/hmac.h"

#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace lumencrypt {

// ============================================================================
// HMAC-SHA256 Implementation
// ============================================================================

struct HMAC_SHA256::Impl {
    EVP_MAC* mac{nullptr};
    EVP_MAC_CTX* ctx{nullptr};

    Impl(const Byte* key, size_t keyLen) {
        mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
        if (!mac) {
            throw std::runtime_error("Failed to fetch HMAC implementation");
        }
        ctx = EVP_MAC_CTX_new(mac);
        if (!ctx) {
            EVP_MAC_free(mac);
            throw std::runtime_error("Failed to create HMAC context");
        }

        char digest[] = "SHA256";
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
            OSSL_PARAM_construct_end()
        };

        // EVP_MAC_init rejects a null key pointer even for zero length
        static const Byte EMPTY_KEY[1] = {0};
        const Byte* keyPtr = (key != nullptr) ? key : EMPTY_KEY;

        if (EVP_MAC_init(ctx, keyPtr, keyLen, params) != 1) {
            EVP_MAC_CTX_free(ctx);
            EVP_MAC_free(mac);
            throw std::runtime_error("Failed to initialize HMAC-SHA256");
        }
    }

    ~Impl() {
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);
    }
};

HMAC_SHA256::HMAC_SHA256(const Byte* key, size_t keyLen)
    : impl_(std::make_unique<Impl>(key, keyLen)) {}

HMAC_SHA256::~HMAC_SHA256() = default;

HMAC_SHA256::HMAC_SHA256(HMAC_SHA256&& other) noexcept = default;
HMAC_SHA256& HMAC_SHA256::operator=(HMAC_SHA256&& other) noexcept = default;

HMAC_SHA256& HMAC_SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_MAC_update(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("HMAC-SHA256 update failed");
    }
    return *this;
}

Hash256 HMAC_SHA256::Finalize() {
    Hash256 result;
    size_t outLen = 0;
    if (EVP_MAC_final(impl_->ctx, result.data(), &outLen, OUTPUT_SIZE) != 1 ||
        outLen != OUTPUT_SIZE) {
        throw std::runtime_error("HMAC-SHA256 finalize failed");
    }
    return result;
}

Hash256 ComputeHMAC_SHA256(ByteSpan key, ByteSpan data) {
    HMAC_SHA256 mac(key);
    mac.Write(data);
    return mac.Finalize();
}

// ============================================================================
// Constant-Time Comparison
// ============================================================================

bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len) {
    if (len == 0) {
        return true;
    }
    return CRYPTO_memcmp(a, b, len) == 0;
}

} // namespace lumencrypt
