// LUMENCRYPT - AES Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/crypto/aes.h"
#include "lumencrypt/crypto/secure.h"

#include <climits>
#include <memory>

#include <openssl/evp.h>

namespace lumencrypt {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr NewCipherCtx() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }
    return ctx;
}

// EVP takes int lengths
inline int CheckedLen(size_t len) {
    if (len > static_cast<size_t>(INT_MAX)) {
        throw std::invalid_argument("Input too large for cipher");
    }
    return static_cast<int>(len);
}

} // anonymous namespace

// ============================================================================
// AES-128-CTR
// ============================================================================

std::vector<Byte> AES128CTRCrypt(ByteSpan key, ByteSpan iv, ByteSpan data) {
    if (key.size() != aes::KEY_SIZE_128) {
        throw std::invalid_argument("AES-128 key must be 16 bytes");
    }
    if (iv.size() != aes::CTR_IV_SIZE) {
        throw std::invalid_argument("AES-CTR IV must be 16 bytes");
    }

    auto ctx = NewCipherCtx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ctr(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("Failed to initialize AES-128-CTR");
    }

    std::vector<Byte> out(data.size());
    int len = 0;
    int total = 0;
    if (!data.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, data.data(),
                              CheckedLen(data.size())) != 1) {
            throw std::runtime_error("AES-128-CTR update failed");
        }
        total = len;
    }
    // Stream modes emit nothing at finalization; scratch keeps empty input safe
    Byte tail[aes::BLOCK_SIZE];
    if (EVP_EncryptFinal_ex(ctx.get(), tail, &len) != 1) {
        throw std::runtime_error("AES-128-CTR finalize failed");
    }
    out.resize(static_cast<size_t>(total));
    out.insert(out.end(), tail, tail + len);
    return out;
}

// ============================================================================
// AES-256-GCM
// ============================================================================

GCMSealed AES256GCMEncrypt(ByteSpan key, ByteSpan nonce, ByteSpan plaintext) {
    if (key.size() != aes::KEY_SIZE_256) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }
    if (nonce.size() != aes::GCM_NONCE_SIZE) {
        throw std::invalid_argument("AES-GCM nonce must be 12 bytes");
    }

    auto ctx = NewCipherCtx();

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize AES-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(aes::GCM_NONCE_SIZE), nullptr) != 1) {
        throw std::runtime_error("Failed to set IV length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set key/IV");
    }

    GCMSealed sealed;
    sealed.ciphertext.resize(plaintext.size());

    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &len, plaintext.data(),
                              CheckedLen(plaintext.size())) != 1) {
            throw std::runtime_error("Failed to encrypt");
        }
        total = len;
    }

    Byte tail[aes::BLOCK_SIZE];
    if (EVP_EncryptFinal_ex(ctx.get(), tail, &len) != 1) {
        throw std::runtime_error("Failed to finalize encryption");
    }
    sealed.ciphertext.resize(static_cast<size_t>(total));
    sealed.ciphertext.insert(sealed.ciphertext.end(), tail, tail + len);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(aes::GCM_TAG_SIZE), sealed.tag.data()) != 1) {
        throw std::runtime_error("Failed to get auth tag");
    }

    return sealed;
}

std::optional<std::vector<Byte>> AES256GCMDecrypt(ByteSpan key, ByteSpan nonce,
                                                  ByteSpan ciphertext, ByteSpan tag) {
    if (key.size() != aes::KEY_SIZE_256 ||
        nonce.size() != aes::GCM_NONCE_SIZE ||
        tag.size() != aes::GCM_TAG_SIZE ||
        ciphertext.size() > static_cast<size_t>(INT_MAX)) {
        return std::nullopt;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return std::nullopt;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(aes::GCM_NONCE_SIZE), nullptr) != 1) {
        return std::nullopt;
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return std::nullopt;
    }

    std::vector<Byte> plaintext(ciphertext.size());
    int len = 0;
    int total = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            SecureWipe(plaintext);
            return std::nullopt;
        }
        total = len;
    }

    // Set expected tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(aes::GCM_TAG_SIZE),
                            const_cast<Byte*>(tag.data())) != 1) {
        SecureWipe(plaintext);
        return std::nullopt;
    }

    // Finalize and verify tag
    Byte tail[aes::BLOCK_SIZE];
    if (EVP_DecryptFinal_ex(ctx.get(), tail, &len) != 1) {
        // Authentication failed
        SecureWipe(plaintext);
        return std::nullopt;
    }

    plaintext.resize(static_cast<size_t>(total));
    plaintext.insert(plaintext.end(), tail, tail + len);
    return plaintext;
}

} // namespace lumencrypt
