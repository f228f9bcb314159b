// STAKEGOV - SHA256 Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace stakegov {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            if (ctx) EVP_MD_CTX_free(ctx);
            throw std::runtime_error("SHA256: failed to initialize digest context");
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA256: digest update failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: digest finalization failed");
    }
    Reset();
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: digest reset failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256().Write(data, len).Finalize(result.data());
    return result;
}

} // namespace stakegov
