/**
 * @file dilithium.cpp
 * @brief Реализация подписей Dilithium2 через liboqs
 */

#include "dilithium.hpp"

#include <oqs/oqs.h>

static_assert(qtc::crypto::DILITHIUM2_PUBLIC_KEY_SIZE == OQS_SIG_dilithium_2_length_public_key);
static_assert(qtc::crypto::DILITHIUM2_SECRET_KEY_SIZE == OQS_SIG_dilithium_2_length_secret_key);
static_assert(qtc::crypto::DILITHIUM2_SIGNATURE_SIZE == OQS_SIG_dilithium_2_length_signature);

namespace qtc::crypto {

// =============================================================================
// SecretKey
// =============================================================================

SecretKey::~SecretKey() {
    wipe();
}

SecretKey::SecretKey(SecretKey&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

void SecretKey::wipe() noexcept {
    if (!bytes_.empty()) {
        OQS_MEM_cleanse(bytes_.data(), bytes_.size());
        bytes_.clear();
    }
}

// =============================================================================
// Операции
// =============================================================================

Result<KeyPair> generate_keypair() {
    KeyPair pair;
    pair.public_key.resize(DILITHIUM2_PUBLIC_KEY_SIZE);
    Bytes secret(DILITHIUM2_SECRET_KEY_SIZE);

    if (OQS_SIG_dilithium_2_keypair(pair.public_key.data(), secret.data()) != OQS_SUCCESS) {
        OQS_MEM_cleanse(secret.data(), secret.size());
        return Err<KeyPair>(ErrorCode::CryptoKeygenFailed);
    }

    pair.secret_key = SecretKey(std::move(secret));
    return pair;
}

Result<Bytes> sign(const SecretKey& secret_key, ByteSpan message) {
    if (secret_key.bytes().size() != DILITHIUM2_SECRET_KEY_SIZE) {
        return Err<Bytes>(ErrorCode::CryptoInvalidLength, "Неверная длина секретного ключа");
    }

    Bytes signature(DILITHIUM2_SIGNATURE_SIZE);
    std::size_t sig_len = 0;
    if (OQS_SIG_dilithium_2_sign(signature.data(), &sig_len,
                                 message.data(), message.size(),
                                 secret_key.bytes().data()) != OQS_SUCCESS) {
        return Err<Bytes>(ErrorCode::CryptoSignFailed);
    }

    signature.resize(sig_len);
    return signature;
}

bool verify(ByteSpan public_key, ByteSpan message, ByteSpan signature) noexcept {
    if (public_key.size() != DILITHIUM2_PUBLIC_KEY_SIZE ||
        signature.empty() || signature.size() > DILITHIUM2_SIGNATURE_SIZE) {
        return false;
    }

    return OQS_SIG_dilithium_2_verify(message.data(), message.size(),
                                      signature.data(), signature.size(),
                                      public_key.data()) == OQS_SUCCESS;
}

std::string_view algorithm_name() noexcept {
    return OQS_SIG_alg_dilithium_2;
}

} // namespace qtc::crypto
