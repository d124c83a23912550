#include "crypto/data_protector.hpp"

#include "common/errors.hpp"

#include <limits>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include "protection.pb.h"

namespace cstate::crypto {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using PkeyCtx   = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

// Wipes key material on scope exit.
struct Cleanse {
    Bytes& bytes;
    ~Cleanse() { OPENSSL_cleanse(bytes.data(), bytes.size()); }
};

[[nodiscard]] CipherCtx new_cipher_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("AeadDataProtector: EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

// Associated data: [version: u32 LE][key_id]
[[nodiscard]] Bytes make_aad(uint32_t version, const std::string& key_id) {
    Bytes aad;
    aad.reserve(4 + key_id.size());
    for (int i = 0; i < 4; ++i) {
        aad.push_back(static_cast<uint8_t>(version >> (i * 8)));
    }
    aad.insert(aad.end(), key_id.begin(), key_id.end());
    return aad;
}

[[nodiscard]] int checked_len(std::size_t n) {
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max() - 64)) {
        throw std::length_error("AeadDataProtector: payload too large");
    }
    return static_cast<int>(n);
}

} // anonymous namespace

// ── AeadDataProtector ────────────────────────────────────────────────────────

AeadDataProtector::AeadDataProtector(std::shared_ptr<const KeyRing> key_ring,
                                     std::string purpose)
    : key_ring_(std::move(key_ring))
    , purpose_(std::move(purpose))
{
    if (!key_ring_) {
        throw std::invalid_argument("AeadDataProtector: null key ring");
    }
    if (purpose_.empty()) {
        throw std::invalid_argument("AeadDataProtector: purpose must not be empty");
    }
}

Bytes AeadDataProtector::derive_subkey(const KeyRing::Key& key) const {
    PkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx ||
        EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(
            ctx.get(), reinterpret_cast<const unsigned char*>(key.id.data()),
            static_cast<int>(key.id.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(
            ctx.get(), key.material.data(),
            static_cast<int>(key.material.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(
            ctx.get(), reinterpret_cast<const unsigned char*>(purpose_.data()),
            static_cast<int>(purpose_.size())) <= 0) {
        throw std::runtime_error("AeadDataProtector: HKDF setup failed");
    }

    Bytes subkey(KeyRing::kKeySize);
    std::size_t len = subkey.size();
    if (EVP_PKEY_derive(ctx.get(), subkey.data(), &len) <= 0 || len != subkey.size()) {
        throw std::runtime_error("AeadDataProtector: HKDF derive failed");
    }
    return subkey;
}

Bytes AeadDataProtector::protect(ByteView plaintext) const {
    const auto* key = key_ring_->active();
    if (key == nullptr) {
        throw std::runtime_error("AeadDataProtector: key ring has no active key");
    }

    Bytes subkey = derive_subkey(*key);
    Cleanse wipe{subkey};

    Bytes nonce(kNonceSize);
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        throw std::runtime_error("AeadDataProtector: RAND_bytes failed");
    }

    const Bytes aad = make_aad(kEnvelopeVersion, key->id);
    const int pt_len = checked_len(plaintext.size());

    auto ctx = new_cipher_ctx();
    int out_len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, subkey.data(), nonce.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AeadDataProtector: encrypt init failed");
    }

    Bytes ciphertext(plaintext.size() + kTagSize);
    int written = 0;
    if (pt_len > 0) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len,
                              plaintext.data(), pt_len) != 1) {
            throw std::runtime_error("AeadDataProtector: encrypt failed");
        }
        written = out_len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + written, &out_len) != 1) {
        throw std::runtime_error("AeadDataProtector: encrypt final failed");
    }
    written += out_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            ciphertext.data() + written) != 1) {
        throw std::runtime_error("AeadDataProtector: get tag failed");
    }
    ciphertext.resize(static_cast<std::size_t>(written) + kTagSize);

    ProtectedPayload envelope;
    envelope.set_version(kEnvelopeVersion);
    envelope.set_key_id(key->id);
    envelope.set_nonce(nonce.data(), nonce.size());
    envelope.set_ciphertext(ciphertext.data(), ciphertext.size());

    std::string serialized;
    if (!envelope.SerializeToString(&serialized)) {
        throw std::runtime_error("AeadDataProtector: envelope serialization failed");
    }
    return to_bytes(serialized);
}

Bytes AeadDataProtector::unprotect(ByteView protected_data) const {
    ProtectedPayload envelope;
    if (!envelope.ParseFromArray(protected_data.data(), checked_len(protected_data.size()))) {
        throw AuthenticationError("payload is not a protected envelope");
    }
    if (envelope.version() != kEnvelopeVersion) {
        throw AuthenticationError("unsupported envelope version " +
                                  std::to_string(envelope.version()));
    }
    if (envelope.nonce().size() != kNonceSize) {
        throw AuthenticationError("invalid nonce length");
    }
    if (envelope.ciphertext().size() < kTagSize) {
        throw AuthenticationError("ciphertext shorter than the tag");
    }

    const auto* key = key_ring_->find(envelope.key_id());
    if (key == nullptr) {
        throw AuthenticationError("key " + KeyRing::to_hex(envelope.key_id()) +
                                  " not found in the key ring");
    }

    Bytes subkey = derive_subkey(*key);
    Cleanse wipe{subkey};

    const Bytes aad = make_aad(envelope.version(), envelope.key_id());
    const auto& ct = envelope.ciphertext();
    const std::size_t body_len = ct.size() - kTagSize;
    const auto* ct_bytes = reinterpret_cast<const unsigned char*>(ct.data());
    const auto* nonce = reinterpret_cast<const unsigned char*>(envelope.nonce().data());

    auto ctx = new_cipher_ctx();
    int out_len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, subkey.data(), nonce) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AeadDataProtector: decrypt init failed");
    }

    Bytes plaintext(body_len + kTagSize);
    int written = 0;
    if (body_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, ct_bytes,
                              checked_len(body_len)) != 1) {
            throw AuthenticationError("ciphertext failed to decrypt");
        }
        written = out_len;
    }

    // The tag setter takes a non-const pointer but only reads from it.
    Bytes tag(ct_bytes + body_len, ct_bytes + ct.size());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            tag.data()) != 1) {
        throw std::runtime_error("AeadDataProtector: set tag failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &out_len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw AuthenticationError("ciphertext failed verification");
    }
    written += out_len;
    plaintext.resize(static_cast<std::size_t>(written));
    return plaintext;
}

// ── KeyRingProtectionProvider ────────────────────────────────────────────────

KeyRingProtectionProvider::KeyRingProtectionProvider(std::shared_ptr<const KeyRing> key_ring)
    : key_ring_(std::move(key_ring))
{}

std::unique_ptr<DataProtector>
KeyRingProtectionProvider::create_protector(const std::string& purpose) const {
    return std::make_unique<AeadDataProtector>(key_ring_, purpose);
}

} // namespace cstate::crypto
