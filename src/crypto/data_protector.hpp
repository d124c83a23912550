#pragma once

#include "common/bytes.hpp"
#include "crypto/key_ring.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace cstate::crypto {

// ── DataProtector ────────────────────────────────────────────────────────────
//
// Authenticated encryption bound to one purpose string.  A payload protected
// under one purpose cannot be unprotected under another.

class DataProtector {
public:
    virtual ~DataProtector() = default;

    // Encrypt and authenticate `plaintext`.
    [[nodiscard]] virtual Bytes protect(ByteView plaintext) const = 0;

    // Verify and decrypt.  Throws AuthenticationError if `protected_data` was
    // tampered with, was produced for another purpose, or names a key this
    // protector does not hold.
    [[nodiscard]] virtual Bytes unprotect(ByteView protected_data) const = 0;

    [[nodiscard]] virtual const std::string& purpose() const noexcept = 0;
};

// ── DataProtectionProvider ───────────────────────────────────────────────────

class DataProtectionProvider {
public:
    virtual ~DataProtectionProvider() = default;

    [[nodiscard]] virtual std::unique_ptr<DataProtector>
    create_protector(const std::string& purpose) const = 0;
};

// ── AeadDataProtector ────────────────────────────────────────────────────────
//
// AES-256-GCM with a per-purpose subkey:
//
//   subkey = HKDF-SHA256(ikm = master key, salt = key id, info = purpose)
//
// Output is a serialized ProtectedPayload envelope carrying the key id and a
// fresh 96-bit nonce; the envelope version and key id are authenticated as
// associated data.  Unprotect picks the master key by id, so payloads from a
// rotated-out key still verify while that key remains in the ring.

class AeadDataProtector final : public DataProtector {
public:
    static constexpr uint32_t    kEnvelopeVersion = 1;
    static constexpr std::size_t kNonceSize       = 12;
    static constexpr std::size_t kTagSize         = 16;

    AeadDataProtector(std::shared_ptr<const KeyRing> key_ring, std::string purpose);

    [[nodiscard]] Bytes protect(ByteView plaintext) const override;
    [[nodiscard]] Bytes unprotect(ByteView protected_data) const override;

    [[nodiscard]] const std::string& purpose() const noexcept override { return purpose_; }

private:
    [[nodiscard]] Bytes derive_subkey(const KeyRing::Key& key) const;

    std::shared_ptr<const KeyRing> key_ring_;
    std::string purpose_;
};

// ── KeyRingProtectionProvider ────────────────────────────────────────────────

class KeyRingProtectionProvider final : public DataProtectionProvider {
public:
    explicit KeyRingProtectionProvider(std::shared_ptr<const KeyRing> key_ring);

    [[nodiscard]] std::unique_ptr<DataProtector>
    create_protector(const std::string& purpose) const override;

private:
    std::shared_ptr<const KeyRing> key_ring_;
};

} // namespace cstate::crypto
