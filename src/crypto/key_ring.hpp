#pragma once

#include "common/bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cstate::crypto {

// ── KeyRing ──────────────────────────────────────────────────────────────────
//
// Set of master keys for data protection.  Exactly one key is active and used
// for new payloads; older keys stay in the ring so payloads they protected
// can still be unprotected after a rotation.
//
// File format: a protobuf KeyRingFile (see proto/protection.proto), written
// atomically via `<path>.tmp` + rename with mode 0600.
//
// Not thread-safe for mutation.  A ring shared between protectors must not be
// modified while they are in use.

class KeyRing {
public:
    static constexpr std::size_t kKeySize      = 32;   // AES-256
    static constexpr std::size_t kKeyIdSize    = 16;
    static constexpr uint32_t    kFileVersion  = 1;

    struct Key {
        std::string id;                 // kKeyIdSize raw bytes
        Bytes       material;           // kKeySize raw bytes
        int64_t     created_unix_ms = 0;
    };

    KeyRing() = default;

    // Generate a fresh random key and make it active.  Returns the new key.
    // Throws std::runtime_error if the system RNG fails.
    const Key& rotate();

    // Insert an existing key.  Throws std::invalid_argument on wrong sizes or
    // a duplicate id.
    void add(Key key, bool make_active);

    [[nodiscard]] const Key* active() const noexcept;
    [[nodiscard]] const Key* find(std::string_view id) const noexcept;

    [[nodiscard]] const std::vector<Key>& keys() const noexcept { return keys_; }
    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    // Atomically write the ring to `path`.
    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const;

    // Read a ring written by save().  Validates version, key sizes and that
    // the active id refers to a key in the file.
    [[nodiscard]] static std::error_code load(const std::filesystem::path& path,
                                              KeyRing& result);

    // Lower-case hex of a key id, for logs.
    [[nodiscard]] static std::string to_hex(std::string_view id);

private:
    std::vector<Key> keys_;
    std::string active_id_;
};

} // namespace cstate::crypto
