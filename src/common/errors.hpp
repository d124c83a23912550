#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cstate {

// ── Error taxonomy ────────────────────────────────────────────────────────────
//
// Every error the state layer raises derives from StateError and reports a
// StateErrc so callers can branch on the kind without a catch ladder:
//
//   DuplicateKey / AlreadyInitialized / AlreadyPersisted – caller bugs,
//       raised immediately, never retried.
//   Decode          – a payload exists but the JSON codec rejected it.
//   MalformedState  – framing corruption (truncation, bad lengths, CRC).
//   Authentication  – protected payload was tampered with or is foreign.
//
// Pause callback failures are NOT exceptions: see CallbackFailure.

enum class StateErrc : uint8_t {
    DuplicateKey       = 1,
    AlreadyInitialized = 2,
    AlreadyPersisted   = 3,
    Decode             = 4,
    MalformedState     = 5,
    Authentication     = 6,
};

// Human-readable name of an error kind ("DuplicateKey", …).
[[nodiscard]] const char* to_string(StateErrc kind) noexcept;

class StateError : public std::runtime_error {
public:
    StateError(StateErrc kind, const std::string& what)
        : std::runtime_error(what)
        , kind_(kind)
    {}

    [[nodiscard]] StateErrc kind() const noexcept { return kind_; }

private:
    StateErrc kind_;
};

class DuplicateKeyError final : public StateError {
public:
    explicit DuplicateKeyError(const std::string& key);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class AlreadyInitializedError final : public StateError {
public:
    AlreadyInitializedError();
};

class AlreadyPersistedError final : public StateError {
public:
    AlreadyPersistedError();
};

class DecodeError final : public StateError {
public:
    DecodeError(const std::string& key, const std::string& reason);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class MalformedStateError final : public StateError {
public:
    explicit MalformedStateError(const std::string& reason)
        : StateError(StateErrc::MalformedState, "Malformed state: " + reason)
    {}
};

class AuthenticationError final : public StateError {
public:
    explicit AuthenticationError(const std::string& reason)
        : StateError(StateErrc::Authentication,
                     "State authentication failed: " + reason)
    {}
};

// ── CallbackFailure ───────────────────────────────────────────────────────────
// Record of a pause callback that threw (synchronously or after suspending).
// Logged and handed to the optional failure observer; never propagated.

struct CallbackFailure {
    uint64_t    callback_id = 0;
    std::string callback_name;   // empty if registered without a name
    std::string message;         // exception what(), or "unknown exception"
};

} // namespace cstate
