#include "common/errors.hpp"

namespace cstate {

const char* to_string(StateErrc kind) noexcept {
    switch (kind) {
        case StateErrc::DuplicateKey:       return "DuplicateKey";
        case StateErrc::AlreadyInitialized: return "AlreadyInitialized";
        case StateErrc::AlreadyPersisted:   return "AlreadyPersisted";
        case StateErrc::Decode:             return "Decode";
        case StateErrc::MalformedState:     return "MalformedState";
        case StateErrc::Authentication:     return "Authentication";
    }
    return "Unknown";
}

DuplicateKeyError::DuplicateKeyError(const std::string& key)
    : StateError(StateErrc::DuplicateKey,
                 "There is already a persisted object under the key '" + key + "'")
    , key_(key)
{}

AlreadyInitializedError::AlreadyInitializedError()
    : StateError(StateErrc::AlreadyInitialized, "State already initialized.")
{}

AlreadyPersistedError::AlreadyPersistedError()
    : StateError(StateErrc::AlreadyPersisted, "State already persisted.")
{}

DecodeError::DecodeError(const std::string& key, const std::string& reason)
    : StateError(StateErrc::Decode,
                 "Failed to decode persisted value for key '" + key + "': " + reason)
    , key_(key)
{}

} // namespace cstate
