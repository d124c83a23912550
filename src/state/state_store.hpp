#pragma once

#include "common/bytes.hpp"

#include <string>
#include <unordered_map>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace cstate {

// Restored state: key → owned payload.  Keys compare byte-exact.
using StateDictionary = std::unordered_map<std::string, Bytes>;

// State captured at persist time: key → view into a pooled buffer.  The views
// are valid only until the persist call that received them completes.
using StateSnapshot = std::unordered_map<std::string, ByteView>;

// Copy a snapshot into owned storage.
[[nodiscard]] inline StateDictionary to_dictionary(const StateSnapshot& snapshot) {
    StateDictionary out;
    out.reserve(snapshot.size());
    for (const auto& [key, view] : snapshot) {
        out.emplace(key, Bytes(view.begin(), view.end()));
    }
    return out;
}

// View an owned dictionary as a snapshot.
[[nodiscard]] inline StateSnapshot to_snapshot(const StateDictionary& dict) {
    StateSnapshot out;
    out.reserve(dict.size());
    for (const auto& [key, bytes] : dict) {
        out.emplace(key, ByteView{bytes});
    }
    return out;
}

// ── PersistentStateStore ─────────────────────────────────────────────────────
//
// Boundary between the lifecycle manager and wherever state lives between
// requests (an HTML response, a client token, a database).
//
// Implementations may suspend on I/O.  persist_state() must copy whatever it
// needs to keep: the snapshot views die once it returns.

class PersistentStateStore {
public:
    virtual ~PersistentStateStore() = default;

    // Returns the state persisted by the previous round trip (empty if none).
    [[nodiscard]] virtual boost::asio::awaitable<StateDictionary>
    get_persisted_state() = 0;

    // Stores `state` for the next round trip.
    virtual boost::asio::awaitable<void>
    persist_state(const StateSnapshot& state) = 0;
};

} // namespace cstate
