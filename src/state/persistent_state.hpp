#pragma once

#include "buffers/buffer_pool.hpp"
#include "buffers/pooled_buffer_writer.hpp"
#include "common/bytes.hpp"
#include "common/errors.hpp"
#include "state/json_codec.hpp"
#include "state/state_store.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace cstate {

class StateLifecycleManager;

// ── Pause callbacks ──────────────────────────────────────────────────────────

// A zero-argument asynchronous operation run once per pause phase.  It may
// throw before or after suspending; either way the failure stays contained.
using PauseCallback = std::function<boost::asio::awaitable<void>()>;

// Handle returned by register_on_persisting().  Ids are never reused within
// one PersistentState.
using PauseCallbackId = uint64_t;

struct PauseRegistration {
    PauseCallbackId id = 0;
    std::string     name;
    PauseCallback   callback;
};

// ── PersistentState ──────────────────────────────────────────────────────────
//
// Keyed store components write to and read from during one session.
//
//   Write side – persist() appends a pooled buffer per key.  Each key may be
//                written once; a second write throws DuplicateKeyError and
//                leaves the first payload untouched.
//   Read side  – filled once by initialize_existing_state() at restore time.
//                try_take() removes what it returns, so a key is consumed at
//                most once.
//
// Also owns the pause-callback registry consulted by StateLifecycleManager.
//
// NOT thread-safe: all calls must happen on the render host's context.

class PersistentState {
public:
    explicit PersistentState(BufferPool& pool = BufferPool::shared());
    ~PersistentState();

    PersistentState(const PersistentState&)            = delete;
    PersistentState& operator=(const PersistentState&) = delete;

    // Bulk-load restored state.  Throws AlreadyInitializedError on a second
    // call, which then has no effect.
    void initialize_existing_state(StateDictionary data);

    // Write `key` by letting `producer` fill a fresh pooled buffer.
    // Throws DuplicateKeyError if `key` was already written this session.
    // If `producer` throws, the buffer is released and nothing is recorded.
    void persist(const std::string& key,
                 const std::function<void(PooledBufferWriter&)>& producer);

    // Write `key` with a copy of `payload`.
    void persist(const std::string& key, ByteView payload);

    // Encode `value` with Codec and persist it under `key`.
    template <typename T, typename Codec = JsonCodec>
    void persist_as_json(const std::string& key, const T& value) {
        persist(key, [&value](PooledBufferWriter& writer) {
            Codec::encode(value, writer);
        });
    }

    // Remove and return the restored payload for `key`.  Returns nullopt if
    // the key was never restored or has already been taken.
    [[nodiscard]] std::optional<Bytes> try_take(std::string_view key);

    // try_take() followed by Codec::decode<T>().  Returns nullopt when the key
    // is absent; throws DecodeError when the payload is present but invalid.
    // The payload is consumed either way.
    template <typename T, typename Codec = JsonCodec>
    [[nodiscard]] std::optional<T> try_take_as_json(std::string_view key) {
        auto payload = try_take(key);
        if (!payload) {
            return std::nullopt;
        }
        try {
            return Codec::template decode<T>(ByteView{*payload});
        } catch (const std::exception& e) {
            throw DecodeError(std::string(key), e.what());
        }
    }

    // Bytes written so far under `key`, without consuming them.  The view is
    // invalidated when the write side is released at persist time.
    [[nodiscard]] std::optional<ByteView> pending(std::string_view key) const;

    // Register a callback for the next pause phase.  `name` only appears in
    // log records.
    PauseCallbackId register_on_persisting(PauseCallback callback,
                                           std::string name = {});

    // Remove a registration.  Returns false if `id` is not registered.
    bool unregister_on_persisting(PauseCallbackId id);

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t restored_count() const noexcept { return existing_.size(); }
    [[nodiscard]] std::size_t callback_count() const noexcept { return callbacks_.size(); }

private:
    friend class StateLifecycleManager;

    // Copy of the registry, in registration order.
    [[nodiscard]] std::vector<PauseRegistration> pause_callbacks() const {
        return callbacks_;
    }

    // Views over every pending buffer.  Valid until release_pending().
    [[nodiscard]] StateSnapshot snapshot_pending() const;

    // Return every pending buffer to the pool and clear the write side.
    void release_pending() noexcept;

    BufferPool& pool_;
    bool initialized_ = false;
    StateDictionary existing_;
    std::unordered_map<std::string, PooledBufferWriter> pending_;
    std::vector<PauseRegistration> callbacks_;
    PauseCallbackId next_callback_id_ = 1;
};

} // namespace cstate
