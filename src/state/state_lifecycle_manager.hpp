#pragma once

#include "buffers/buffer_pool.hpp"
#include "common/errors.hpp"
#include "state/persistent_state.hpp"
#include "state/render_host.hpp"
#include "state/state_store.hpp"

#include <functional>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <spdlog/spdlog.h>

namespace cstate {

// ── StateLifecycleManager ────────────────────────────────────────────────────
//
// Drives one session of PersistentState:
//
//   1. restore_state(store)       – load what the previous round trip left
//   2. components persist() / try_take() while rendering
//   3. persist_state(store, host) – pause phase, snapshot, hand to store,
//                                   release buffers
//
// Restore and persist each happen at most once, independently: a session can
// persist without ever having restored.  Violations throw
// AlreadyInitializedError / AlreadyPersistedError.
//
// Pause phase policy: every registered callback is started before any is
// awaited, failures are logged (event 1000, PersistenceCallbackError) and
// reported to the failure observer, and the phase ends once all callbacks
// have settled.  A failing callback never stops its siblings and never fails
// the persist.
//
// NOT thread-safe: the persist sequence runs on the render host, and all
// component access to state() must happen there too.

class StateLifecycleManager {
public:
    static constexpr int kCallbackErrorEventId = 1000;

    using FailureObserver = std::function<void(const CallbackFailure&)>;

    explicit StateLifecycleManager(std::shared_ptr<spdlog::logger> logger = {},
                                   BufferPool& pool = BufferPool::shared());

    // Releases any pooled buffers still held by the write side.
    ~StateLifecycleManager();

    StateLifecycleManager(const StateLifecycleManager&)            = delete;
    StateLifecycleManager& operator=(const StateLifecycleManager&) = delete;

    [[nodiscard]] PersistentState& state() noexcept { return state_; }

    // Fetch the previous state from `store` and load it into state().
    // Throws AlreadyInitializedError if state was already restored; store
    // errors (MalformedStateError, AuthenticationError, I/O) propagate.
    [[nodiscard]] boost::asio::awaitable<void>
    restore_state(PersistentStateStore& store);

    // Throws AlreadyPersistedError immediately on a second call.  Otherwise
    // marks the session persisted and returns an awaitable that runs the
    // pause-and-persist sequence on `host`.  `store` and `host` must outlive
    // the returned awaitable.
    [[nodiscard]] boost::asio::awaitable<void>
    persist_state(PersistentStateStore& store, RenderHost& host);

    // Invoked once per failing pause callback, after it is logged.
    void set_failure_observer(FailureObserver observer) {
        failure_observer_ = std::move(observer);
    }

    [[nodiscard]] bool is_restored() const noexcept { return state_.is_initialized(); }
    [[nodiscard]] bool is_persisted() const noexcept { return persisted_; }

private:
    [[nodiscard]] boost::asio::awaitable<void>
    pause_and_persist(PersistentStateStore& store);

    // Start every registered callback, then wait for all of them to settle.
    [[nodiscard]] boost::asio::awaitable<void> pause();

    // Run one callback, containing any exception it throws.
    [[nodiscard]] boost::asio::awaitable<void>
    run_callback(PauseRegistration registration);

    void report_failure(const PauseRegistration& registration,
                        std::string message);

    std::shared_ptr<spdlog::logger> logger_;
    PersistentState state_;
    FailureObserver failure_observer_;
    bool persisted_ = false;
};

} // namespace cstate
