#include "state/state_lifecycle_manager.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace cstate {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::steady_timer;
using boost::asio::use_awaitable;

StateLifecycleManager::StateLifecycleManager(std::shared_ptr<spdlog::logger> logger,
                                             BufferPool& pool)
    : logger_(logger ? std::move(logger) : spdlog::default_logger())
    , state_(pool)
{}

StateLifecycleManager::~StateLifecycleManager() {
    state_.release_pending();
}

// ── Restore ──────────────────────────────────────────────────────────────────

awaitable<void> StateLifecycleManager::restore_state(PersistentStateStore& store) {
    // Fail before touching the store so a second restore has no effect.
    if (state_.is_initialized()) {
        throw AlreadyInitializedError();
    }

    auto data = co_await store.get_persisted_state();
    const auto count = data.size();
    state_.initialize_existing_state(std::move(data));

    logger_->debug("StateLifecycleManager: restored {} entries", count);
}

// ── Persist ──────────────────────────────────────────────────────────────────

awaitable<void> StateLifecycleManager::persist_state(PersistentStateStore& store,
                                                     RenderHost& host) {
    // Not a coroutine: the misuse check must throw at the call.
    if (persisted_) {
        throw AlreadyPersistedError();
    }
    persisted_ = true;

    return host.invoke([this, &store]() { return pause_and_persist(store); });
}

awaitable<void> StateLifecycleManager::pause_and_persist(PersistentStateStore& store) {
    // Pending buffers go back to the pool on every exit path, including a
    // throwing store.
    struct ReleaseGuard {
        PersistentState& state;
        ~ReleaseGuard() { state.release_pending(); }
    } guard{state_};

    co_await pause();

    const auto snapshot = state_.snapshot_pending();
    logger_->debug("StateLifecycleManager: persisting {} entries", snapshot.size());

    co_await store.persist_state(snapshot);
}

// ── Pause phase ──────────────────────────────────────────────────────────────

awaitable<void> StateLifecycleManager::pause() {
    auto callbacks = state_.pause_callbacks();
    if (callbacks.empty()) {
        co_return;
    }

    auto executor = co_await boost::asio::this_coro::executor;

    // The timer never expires on its own; the last callback to settle cancels
    // it to wake this coroutine.  Completion handlers run on `executor`, which
    // is the render host's serialised context, so `remaining` needs no lock.
    std::size_t remaining = callbacks.size();
    steady_timer all_settled(executor, steady_timer::time_point::max());

    for (auto& registration : callbacks) {
        boost::asio::co_spawn(
            executor,
            run_callback(std::move(registration)),
            [this, &remaining, &all_settled](std::exception_ptr ep) {
                // Only a non-std exception out of the failure observer
                // reaches here.
                if (ep) {
                    logger_->error("StateLifecycleManager: pause callback "
                                   "completed with an unhandled exception");
                }
                if (--remaining == 0) {
                    all_settled.cancel();
                }
            });
    }

    logger_->debug("StateLifecycleManager: started {} pause callbacks",
                   callbacks.size());

    if (remaining > 0) {
        boost::system::error_code ec;
        co_await all_settled.async_wait(redirect_error(use_awaitable, ec));
    }
}

awaitable<void> StateLifecycleManager::run_callback(PauseRegistration registration) {
    try {
        // Covers both a synchronous throw from the call itself and a throw
        // after the callback's first suspension.
        co_await registration.callback();
    } catch (const std::exception& e) {
        report_failure(registration, e.what());
    } catch (...) {
        report_failure(registration, "unknown exception");
    }
}

void StateLifecycleManager::report_failure(const PauseRegistration& registration,
                                           std::string message) {
    logger_->error("[{}] PersistenceCallbackError: There was an error executing "
                   "a callback while pausing the application "
                   "(callback id={}, name='{}'): {}",
                   kCallbackErrorEventId, registration.id, registration.name,
                   message);

    if (failure_observer_) {
        try {
            failure_observer_(CallbackFailure{registration.id, registration.name,
                                              std::move(message)});
        } catch (const std::exception& e) {
            logger_->error("StateLifecycleManager: failure observer threw "
                           "(callback id={}): {}", registration.id, e.what());
        }
    }
}

} // namespace cstate
