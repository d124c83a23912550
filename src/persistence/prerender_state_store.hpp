#pragma once

#include "buffers/buffer_pool.hpp"
#include "buffers/pooled_buffer_writer.hpp"
#include "common/bytes.hpp"
#include "state/state_store.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace cstate::persistence {

// ── PrerenderStateStore ──────────────────────────────────────────────────────
//
// PersistentStateStore that round-trips a session's state through a single
// transport string, e.g. one embedded in a prerendered HTML response:
//
//   persist:  snapshot → serialize_state() → base64 → persisted_state()
//   restore:  base64 → deserialize_state() → get_persisted_state()
//
// Subclasses change the binary form by overriding serialize_state() and by
// feeding their own bytes to deserialize_state() at construction.

class PrerenderStateStore : public PersistentStateStore {
public:
    // Start with no previous state.
    explicit PrerenderStateStore(BufferPool& pool = BufferPool::shared());

    // Decode a transport string produced by an earlier persist.  Throws
    // MalformedStateError on bad base64 or framing.
    explicit PrerenderStateStore(std::string_view existing_state,
                                 BufferPool& pool = BufferPool::shared());

    // Hands out the restored dictionary.  A second call returns it empty.
    [[nodiscard]] boost::asio::awaitable<StateDictionary>
    get_persisted_state() override;

    boost::asio::awaitable<void>
    persist_state(const StateSnapshot& state) override;

    // Transport string from the last persist, or nullopt before any persist.
    [[nodiscard]] const std::optional<std::string>& persisted_state() const noexcept {
        return persisted_state_;
    }

protected:
    struct Deferred {};

    // For subclasses that decode their own transport form.
    PrerenderStateStore(Deferred, BufferPool& pool);

    // Binary form of `state` before the outer base64.  The default is the
    // plain CSTF frame.
    [[nodiscard]] virtual PooledBufferWriter serialize_state(const StateSnapshot& state);

    // Load restored state from a plain CSTF frame.
    void deserialize_state(ByteView framed);

    [[nodiscard]] BufferPool& pool() noexcept { return pool_; }

private:
    BufferPool& pool_;
    StateDictionary existing_;
    std::optional<std::string> persisted_state_;
};

} // namespace cstate::persistence
