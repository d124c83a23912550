#include "persistence/prerender_state_store.hpp"

#include "persistence/base64.hpp"
#include "persistence/state_framing.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace cstate::persistence {

PrerenderStateStore::PrerenderStateStore(BufferPool& pool)
    : pool_(pool)
{}

PrerenderStateStore::PrerenderStateStore(std::string_view existing_state, BufferPool& pool)
    : pool_(pool)
{
    const auto framed = base64_decode(existing_state);
    deserialize_state(ByteView{framed});
}

PrerenderStateStore::PrerenderStateStore(Deferred, BufferPool& pool)
    : pool_(pool)
{}

boost::asio::awaitable<StateDictionary> PrerenderStateStore::get_persisted_state() {
    co_return std::exchange(existing_, StateDictionary{});
}

boost::asio::awaitable<void> PrerenderStateStore::persist_state(const StateSnapshot& state) {
    auto bytes = serialize_state(state);
    persisted_state_ = base64_encode(bytes.written());
    spdlog::debug("PrerenderStateStore: persisted {} entries ({} bytes)",
                  state.size(), bytes.written_count());
    co_return;
}

PooledBufferWriter PrerenderStateStore::serialize_state(const StateSnapshot& state) {
    return persistence::serialize_state(state, pool_);
}

void PrerenderStateStore::deserialize_state(ByteView framed) {
    existing_ = persistence::deserialize_state(framed);
}

} // namespace cstate::persistence
