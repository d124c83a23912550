#include "state/persistent_state.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cstate {

PersistentState::PersistentState(BufferPool& pool)
    : pool_(pool)
{}

PersistentState::~PersistentState() {
    release_pending();
}

void PersistentState::initialize_existing_state(StateDictionary data) {
    if (initialized_) {
        throw AlreadyInitializedError();
    }
    existing_ = std::move(data);
    initialized_ = true;
}

void PersistentState::persist(const std::string& key,
                              const std::function<void(PooledBufferWriter&)>& producer) {
    if (pending_.contains(key)) {
        throw DuplicateKeyError(key);
    }

    // The writer returns its block on unwind if the producer throws.
    PooledBufferWriter writer(pool_);
    producer(writer);

    // A producer may itself persist the same key; the first write stands.
    if (!pending_.emplace(key, std::move(writer)).second) {
        throw DuplicateKeyError(key);
    }
}

void PersistentState::persist(const std::string& key, ByteView payload) {
    persist(key, [payload](PooledBufferWriter& writer) {
        writer.write(payload);
    });
}

std::optional<Bytes> PersistentState::try_take(std::string_view key) {
    auto it = existing_.find(std::string(key));
    if (it == existing_.end()) {
        return std::nullopt;
    }
    auto node = existing_.extract(it);
    return std::move(node.mapped());
}

std::optional<ByteView> PersistentState::pending(std::string_view key) const {
    auto it = pending_.find(std::string(key));
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second.written();
}

PauseCallbackId PersistentState::register_on_persisting(PauseCallback callback,
                                                        std::string name) {
    if (!callback) {
        throw std::invalid_argument("register_on_persisting: empty callback");
    }
    const auto id = next_callback_id_++;
    callbacks_.push_back(PauseRegistration{id, std::move(name), std::move(callback)});
    return id;
}

bool PersistentState::unregister_on_persisting(PauseCallbackId id) {
    auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                           [id](const PauseRegistration& r) { return r.id == id; });
    if (it == callbacks_.end()) {
        return false;
    }
    callbacks_.erase(it);
    return true;
}

StateSnapshot PersistentState::snapshot_pending() const {
    StateSnapshot snapshot;
    snapshot.reserve(pending_.size());
    for (const auto& [key, writer] : pending_) {
        snapshot.emplace(key, writer.written());
    }
    return snapshot;
}

void PersistentState::release_pending() noexcept {
    for (auto& [key, writer] : pending_) {
        writer.release();
    }
    pending_.clear();
}

} // namespace cstate
