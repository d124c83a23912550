#pragma once

#include "state/state_store.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace rocksdb {
class DB;
} // namespace rocksdb

namespace cstate::persistence {

// ── RocksDbStateStore ────────────────────────────────────────────────────────
//
// PersistentStateStore that keeps one session's dictionary server-side in
// RocksDB.  Entries live under `<session>/<key>`; persist replaces the whole
// prefix in a single WriteBatch, so a reader sees either the previous round's
// state or the new one, never a mix.
//
// RocksDB calls are synchronous; the awaitables complete without suspending.

class RocksDbStateStore final : public PersistentStateStore {
public:
    // Opens (or creates) the database at `db_path`.  Throws
    // std::invalid_argument on an empty session or one containing '/', and
    // std::runtime_error if the database cannot be opened.
    RocksDbStateStore(const std::filesystem::path& db_path, std::string session);

    ~RocksDbStateStore() override;

    RocksDbStateStore(const RocksDbStateStore&)            = delete;
    RocksDbStateStore& operator=(const RocksDbStateStore&) = delete;

    // Throws std::runtime_error on a read failure.
    [[nodiscard]] boost::asio::awaitable<StateDictionary>
    get_persisted_state() override;

    // Throws std::runtime_error if the batch cannot be written.
    boost::asio::awaitable<void>
    persist_state(const StateSnapshot& state) override;

    // Drop everything stored for this session.
    void clear();

    [[nodiscard]] const std::string& session() const noexcept { return session_; }

private:
    [[nodiscard]] StateDictionary read_all() const;

    std::string session_;
    std::string prefix_;   // "<session>/"
    std::string limit_;    // "<session>0", first key past the prefix
    std::unique_ptr<rocksdb::DB> db_;
};

} // namespace cstate::persistence
