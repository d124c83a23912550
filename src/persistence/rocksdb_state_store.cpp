#include "persistence/rocksdb_state_store.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace cstate::persistence {

RocksDbStateStore::RocksDbStateStore(const std::filesystem::path& db_path,
                                     std::string session)
    : session_(std::move(session))
{
    if (session_.empty() || session_.find('/') != std::string::npos) {
        throw std::invalid_argument(
            "RocksDbStateStore: session must be non-empty and contain no '/'");
    }
    prefix_ = session_ + '/';
    limit_  = session_ + '0';   // '0' == '/' + 1

    rocksdb::Options options;
    options.create_if_missing = true;

    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::Open(options, db_path.string(), &raw_db);
    if (!status.ok()) {
        throw std::runtime_error(
            "Failed to open RocksDB at " + db_path.string() + ": " +
            status.ToString());
    }
    db_.reset(raw_db);
    spdlog::info("RocksDbStateStore: opened {} (session '{}')",
                 db_path.string(), session_);
}

RocksDbStateStore::~RocksDbStateStore() {
    if (db_) {
        spdlog::debug("RocksDbStateStore: closing");
    }
}

boost::asio::awaitable<StateDictionary> RocksDbStateStore::get_persisted_state() {
    co_return read_all();
}

boost::asio::awaitable<void> RocksDbStateStore::persist_state(const StateSnapshot& state) {
    rocksdb::WriteBatch batch;
    auto status = batch.DeleteRange(prefix_, limit_);
    if (!status.ok()) {
        throw std::runtime_error("RocksDbStateStore: DeleteRange failed: " +
                                 status.ToString());
    }
    for (const auto& [key, payload] : state) {
        const auto full_key = prefix_ + key;
        status = batch.Put(
            full_key,
            rocksdb::Slice{reinterpret_cast<const char*>(payload.data()), payload.size()});
        if (!status.ok()) {
            throw std::runtime_error("RocksDbStateStore: Put failed: " +
                                     status.ToString());
        }
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = true;
    status = db_->Write(write_options, &batch);
    if (!status.ok()) {
        spdlog::error("RocksDbStateStore: write failed for session '{}': {}",
                      session_, status.ToString());
        throw std::runtime_error("RocksDbStateStore: write failed: " +
                                 status.ToString());
    }
    spdlog::debug("RocksDbStateStore: persisted {} entries for session '{}'",
                  state.size(), session_);
    co_return;
}

void RocksDbStateStore::clear() {
    auto status = db_->DeleteRange(rocksdb::WriteOptions{},
                                   db_->DefaultColumnFamily(), prefix_, limit_);
    if (!status.ok()) {
        throw std::runtime_error("RocksDbStateStore: clear failed: " +
                                 status.ToString());
    }
}

StateDictionary RocksDbStateStore::read_all() const {
    StateDictionary result;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions{}));
    for (it->Seek(prefix_); it->Valid() && it->key().starts_with(prefix_); it->Next()) {
        auto key = it->key();
        key.remove_prefix(prefix_.size());
        auto value = it->value();
        result.emplace(key.ToString(),
                       Bytes(reinterpret_cast<const uint8_t*>(value.data()),
                             reinterpret_cast<const uint8_t*>(value.data()) + value.size()));
    }
    if (!it->status().ok()) {
        throw std::runtime_error("RocksDbStateStore: read failed: " +
                                 it->status().ToString());
    }
    return result;
}

} // namespace cstate::persistence
