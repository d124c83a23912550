#include "common/cli_config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/data_protector.hpp"
#include "crypto/key_ring.hpp"
#include "persistence/protected_state_store.hpp"
#include "persistence/rocksdb_state_store.hpp"
#include "state/render_host.hpp"
#include "state/state_lifecycle_manager.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace {

// Run `work` on `ioc` until it finishes, rethrowing whatever it threw.
void run_to_completion(asio::io_context& ioc, asio::awaitable<void> work) {
    std::exception_ptr failure;
    asio::co_spawn(ioc, std::move(work),
                   [&failure](std::exception_ptr e) { failure = std::move(e); });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

[[nodiscard]] std::shared_ptr<const cstate::crypto::KeyRing>
load_key_ring(const std::string& path) {
    auto ring = std::make_shared<cstate::crypto::KeyRing>();
    if (auto ec = cstate::crypto::KeyRing::load(path, *ring)) {
        throw std::runtime_error("Cannot load key ring " + path + ": " + ec.message());
    }
    if (ring->active() == nullptr) {
        throw std::runtime_error("Key ring " + path + " has no active key");
    }
    return ring;
}

[[nodiscard]] std::string read_transport(const std::string& path) {
    std::string text;
    if (path.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin),
                    std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open " + path);
        }
        text.assign(std::istreambuf_iterator<char>(in),
                    std::istreambuf_iterator<char>());
    }
    // Tolerate the trailing newline a shell pipeline adds.
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

void write_transport(const std::string& path, const std::string& text) {
    if (path.empty()) {
        fprintf(stdout, "%s\n", text.c_str());
        return;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out || !(out << text << '\n')) {
        throw std::runtime_error("Cannot write " + path);
    }
}

// ── keygen ────────────────────────────────────────────────────────────────────

int run_keygen(const cstate::CliConfig& cfg) {
    cstate::crypto::KeyRing ring;
    if (fs::exists(cfg.key_ring)) {
        if (auto ec = cstate::crypto::KeyRing::load(cfg.key_ring, ring)) {
            spdlog::error("cstate-cli: cannot load {}: {}", cfg.key_ring, ec.message());
            return 1;
        }
    }

    const auto& key = ring.rotate();
    if (auto ec = ring.save(cfg.key_ring)) {
        spdlog::error("cstate-cli: cannot save {}: {}", cfg.key_ring, ec.message());
        return 1;
    }

    fprintf(stdout, "active key %s (%zu keys in %s)\n",
            cstate::crypto::KeyRing::to_hex(key.id).c_str(), ring.size(),
            cfg.key_ring.c_str());
    return 0;
}

// ── persist ───────────────────────────────────────────────────────────────────

int run_persist(const cstate::CliConfig& cfg) {
    // Reject bad JSON before the session starts.
    std::vector<std::pair<std::string, nlohmann::json>> entries;
    for (const auto& [key, text] : cfg.sets) {
        try {
            entries.emplace_back(key, nlohmann::json::parse(text));
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::error("cstate-cli: --set {}: invalid JSON: {}", key, e.what());
            return 1;
        }
    }

    asio::io_context ioc;
    cstate::StrandRenderHost host(ioc);
    cstate::StateLifecycleManager manager(
        cstate::make_component_logger("lifecycle", cstate::parse_log_level(cfg.log_level)));

    manager.state().register_on_persisting(
        [&manager, &entries]() -> asio::awaitable<void> {
            for (const auto& [key, value] : entries) {
                manager.state().persist_as_json(key, value);
            }
            co_return;
        },
        "cli-entries");

    if (cfg.engine == "rocksdb") {
        cstate::persistence::RocksDbStateStore store(cfg.data_dir, cfg.session);
        run_to_completion(ioc, manager.persist_state(store, host));
        fprintf(stdout, "persisted %zu entries to session '%s'\n",
                entries.size(), cfg.session.c_str());
        return 0;
    }

    cstate::crypto::KeyRingProtectionProvider provider(load_key_ring(cfg.key_ring));
    cstate::persistence::ProtectedStateStore store(provider, cfg.purpose);
    run_to_completion(ioc, manager.persist_state(store, host));

    write_transport(cfg.out, store.persisted_state().value_or(std::string{}));
    return 0;
}

// ── restore ───────────────────────────────────────────────────────────────────

void print_takes(cstate::PersistentState& state, const std::vector<std::string>& takes) {
    for (const auto& key : takes) {
        auto value = state.try_take_as_json<nlohmann::json>(key);
        if (value) {
            fprintf(stdout, "%s=%s\n", key.c_str(), value->dump().c_str());
        } else {
            fprintf(stdout, "%s: not found\n", key.c_str());
        }
    }
}

int run_restore(const cstate::CliConfig& cfg) {
    asio::io_context ioc;
    cstate::StateLifecycleManager manager(
        cstate::make_component_logger("lifecycle", cstate::parse_log_level(cfg.log_level)));

    if (cfg.engine == "rocksdb") {
        cstate::persistence::RocksDbStateStore store(cfg.data_dir, cfg.session);
        run_to_completion(ioc, manager.restore_state(store));
    } else {
        cstate::crypto::KeyRingProtectionProvider provider(load_key_ring(cfg.key_ring));
        cstate::persistence::ProtectedStateStore store(read_transport(cfg.in), provider,
                                                       cfg.purpose);
        run_to_completion(ioc, manager.restore_state(store));
    }

    spdlog::debug("cstate-cli: restored {} entries", manager.state().restored_count());
    print_takes(manager.state(), cfg.takes);
    return 0;
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    cstate::CliConfig cfg;
    try {
        cfg = cstate::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    cstate::init_default_logger(cstate::parse_log_level(cfg.log_level));
    spdlog::debug("cstate-cli {} (engine={})", cfg.command, cfg.engine);

    try {
        if (cfg.command == "keygen")  return run_keygen(cfg);
        if (cfg.command == "persist") return run_persist(cfg);
        return run_restore(cfg);
    } catch (const cstate::AuthenticationError& e) {
        spdlog::error("cstate-cli: state rejected: {}", e.what());
        return 2;
    } catch (const cstate::StateError& e) {
        spdlog::error("cstate-cli: {} error: {}", cstate::to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("cstate-cli: exception: {}", e.what());
        return 1;
    }
}
