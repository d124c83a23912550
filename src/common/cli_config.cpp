#include "common/cli_config.hpp"

#include "persistence/protected_state_store.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace cstate {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Split one --set argument at the first '='.  The key may be empty; the JSON
// text may not.
[[nodiscard]] std::pair<std::string, std::string> parse_set(std::string_view arg) {
    auto eq = arg.find('=');
    if (eq == std::string_view::npos) {
        throw std::runtime_error(
            fmt::format("Malformed --set (expected key=json): '{}'", arg));
    }
    auto value = arg.substr(eq + 1);
    if (value.empty()) {
        throw std::runtime_error(
            fmt::format("--set '{}' has an empty value", arg));
    }
    return {std::string(arg.substr(0, eq)), std::string(value)};
}

// Validate the fully populated CliConfig.
void validate(const CliConfig& cfg) {
    if (cfg.command != "keygen" && cfg.command != "persist" &&
        cfg.command != "restore") {
        throw std::runtime_error(fmt::format(
            "Command must be 'keygen', 'persist' or 'restore', got '{}'", cfg.command));
    }

    if (cfg.engine != "memory" && cfg.engine != "rocksdb") {
        throw std::runtime_error(
            fmt::format("--engine must be 'memory' or 'rocksdb', got '{}'", cfg.engine));
    }

    const bool needs_key_ring =
        cfg.command == "keygen" || cfg.engine == "memory";
    if (needs_key_ring && cfg.key_ring.empty()) {
        throw std::runtime_error(
            fmt::format("--key-ring is required for '{}'", cfg.command));
    }

    if (cfg.purpose.empty()) {
        throw std::runtime_error("--purpose must not be empty");
    }

    if (cfg.engine == "rocksdb") {
        if (cfg.data_dir.empty()) {
            throw std::runtime_error("--data-dir must not be empty");
        }
        if (cfg.session.empty() || cfg.session.find('/') != std::string::npos) {
            throw std::runtime_error("--session must be non-empty and contain no '/'");
        }
    }

    if (!cfg.sets.empty() && cfg.command != "persist") {
        throw std::runtime_error("--set is only valid with 'persist'");
    }
    if (!cfg.takes.empty() && cfg.command != "restore") {
        throw std::runtime_error("--take is only valid with 'restore'");
    }

    // No key may be set twice.
    for (std::size_t i = 0; i < cfg.sets.size(); ++i) {
        for (std::size_t j = i + 1; j < cfg.sets.size(); ++j) {
            if (cfg.sets[i].first == cfg.sets[j].first) {
                throw std::runtime_error(fmt::format(
                    "Duplicate --set key '{}'", cfg.sets[i].first));
            }
        }
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("command",
            po::value<std::string>()->required(),
            "keygen | persist | restore")
        ("key-ring,k",
            po::value<std::string>()->default_value(""),
            "Key ring file (created or rotated by keygen)")
        ("purpose",
            po::value<std::string>()->default_value(
                persistence::ProtectedStateStore::kPurpose),
            "Data protection purpose string")
        ("set,s",
            po::value<std::vector<std::string>>()->composing(),
            "key=json entry to persist (repeatable)")
        ("take,t",
            po::value<std::vector<std::string>>()->composing(),
            "Key to restore and print (repeatable)")
        ("in,i",
            po::value<std::string>()->default_value(""),
            "Read the transport string from this file instead of stdin")
        ("out,o",
            po::value<std::string>()->default_value(""),
            "Write the transport string to this file instead of stdout")
        ("engine",
            po::value<std::string>()->default_value("memory"),
            "State store: memory (transport string, default) or rocksdb")
        ("data-dir",
            po::value<std::string>()->default_value("./cstate-data"),
            "RocksDB directory (engine=rocksdb)")
        ("session",
            po::value<std::string>()->default_value("default"),
            "Session name (engine=rocksdb)")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── parse_config ──────────────────────────────────────────────────────────────

CliConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("cstate-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so a missing command doesn't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: cstate-cli <keygen|persist|restore> [options]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    CliConfig cfg;
    cfg.command   = vm["command"].as<std::string>();
    cfg.key_ring  = vm["key-ring"].as<std::string>();
    cfg.purpose   = vm["purpose"].as<std::string>();
    cfg.in        = vm["in"].as<std::string>();
    cfg.out       = vm["out"].as<std::string>();
    cfg.engine    = vm["engine"].as<std::string>();
    cfg.data_dir  = vm["data-dir"].as<std::string>();
    cfg.session   = vm["session"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();

    if (vm.count("set")) {
        for (const auto& arg : vm["set"].as<std::vector<std::string>>()) {
            cfg.sets.push_back(parse_set(arg));
        }
    }
    if (vm.count("take")) {
        cfg.takes = vm["take"].as<std::vector<std::string>>();
    }

    validate(cfg);
    return cfg;
}

} // namespace cstate
