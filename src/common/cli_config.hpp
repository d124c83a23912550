#pragma once

#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

namespace cstate {

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Configuration for one cstate-cli invocation.
// Populated by parse_config() from CLI arguments.

struct CliConfig {
    std::string command;            // "keygen", "persist" or "restore"
    std::string key_ring;           // Path to the key ring file
    std::string purpose;            // Data protection purpose string
    std::string in;                 // Transport string input ("" = stdin)
    std::string out;                // Transport string output ("" = stdout)
    std::string engine;             // "memory" (transport string) or "rocksdb"
    std::string data_dir;           // RocksDB directory (engine=rocksdb)
    std::string session;            // RocksDB session prefix (engine=rocksdb)
    std::string log_level;          // spdlog level string

    std::vector<std::pair<std::string, std::string>> sets;   // --set key=json
    std::vector<std::string> takes;                          // --take key
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, with the help text as the message.
//
// Validates:
//   - command is keygen|persist|restore
//   - engine is memory|rocksdb
//   - --key-ring is given for keygen, and for persist/restore with engine=memory
//   - --data-dir and --session are non-empty with engine=rocksdb
//   - every --set has the form key=json, and no key is set twice
//   - --set only with persist, --take only with restore
//
// Example:
//   cstate-cli persist --key-ring keys.bin --set count=42 --set 'user={"n":1}'

[[nodiscard]] CliConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with cstate-cli
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace cstate
