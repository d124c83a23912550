#include "crypto/key_ring.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/rand.h>

#include <spdlog/spdlog.h>

#include "protection.pb.h"

namespace cstate::crypto {

namespace {

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read the whole file at `path` into `out`.
[[nodiscard]] std::error_code read_file(const std::filesystem::path& path,
                                        std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return {errno, std::system_category()};
    }

    out.clear();
    char chunk[4096];
    for (;;) {
        auto n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = std::error_code{errno, std::system_category()};
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        out.append(chunk, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return {};
}

[[nodiscard]] Bytes random_bytes(std::size_t n) {
    Bytes out(n);
    if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
        throw std::runtime_error("KeyRing: RAND_bytes failed");
    }
    return out;
}

[[nodiscard]] int64_t now_unix_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

// ── Key management ───────────────────────────────────────────────────────────

const KeyRing::Key& KeyRing::rotate() {
    Key key;
    auto id = random_bytes(kKeyIdSize);
    key.id.assign(id.begin(), id.end());
    key.material = random_bytes(kKeySize);
    key.created_unix_ms = now_unix_ms();

    add(std::move(key), true);
    spdlog::info("KeyRing: rotated, active key {}", to_hex(active_id_));
    return keys_.back();
}

void KeyRing::add(Key key, bool make_active) {
    if (key.id.size() != kKeyIdSize) {
        throw std::invalid_argument("KeyRing: key id must be 16 bytes");
    }
    if (key.material.size() != kKeySize) {
        throw std::invalid_argument("KeyRing: key material must be 32 bytes");
    }
    if (find(key.id) != nullptr) {
        throw std::invalid_argument("KeyRing: duplicate key id " + to_hex(key.id));
    }

    if (make_active || active_id_.empty()) {
        active_id_ = key.id;
    }
    keys_.push_back(std::move(key));
}

const KeyRing::Key* KeyRing::active() const noexcept {
    return active_id_.empty() ? nullptr : find(active_id_);
}

const KeyRing::Key* KeyRing::find(std::string_view id) const noexcept {
    auto it = std::find_if(keys_.begin(), keys_.end(),
                           [id](const Key& k) { return k.id == id; });
    return it == keys_.end() ? nullptr : &*it;
}

std::string KeyRing::to_hex(std::string_view id) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(id.size() * 2);
    for (unsigned char c : id) {
        out.push_back(kDigits[c >> 4]);
        out.push_back(kDigits[c & 0x0F]);
    }
    return out;
}

// ── KeyRing::save ────────────────────────────────────────────────────────────

std::error_code KeyRing::save(const std::filesystem::path& path) const {
    KeyRingFile file;
    file.set_version(kFileVersion);
    file.set_active_key_id(active_id_);
    for (const auto& key : keys_) {
        auto* pk = file.add_keys();
        pk->set_key_id(key.id);
        pk->set_material(key.material.data(), key.material.size());
        pk->set_created_unix_ms(key.created_unix_ms);
    }

    std::string bytes;
    if (!file.SerializeToString(&bytes)) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("KeyRing: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, bytes.data(), bytes.size());
    if (!ec && ::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
    }
    ::close(fd);
    if (ec) {
        spdlog::error("KeyRing: write failed: {}", ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return ec;
    }

    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("KeyRing: rename failed: {}", rename_ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return rename_ec;
    }

    spdlog::info("KeyRing: saved {} keys to {}", keys_.size(), path.string());
    return {};
}

// ── KeyRing::load ────────────────────────────────────────────────────────────

std::error_code KeyRing::load(const std::filesystem::path& path, KeyRing& result) {
    std::string bytes;
    if (auto ec = read_file(path, bytes)) {
        spdlog::error("KeyRing: failed to read {}: {}", path.string(), ec.message());
        return ec;
    }

    KeyRingFile file;
    if (!file.ParseFromString(bytes)) {
        spdlog::error("KeyRing: {} is not a key ring file", path.string());
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (file.version() != kFileVersion) {
        spdlog::error("KeyRing: unsupported version {}", file.version());
        return std::make_error_code(std::errc::invalid_argument);
    }

    KeyRing ring;
    try {
        for (const auto& pk : file.keys()) {
            Key key;
            key.id = pk.key_id();
            key.material.assign(pk.material().begin(), pk.material().end());
            key.created_unix_ms = pk.created_unix_ms();
            ring.add(std::move(key), pk.key_id() == file.active_key_id());
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("KeyRing: invalid key in {}: {}", path.string(), e.what());
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (!file.active_key_id().empty() && ring.find(file.active_key_id()) == nullptr) {
        spdlog::error("KeyRing: active key {} missing from {}",
                      to_hex(file.active_key_id()), path.string());
        return std::make_error_code(std::errc::invalid_argument);
    }

    result = std::move(ring);
    spdlog::debug("KeyRing: loaded {} keys from {}", result.size(), path.string());
    return {};
}

} // namespace cstate::crypto
