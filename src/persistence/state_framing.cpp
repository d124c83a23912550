#include "persistence/state_framing.hpp"

#include "common/crc32.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace cstate::persistence {

namespace {

constexpr std::size_t kMaxLength = std::numeric_limits<uint32_t>::max();

// Read helpers: return false if not enough data.
bool read_u16_le(const uint8_t*& ptr, const uint8_t* end, uint16_t& out) {
    if (end - ptr < 2) return false;
    out = static_cast<uint16_t>(ptr[0]) |
          (static_cast<uint16_t>(ptr[1]) << 8);
    ptr += 2;
    return true;
}

bool read_u32_le(const uint8_t*& ptr, const uint8_t* end, uint32_t& out) {
    if (end - ptr < 4) return false;
    out = static_cast<uint32_t>(ptr[0]) |
          (static_cast<uint32_t>(ptr[1]) << 8) |
          (static_cast<uint32_t>(ptr[2]) << 16) |
          (static_cast<uint32_t>(ptr[3]) << 24);
    ptr += 4;
    return true;
}

// Read a u32 length followed by that many bytes.
bool read_block(const uint8_t*& ptr, const uint8_t* end, std::string& out) {
    uint32_t len = 0;
    if (!read_u32_le(ptr, end, len)) return false;
    if (static_cast<std::size_t>(end - ptr) < len) return false;
    out.assign(reinterpret_cast<const char*>(ptr), len);
    ptr += len;
    return true;
}

bool read_block(const uint8_t*& ptr, const uint8_t* end, Bytes& out) {
    uint32_t len = 0;
    if (!read_u32_le(ptr, end, len)) return false;
    if (static_cast<std::size_t>(end - ptr) < len) return false;
    out.assign(ptr, ptr + len);
    ptr += len;
    return true;
}

} // anonymous namespace

// ── serialize_state ──────────────────────────────────────────────────────────

PooledBufferWriter serialize_state(const StateSnapshot& state, BufferPool& pool) {
    if (state.size() > kMaxLength) {
        throw std::length_error("serialize_state: too many entries");
    }

    std::size_t estimate = kFrameHeaderSize + kFrameTrailerSize;
    for (const auto& [key, payload] : state) {
        estimate += 8 + key.size() + payload.size();
    }

    PooledBufferWriter out(pool, estimate);
    out.write(std::string_view{kFrameMagic, kFrameMagicSize});
    out.write_u16_le(kFrameVersion);
    out.write_u32_le(static_cast<uint32_t>(state.size()));

    for (const auto& [key, payload] : state) {
        if (key.size() > kMaxLength || payload.size() > kMaxLength) {
            throw std::length_error("serialize_state: entry '" + key +
                                    "' exceeds 4 GiB");
        }
        out.write_u32_le(static_cast<uint32_t>(key.size()));
        out.write(std::string_view{key});
        out.write_u32_le(static_cast<uint32_t>(payload.size()));
        out.write(payload);
    }

    const auto body = out.written();
    out.write_u32_le(crc32(body.data(), body.size()));
    return out;
}

// ── deserialize_state ────────────────────────────────────────────────────────

StateDictionary deserialize_state(ByteView framed) {
    if (framed.size() < kFrameHeaderSize + kFrameTrailerSize) {
        throw MalformedStateError("frame too small (" +
                                  std::to_string(framed.size()) + " bytes)");
    }

    const uint8_t* p   = framed.data();
    const uint8_t* end = framed.data() + framed.size() - kFrameTrailerSize;

    if (std::memcmp(p, kFrameMagic, kFrameMagicSize) != 0) {
        throw MalformedStateError("invalid magic");
    }
    p += kFrameMagicSize;

    uint16_t version = 0;
    uint32_t entry_count = 0;
    if (!read_u16_le(p, end, version) || !read_u32_le(p, end, entry_count)) {
        throw MalformedStateError("truncated header");
    }
    if (version != kFrameVersion) {
        throw MalformedStateError("unsupported version " + std::to_string(version));
    }

    // CRC first: a corrupted length must not be trusted for bounds.
    const uint8_t* crc_ptr = end;
    uint32_t stored_crc = 0;
    if (!read_u32_le(crc_ptr, crc_ptr + kFrameTrailerSize, stored_crc)) {
        throw MalformedStateError("truncated at CRC");
    }
    const uint32_t computed_crc =
        crc32(framed.data(), framed.size() - kFrameTrailerSize);
    if (stored_crc != computed_crc) {
        throw MalformedStateError("CRC mismatch");
    }

    StateDictionary result;
    result.reserve(std::min<std::size_t>(entry_count, framed.size() / 8));

    for (uint32_t i = 0; i < entry_count; ++i) {
        std::string key;
        if (!read_block(p, end, key)) {
            throw MalformedStateError("truncated at entry " + std::to_string(i) + " key");
        }
        Bytes payload;
        if (!read_block(p, end, payload)) {
            throw MalformedStateError("truncated at entry " + std::to_string(i) + " payload");
        }
        if (!result.emplace(std::move(key), std::move(payload)).second) {
            throw MalformedStateError("duplicate key at entry " + std::to_string(i));
        }
    }

    if (p != end) {
        throw MalformedStateError(std::to_string(end - p) +
                                  " trailing bytes after last entry");
    }

    return result;
}

} // namespace cstate::persistence
