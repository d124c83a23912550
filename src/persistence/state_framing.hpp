#pragma once

#include "buffers/buffer_pool.hpp"
#include "buffers/pooled_buffer_writer.hpp"
#include "common/bytes.hpp"
#include "state/state_store.hpp"

#include <cstddef>
#include <cstdint>

namespace cstate::persistence {

// ── Framing constants ────────────────────────────────────────────────────────

static constexpr char kFrameMagic[] = "CSTF";            // 4 bytes (no NUL)
static constexpr std::size_t kFrameMagicSize = 4;
static constexpr uint16_t kFrameVersion = 1;
static constexpr std::size_t kFrameHeaderSize =
    kFrameMagicSize + sizeof(uint16_t) + sizeof(uint32_t);   // 10 bytes
static constexpr std::size_t kFrameTrailerSize = sizeof(uint32_t);

// ── State framing ────────────────────────────────────────────────────────────
//
// Self-describing binary encoding of a whole state dictionary:
//
//   [magic: "CSTF" (4B)][version: u16 LE = 1][entry_count: u32 LE]
//     [key_length: u32 LE][key][payload_length: u32 LE][payload] × entry_count
//   [crc32: u32 LE]     // CRC of everything from magic through last payload
//
// Lengths are explicit so keys and payloads may hold any byte value.  Entry
// order follows the input map's iteration order and is not part of the
// contract.

// Frame `state` into a pooled buffer.  Throws std::length_error if a key,
// payload or the entry count does not fit in 32 bits.
[[nodiscard]] PooledBufferWriter serialize_state(
    const StateSnapshot& state,
    BufferPool& pool = BufferPool::shared());

// Inverse of serialize_state().  Throws MalformedStateError on bad magic or
// version, truncation, lengths running past the end, trailing bytes, a
// duplicated key or a CRC mismatch.
[[nodiscard]] StateDictionary deserialize_state(ByteView framed);

} // namespace cstate::persistence
