#pragma once

#include "buffers/buffer_pool.hpp"
#include "common/bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace cstate {

// ── PooledBufferWriter ───────────────────────────────────────────────────────
//
// Growable byte sink backed by a BufferPool block.  Growth acquires the next
// power-of-two block, copies the written prefix and returns the old block.
//
// The writer owns its block exclusively.  release() hands the block back to
// the pool (idempotent); the destructor calls it, so every exit path returns
// memory.  Views obtained from written() are invalidated by any further write
// and by release().
//
// Not thread-safe.

class PooledBufferWriter {
public:
    static constexpr std::size_t kDefaultInitialCapacity = BufferPool::kMinBlockSize;

    explicit PooledBufferWriter(BufferPool& pool = BufferPool::shared(),
                                std::size_t initial_capacity = kDefaultInitialCapacity);

    // Starts with a copy of `initial` already written.
    explicit PooledBufferWriter(ByteView initial,
                                BufferPool& pool = BufferPool::shared());

    ~PooledBufferWriter();

    PooledBufferWriter(const PooledBufferWriter&)            = delete;
    PooledBufferWriter& operator=(const PooledBufferWriter&) = delete;

    PooledBufferWriter(PooledBufferWriter&& other) noexcept;
    PooledBufferWriter& operator=(PooledBufferWriter&& other) noexcept;

    // Append bytes.  Throws std::logic_error after release().
    void write(ByteView bytes);
    void write(std::string_view text) { write(as_bytes(text)); }
    void write_u8(uint8_t v);
    void write_u16_le(uint16_t v);
    void write_u32_le(uint32_t v);

    // Returns writable space of at least `size_hint` bytes (at least one byte
    // when 0).  Must be followed by advance() with the number of bytes used.
    [[nodiscard]] std::span<uint8_t> get_span(std::size_t size_hint = 0);

    // Commit `count` bytes previously written through get_span().
    // Throws std::out_of_range if count exceeds the available space.
    void advance(std::size_t count);

    [[nodiscard]] ByteView written() const noexcept {
        return {block_.data.get(), written_};
    }
    [[nodiscard]] std::size_t written_count() const noexcept { return written_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return block_.capacity; }
    [[nodiscard]] bool released() const noexcept { return !block_; }

    // Forget written bytes, keep the block.
    void clear() noexcept { written_ = 0; }

    // Return the block to the pool.  Safe to call more than once.
    void release() noexcept;

private:
    void ensure_capacity(std::size_t additional);

    BufferPool* pool_;
    BufferPool::Block block_;
    std::size_t written_ = 0;
};

} // namespace cstate
