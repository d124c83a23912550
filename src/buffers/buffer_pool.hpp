#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace cstate {

// ── BufferPool ───────────────────────────────────────────────────────────────
//
// Recycles byte blocks used as serialization scratch space.
//
// Blocks come in power-of-two size classes from kMinBlockSize up to
// kMaxPooledBlockSize.  Larger requests are served by a plain allocation and
// freed on release.  Each size class keeps at most kMaxBlocksPerClass idle
// blocks; surplus blocks are freed.
//
// Thread-safe: acquire()/release() serialise on an internal mutex so a single
// process-wide pool (shared()) can back many sessions.

class BufferPool {
public:
    static constexpr std::size_t kMinBlockSize       = 256;
    static constexpr std::size_t kMaxPooledBlockSize = std::size_t{1} << 20;  // 1 MiB
    static constexpr std::size_t kMaxBlocksPerClass  = 32;
    static constexpr std::size_t kSizeClasses        = 13;  // 256 B .. 1 MiB

    struct Block {
        std::unique_ptr<uint8_t[]> data;
        std::size_t capacity = 0;

        [[nodiscard]] explicit operator bool() const noexcept { return data != nullptr; }
    };

    BufferPool() = default;

    BufferPool(const BufferPool&)            = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    // Process-wide pool.
    static BufferPool& shared();

    // Returns a block whose capacity is `min_size` rounded up to a power of
    // two (and at least kMinBlockSize).  Contents are unspecified.
    [[nodiscard]] Block acquire(std::size_t min_size);

    // Returns `block` to the pool.  Releasing an empty block is a no-op.
    void release(Block block) noexcept;

    // Number of blocks handed out and not yet released.
    [[nodiscard]] std::size_t outstanding() const;

    // Number of idle blocks currently cached.
    [[nodiscard]] std::size_t idle() const;

    // Smallest power of two >= max(n, kMinBlockSize).
    [[nodiscard]] static std::size_t round_up(std::size_t n) noexcept;

private:
    [[nodiscard]] static std::size_t class_index(std::size_t capacity) noexcept;

    mutable std::mutex mutex_;
    std::array<std::vector<Block>, kSizeClasses> free_lists_;
    std::size_t outstanding_ = 0;
};

} // namespace cstate
