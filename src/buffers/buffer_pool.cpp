#include "buffers/buffer_pool.hpp"

#include <bit>
#include <memory>

namespace cstate {

BufferPool& BufferPool::shared() {
    static BufferPool pool;
    return pool;
}

std::size_t BufferPool::round_up(std::size_t n) noexcept {
    if (n <= kMinBlockSize) {
        return kMinBlockSize;
    }
    return std::bit_ceil(n);
}

std::size_t BufferPool::class_index(std::size_t capacity) noexcept {
    // capacity is a power of two in [kMinBlockSize, kMaxPooledBlockSize].
    return static_cast<std::size_t>(std::countr_zero(capacity) -
                                    std::countr_zero(kMinBlockSize));
}

BufferPool::Block BufferPool::acquire(std::size_t min_size) {
    const std::size_t capacity = round_up(min_size);

    if (capacity <= kMaxPooledBlockSize) {
        std::lock_guard lock(mutex_);
        auto& list = free_lists_[class_index(capacity)];
        if (!list.empty()) {
            Block block = std::move(list.back());
            list.pop_back();
            ++outstanding_;
            return block;
        }
    }

    // Allocate outside the lock; a failed allocation leaves the count alone.
    Block block;
    block.data = std::make_unique_for_overwrite<uint8_t[]>(capacity);
    block.capacity = capacity;

    std::lock_guard lock(mutex_);
    ++outstanding_;
    return block;
}

void BufferPool::release(Block block) noexcept {
    if (!block) {
        return;
    }

    std::lock_guard lock(mutex_);
    if (outstanding_ > 0) {
        --outstanding_;
    }

    if (block.capacity > kMaxPooledBlockSize ||
        !std::has_single_bit(block.capacity) ||
        block.capacity < kMinBlockSize) {
        return;  // freed by Block's destructor
    }

    auto& list = free_lists_[class_index(block.capacity)];
    if (list.size() < kMaxBlocksPerClass) {
        list.push_back(std::move(block));
    }
}

std::size_t BufferPool::outstanding() const {
    std::lock_guard lock(mutex_);
    return outstanding_;
}

std::size_t BufferPool::idle() const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& list : free_lists_) {
        n += list.size();
    }
    return n;
}

} // namespace cstate
