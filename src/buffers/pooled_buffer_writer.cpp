#include "buffers/pooled_buffer_writer.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace cstate {

PooledBufferWriter::PooledBufferWriter(BufferPool& pool,
                                       std::size_t initial_capacity)
    : pool_(&pool)
    , block_(pool.acquire(initial_capacity))
{}

PooledBufferWriter::PooledBufferWriter(ByteView initial, BufferPool& pool)
    : pool_(&pool)
    , block_(pool.acquire(initial.size()))
{
    write(initial);
}

PooledBufferWriter::~PooledBufferWriter() {
    release();
}

PooledBufferWriter::PooledBufferWriter(PooledBufferWriter&& other) noexcept
    : pool_(other.pool_)
    , block_(std::move(other.block_))
    , written_(std::exchange(other.written_, 0))
{
    other.block_.capacity = 0;
}

PooledBufferWriter& PooledBufferWriter::operator=(PooledBufferWriter&& other) noexcept {
    if (this != &other) {
        release();
        pool_    = other.pool_;
        block_   = std::move(other.block_);
        written_ = std::exchange(other.written_, 0);
        other.block_.capacity = 0;
    }
    return *this;
}

void PooledBufferWriter::write(ByteView bytes) {
    if (bytes.empty()) {
        if (released()) {
            throw std::logic_error("PooledBufferWriter: write after release");
        }
        return;
    }
    ensure_capacity(bytes.size());
    std::memcpy(block_.data.get() + written_, bytes.data(), bytes.size());
    written_ += bytes.size();
}

void PooledBufferWriter::write_u8(uint8_t v) {
    ensure_capacity(1);
    block_.data[written_++] = v;
}

void PooledBufferWriter::write_u16_le(uint16_t v) {
    ensure_capacity(2);
    block_.data[written_++] = static_cast<uint8_t>(v);
    block_.data[written_++] = static_cast<uint8_t>(v >> 8);
}

void PooledBufferWriter::write_u32_le(uint32_t v) {
    ensure_capacity(4);
    for (int i = 0; i < 4; ++i) {
        block_.data[written_++] = static_cast<uint8_t>(v >> (i * 8));
    }
}

std::span<uint8_t> PooledBufferWriter::get_span(std::size_t size_hint) {
    ensure_capacity(size_hint == 0 ? 1 : size_hint);
    return {block_.data.get() + written_, block_.capacity - written_};
}

void PooledBufferWriter::advance(std::size_t count) {
    if (released()) {
        throw std::logic_error("PooledBufferWriter: advance after release");
    }
    if (count > block_.capacity - written_) {
        throw std::out_of_range("PooledBufferWriter: advanced past the end of the buffer");
    }
    written_ += count;
}

void PooledBufferWriter::release() noexcept {
    if (block_) {
        pool_->release(std::move(block_));
    }
    block_.capacity = 0;
    written_ = 0;
}

void PooledBufferWriter::ensure_capacity(std::size_t additional) {
    if (released()) {
        throw std::logic_error("PooledBufferWriter: write after release");
    }
    if (block_.capacity - written_ >= additional) {
        return;
    }

    auto grown = pool_->acquire(written_ + additional);
    std::memcpy(grown.data.get(), block_.data.get(), written_);
    pool_->release(std::exchange(block_, std::move(grown)));
}

} // namespace cstate
