#include "persistence/state_framing.hpp"

#include "common/crc32.hpp"
#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace cstate::persistence {

namespace {

// Build a frame by hand, appending a valid CRC over `body`.
[[nodiscard]] Bytes seal(Bytes body) {
    const uint32_t crc = crc32(body.data(), body.size());
    for (int i = 0; i < 4; ++i) {
        body.push_back(static_cast<uint8_t>(crc >> (i * 8)));
    }
    return body;
}

void put_u32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

[[nodiscard]] Bytes header(uint32_t count, uint16_t version = kFrameVersion) {
    Bytes out{'C', 'S', 'T', 'F'};
    out.push_back(static_cast<uint8_t>(version));
    out.push_back(static_cast<uint8_t>(version >> 8));
    put_u32(out, count);
    return out;
}

void put_entry(Bytes& out, std::string_view key, std::string_view payload) {
    put_u32(out, static_cast<uint32_t>(key.size()));
    out.insert(out.end(), key.begin(), key.end());
    put_u32(out, static_cast<uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
}

[[nodiscard]] Bytes frame_of(const StateDictionary& dict, BufferPool& pool) {
    auto writer = serialize_state(to_snapshot(dict), pool);
    const auto view = writer.written();
    return Bytes(view.begin(), view.end());
}

} // anonymous namespace

// ── Fixture ──────────────────────────────────────────────────────────────────

class StateFramingTest : public ::testing::Test {
protected:
    BufferPool pool_;
};

// ── Round trip ───────────────────────────────────────────────────────────────

TEST_F(StateFramingTest, EmptyStateRoundTrips) {
    const auto framed = frame_of({}, pool_);
    EXPECT_EQ(framed.size(), kFrameHeaderSize + kFrameTrailerSize);
    EXPECT_TRUE(deserialize_state(ByteView{framed}).empty());
}

TEST_F(StateFramingTest, ArbitraryKeysAndPayloadsRoundTrip) {
    Bytes length_like{0x04, 0x00, 0x00, 0x00, 'C', 'S', 'T', 'F'};
    Bytes all_bytes;
    for (int i = 0; i < 256; ++i) {
        all_bytes.push_back(static_cast<uint8_t>(i));
    }

    const StateDictionary input{
        {"", to_bytes("empty key")},
        {"empty-payload", Bytes{}},
        {"length-like", length_like},
        {"all-bytes", all_bytes},
        {std::string("nul\0key", 7), to_bytes("binary key")},
        {"unicode-\xC3\xA9", to_bytes("{\"n\":1}")},
    };

    const auto framed = frame_of(input, pool_);
    EXPECT_EQ(deserialize_state(ByteView{framed}), input);
}

TEST_F(StateFramingTest, LargePayloadRoundTrips) {
    Bytes big(300 * 1024, 0x5A);
    const StateDictionary input{{"big", big}};
    const auto framed = frame_of(input, pool_);
    EXPECT_EQ(deserialize_state(ByteView{framed}), input);
}

TEST_F(StateFramingTest, HandBuiltFrameDecodes) {
    auto body = header(2);
    put_entry(body, "a", "1");
    put_entry(body, "b", "");
    const auto framed = seal(std::move(body));

    const auto dict = deserialize_state(ByteView{framed});
    ASSERT_EQ(dict.size(), 2u);
    EXPECT_EQ(dict.at("a"), to_bytes("1"));
    EXPECT_TRUE(dict.at("b").empty());
}

TEST_F(StateFramingTest, SerializeReleasesNothingUntilWriterDies) {
    {
        auto writer = serialize_state(to_snapshot({{"k", to_bytes("v")}}), pool_);
        EXPECT_EQ(pool_.outstanding(), 1u);
    }
    EXPECT_EQ(pool_.outstanding(), 0u);
}

// ── Malformed input ──────────────────────────────────────────────────────────

TEST_F(StateFramingTest, TooSmallIsMalformed) {
    const Bytes tiny{'C', 'S', 'T'};
    EXPECT_THROW(deserialize_state(ByteView{tiny}), MalformedStateError);
    EXPECT_THROW(deserialize_state(ByteView{}), MalformedStateError);
}

TEST_F(StateFramingTest, BadMagicIsMalformed) {
    auto body = header(0);
    body[0] = 'X';
    const auto framed = seal(std::move(body));
    EXPECT_THROW(deserialize_state(ByteView{framed}), MalformedStateError);
}

TEST_F(StateFramingTest, UnknownVersionIsMalformed) {
    const auto framed = seal(header(0, 2));
    EXPECT_THROW(deserialize_state(ByteView{framed}), MalformedStateError);
}

TEST_F(StateFramingTest, FlippedBitFailsCrc) {
    auto framed = frame_of({{"key", to_bytes("payload")}}, pool_);
    framed[kFrameHeaderSize + 5] ^= 0x01;
    try {
        (void)deserialize_state(ByteView{framed});
        FAIL() << "expected MalformedStateError";
    } catch (const MalformedStateError& e) {
        EXPECT_NE(std::string(e.what()).find("CRC"), std::string::npos);
    }
}

TEST_F(StateFramingTest, TruncatedFrameIsMalformed) {
    const auto framed = frame_of({{"key", to_bytes("payload")}}, pool_);
    for (std::size_t len = 0; len < framed.size(); ++len) {
        const ByteView prefix{framed.data(), len};
        EXPECT_THROW(deserialize_state(prefix), MalformedStateError) << "len=" << len;
    }
}

TEST_F(StateFramingTest, CountLargerThanEntriesIsMalformed) {
    auto body = header(2);
    put_entry(body, "a", "1");
    const auto framed = seal(std::move(body));
    EXPECT_THROW(deserialize_state(ByteView{framed}), MalformedStateError);
}

TEST_F(StateFramingTest, LengthPastEndIsMalformed) {
    auto body = header(1);
    put_u32(body, 1);
    body.push_back('k');
    put_u32(body, 1000);   // claims far more payload than present
    body.push_back('x');
    const auto framed = seal(std::move(body));
    EXPECT_THROW(deserialize_state(ByteView{framed}), MalformedStateError);
}

TEST_F(StateFramingTest, TrailingBytesAreMalformed) {
    auto body = header(1);
    put_entry(body, "a", "1");
    body.push_back(0x00);
    const auto framed = seal(std::move(body));
    EXPECT_THROW(deserialize_state(ByteView{framed}), MalformedStateError);
}

TEST_F(StateFramingTest, DuplicateKeyInFrameIsMalformed) {
    auto body = header(2);
    put_entry(body, "a", "1");
    put_entry(body, "a", "2");
    const auto framed = seal(std::move(body));
    EXPECT_THROW(deserialize_state(ByteView{framed}), MalformedStateError);
}

} // namespace cstate::persistence
