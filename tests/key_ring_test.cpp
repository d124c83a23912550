#include "crypto/key_ring.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <sys/stat.h>

namespace cstate::crypto {

// ── Fixture ──────────────────────────────────────────────────────────────────

class KeyRingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("key_ring_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        path_ = test_dir_ / "keys.bin";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    [[nodiscard]] static KeyRing::Key make_key(char fill) {
        KeyRing::Key key;
        key.id = std::string(KeyRing::kKeyIdSize, fill);
        key.material = Bytes(KeyRing::kKeySize, static_cast<uint8_t>(fill));
        key.created_unix_ms = 1000;
        return key;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path path_;
};

// ── Key management ───────────────────────────────────────────────────────────

TEST_F(KeyRingTest, NewRingHasNoActiveKey) {
    KeyRing ring;
    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.active(), nullptr);
}

TEST_F(KeyRingTest, RotateAddsActiveKey) {
    KeyRing ring;
    const auto& first = ring.rotate();
    EXPECT_EQ(first.id.size(), KeyRing::kKeyIdSize);
    EXPECT_EQ(first.material.size(), KeyRing::kKeySize);
    EXPECT_GT(first.created_unix_ms, 0);
    const auto first_id = first.id;

    ring.rotate();
    ASSERT_EQ(ring.size(), 2u);
    ASSERT_NE(ring.active(), nullptr);
    EXPECT_NE(ring.active()->id, first_id);
    // The retired key is still available for unprotect.
    EXPECT_NE(ring.find(first_id), nullptr);
}

TEST_F(KeyRingTest, FirstAddedKeyBecomesActive) {
    KeyRing ring;
    ring.add(make_key('a'), false);
    ASSERT_NE(ring.active(), nullptr);
    EXPECT_EQ(ring.active()->id, std::string(16, 'a'));

    ring.add(make_key('b'), false);
    EXPECT_EQ(ring.active()->id, std::string(16, 'a'));
    ring.add(make_key('c'), true);
    EXPECT_EQ(ring.active()->id, std::string(16, 'c'));
}

TEST_F(KeyRingTest, AddRejectsBadKeys) {
    KeyRing ring;
    auto short_id = make_key('a');
    short_id.id.pop_back();
    EXPECT_THROW(ring.add(short_id, true), std::invalid_argument);

    auto short_material = make_key('a');
    short_material.material.pop_back();
    EXPECT_THROW(ring.add(short_material, true), std::invalid_argument);

    ring.add(make_key('a'), true);
    EXPECT_THROW(ring.add(make_key('a'), false), std::invalid_argument);
    EXPECT_EQ(ring.size(), 1u);
}

TEST_F(KeyRingTest, ToHex) {
    EXPECT_EQ(KeyRing::to_hex(std::string("\x00\xab\x10", 3)), "00ab10");
    EXPECT_EQ(KeyRing::to_hex(""), "");
}

// ── save / load ──────────────────────────────────────────────────────────────

TEST_F(KeyRingTest, SaveLoadRoundTrip) {
    KeyRing ring;
    ring.add(make_key('a'), false);
    ring.add(make_key('b'), true);
    ASSERT_FALSE(ring.save(path_));

    KeyRing loaded;
    auto ec = KeyRing::load(path_, loaded);
    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ(loaded.size(), 2u);
    ASSERT_NE(loaded.active(), nullptr);
    EXPECT_EQ(loaded.active()->id, std::string(16, 'b'));
    EXPECT_EQ(loaded.find(std::string(16, 'a'))->material,
              Bytes(KeyRing::kKeySize, static_cast<uint8_t>('a')));
    EXPECT_EQ(loaded.find(std::string(16, 'a'))->created_unix_ms, 1000);
}

TEST_F(KeyRingTest, SaveIsOwnerOnlyAndLeavesNoTmp) {
    KeyRing ring;
    ring.rotate();
    ASSERT_FALSE(ring.save(path_));

    struct stat st{};
    ASSERT_EQ(::stat(path_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    auto tmp = path_;
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(KeyRingTest, SaveOverwritesExistingFile) {
    KeyRing first;
    first.rotate();
    ASSERT_FALSE(first.save(path_));

    KeyRing second;
    second.rotate();
    second.rotate();
    ASSERT_FALSE(second.save(path_));

    KeyRing loaded;
    ASSERT_FALSE(KeyRing::load(path_, loaded));
    EXPECT_EQ(loaded.size(), 2u);
}

TEST_F(KeyRingTest, LoadMissingFileFails) {
    KeyRing ring;
    auto ec = KeyRing::load(test_dir_ / "missing.bin", ring);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST_F(KeyRingTest, LoadGarbageFailsAndLeavesResultUntouched) {
    {
        std::ofstream out(path_, std::ios::binary);
        out << "\xff\xff\xff\xff not a key ring";
    }

    KeyRing ring;
    ring.add(make_key('z'), true);
    auto ec = KeyRing::load(path_, ring);
    EXPECT_TRUE(ec);
    EXPECT_EQ(ring.size(), 1u);
}

} // namespace cstate::crypto
