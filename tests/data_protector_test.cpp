#include "crypto/data_protector.hpp"

#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "protection.pb.h"

namespace cstate::crypto {

// ── Fixture ──────────────────────────────────────────────────────────────────

class DataProtectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto ring = std::make_shared<KeyRing>();
        ring->rotate();
        ring_ = ring;
        provider_ = std::make_unique<KeyRingProtectionProvider>(ring_);
    }

    [[nodiscard]] std::unique_ptr<DataProtector> protector(
        const std::string& purpose = "test.purpose") const {
        return provider_->create_protector(purpose);
    }

    std::shared_ptr<const KeyRing> ring_;
    std::unique_ptr<KeyRingProtectionProvider> provider_;
};

// ── Round trip ───────────────────────────────────────────────────────────────

TEST_F(DataProtectorTest, ProtectUnprotectRoundTrip) {
    auto p = protector();
    const auto plaintext = to_bytes(std::string("component\0state\x01\xff", 17));
    const auto sealed = p->protect(ByteView{plaintext});
    EXPECT_EQ(p->unprotect(ByteView{sealed}), plaintext);
}

TEST_F(DataProtectorTest, EmptyPlaintextRoundTrips) {
    auto p = protector();
    const auto sealed = p->protect(ByteView{});
    EXPECT_TRUE(p->unprotect(ByteView{sealed}).empty());
}

TEST_F(DataProtectorTest, CiphertextHidesPlaintext) {
    auto p = protector();
    const std::string secret = "very-recognisable-secret-value";
    const auto sealed = p->protect(as_bytes(secret));
    const std::string sealed_text(sealed.begin(), sealed.end());
    EXPECT_EQ(sealed_text.find(secret), std::string::npos);
}

TEST_F(DataProtectorTest, FreshNoncePerCall) {
    auto p = protector();
    const auto a = p->protect(as_bytes("same"));
    const auto b = p->protect(as_bytes("same"));
    EXPECT_NE(a, b);
}

TEST_F(DataProtectorTest, EnvelopeCarriesVersionAndKeyId) {
    auto p = protector();
    const auto sealed = p->protect(as_bytes("abc"));

    ProtectedPayload envelope;
    ASSERT_TRUE(envelope.ParseFromArray(sealed.data(), static_cast<int>(sealed.size())));
    EXPECT_EQ(envelope.version(), AeadDataProtector::kEnvelopeVersion);
    EXPECT_EQ(envelope.key_id(), ring_->active()->id);
    EXPECT_EQ(envelope.nonce().size(), AeadDataProtector::kNonceSize);
    EXPECT_EQ(envelope.ciphertext().size(), 3 + AeadDataProtector::kTagSize);
}

// ── Authentication failures ──────────────────────────────────────────────────

TEST_F(DataProtectorTest, OtherPurposeCannotUnprotect) {
    const auto sealed = protector("purpose.one")->protect(as_bytes("data"));
    EXPECT_THROW((void)protector("purpose.two")->unprotect(ByteView{sealed}),
                 AuthenticationError);
}

TEST_F(DataProtectorTest, OtherKeyRingCannotUnprotect) {
    const auto sealed = protector()->protect(as_bytes("data"));

    auto foreign_ring = std::make_shared<KeyRing>();
    foreign_ring->rotate();
    KeyRingProtectionProvider foreign(foreign_ring);
    EXPECT_THROW((void)foreign.create_protector("test.purpose")->unprotect(ByteView{sealed}),
                 AuthenticationError);
}

TEST_F(DataProtectorTest, TamperedCiphertextFails) {
    auto p = protector();
    const auto sealed = p->protect(as_bytes("data that matters"));

    ProtectedPayload envelope;
    ASSERT_TRUE(envelope.ParseFromArray(sealed.data(), static_cast<int>(sealed.size())));
    auto ct = envelope.ciphertext();
    ct[0] = static_cast<char>(ct[0] ^ 0x01);
    envelope.set_ciphertext(ct);
    const auto tampered = envelope.SerializeAsString();

    EXPECT_THROW((void)p->unprotect(as_bytes(tampered)), AuthenticationError);
}

TEST_F(DataProtectorTest, TamperedTagFails) {
    auto p = protector();
    const auto sealed = p->protect(as_bytes("data"));

    ProtectedPayload envelope;
    ASSERT_TRUE(envelope.ParseFromArray(sealed.data(), static_cast<int>(sealed.size())));
    auto ct = envelope.ciphertext();
    ct.back() = static_cast<char>(ct.back() ^ 0x80);
    envelope.set_ciphertext(ct);

    EXPECT_THROW((void)p->unprotect(as_bytes(envelope.SerializeAsString())),
                 AuthenticationError);
}

TEST_F(DataProtectorTest, WrongVersionFails) {
    auto p = protector();
    const auto sealed = p->protect(as_bytes("data"));

    ProtectedPayload envelope;
    ASSERT_TRUE(envelope.ParseFromArray(sealed.data(), static_cast<int>(sealed.size())));
    envelope.set_version(AeadDataProtector::kEnvelopeVersion + 1);

    EXPECT_THROW((void)p->unprotect(as_bytes(envelope.SerializeAsString())),
                 AuthenticationError);
}

TEST_F(DataProtectorTest, GarbageIsAuthenticationError) {
    auto p = protector();
    EXPECT_THROW((void)p->unprotect(as_bytes("\xff\xff\xff garbage")), AuthenticationError);
    EXPECT_THROW((void)p->unprotect(ByteView{}), AuthenticationError);
}

// ── Rotation ─────────────────────────────────────────────────────────────────

TEST(DataProtectorRotationTest, RetiredKeyStillUnprotects) {
    auto ring = std::make_shared<KeyRing>();
    ring->rotate();
    const auto old_id = ring->active()->id;

    AeadDataProtector p(ring, "rotation");
    const auto sealed_old = p.protect(as_bytes("before"));

    ring->rotate();
    const auto sealed_new = p.protect(as_bytes("after"));

    EXPECT_EQ(p.unprotect(ByteView{sealed_old}), to_bytes("before"));
    EXPECT_EQ(p.unprotect(ByteView{sealed_new}), to_bytes("after"));

    ProtectedPayload envelope;
    ASSERT_TRUE(envelope.ParseFromArray(sealed_new.data(),
                                        static_cast<int>(sealed_new.size())));
    EXPECT_NE(envelope.key_id(), old_id);
}

TEST(DataProtectorRotationTest, EmptyRingCannotProtect) {
    AeadDataProtector p(std::make_shared<KeyRing>(), "empty");
    EXPECT_THROW((void)p.protect(as_bytes("x")), std::runtime_error);
}

TEST(DataProtectorRotationTest, InvalidConstructionThrows) {
    EXPECT_THROW((void)AeadDataProtector(nullptr, "p"), std::invalid_argument);
    EXPECT_THROW((void)AeadDataProtector(std::make_shared<KeyRing>(), ""),
                 std::invalid_argument);
}

} // namespace cstate::crypto
