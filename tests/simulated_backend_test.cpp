#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

#include "lib/common/cbor_map.hpp"
#include "lib/crypto/opaque_value_codec.hpp"
#include "lib/crypto/simulated_backend.hpp"

#include "test_utils.hpp"

namespace
{

using namespace fhecredit::oracle;

const uint64_t kMaxPlaintext = std::numeric_limits<uint64_t>::max();

TEST(SimulatedBackendTest, RoundTrip)
{
    const auto backend = test::make_backend();
    const std::vector<uint64_t> values = {0, 1, 85, 165357500, kMaxPlaintext};
    for (const uint64_t value : values)
        EXPECT_EQ(value, backend->decrypt(backend->encrypt(value)));
}

TEST(SimulatedBackendTest, ConstantLength)
{
    const auto backend = test::make_backend();
    EXPECT_EQ(64u, backend->ciphertext_size());
    EXPECT_EQ(64u, backend->encrypt(0).size());
    EXPECT_EQ(64u, backend->encrypt(kMaxPlaintext).size());
}

TEST(SimulatedBackendTest, DeterministicUnderSeed)
{
    const auto first = test::make_backend("seed-a");
    const auto second = test::make_backend("seed-a");
    const auto other = test::make_backend("seed-b");

    EXPECT_EQ(first->encrypt(700), second->encrypt(700));
    EXPECT_NE(first->encrypt(700), first->encrypt(701));
    EXPECT_NE(first->encrypt(700), other->encrypt(700));
}

TEST(SimulatedBackendTest, ForeignKeyFailsValidation)
{
    const auto backend = test::make_backend("seed-a");
    const auto other = test::make_backend("seed-b");
    EXPECT_ORACLE_ERROR(backend->decrypt(other->encrypt(5)), kMalformedCiphertext);
}

TEST(SimulatedBackendTest, TamperedValueFailsValidation)
{
    const auto backend = test::make_backend();
    std::vector<uint8_t> bytes = backend->encrypt(1000).bytes();

    std::vector<uint8_t> bad_tag = bytes;
    bad_tag[0] ^= 0x01;
    EXPECT_ORACLE_ERROR(backend->decrypt(backend->parse(bad_tag)), kMalformedCiphertext);

    std::vector<uint8_t> bad_field = bytes;
    bad_field[63] ^= 0x01;
    EXPECT_ORACLE_ERROR(backend->decrypt(backend->parse(bad_field)), kMalformedCiphertext);
}

TEST(SimulatedBackendTest, WrongLength)
{
    const auto backend = test::make_backend();
    std::vector<uint8_t> bytes = backend->encrypt(1).bytes();
    bytes.pop_back();

    EXPECT_ORACLE_ERROR(backend->parse(bytes), kMalformedCiphertext);
    EXPECT_ORACLE_ERROR(backend->parse(std::vector<uint8_t>()), kMalformedCiphertext);
    EXPECT_ORACLE_ERROR(backend->decrypt(OpaqueValue()), kMalformedCiphertext);
}

TEST(SimulatedBackendTest, Arithmetic)
{
    const auto backend = test::make_backend();
    const OpaqueValue a = backend->encrypt(40);
    const OpaqueValue b = backend->encrypt(2);

    EXPECT_EQ(42u, backend->decrypt(backend->add(a, b)));
    EXPECT_EQ(120u, backend->decrypt(backend->scalar_multiply(a, 3)));
    EXPECT_EQ(0u, backend->decrypt(backend->scalar_multiply(a, 0)));
    EXPECT_TRUE(backend->compare_at_least(a, b));
    EXPECT_TRUE(backend->compare_at_least(a, a));
    EXPECT_FALSE(backend->compare_at_least(b, a));
}

TEST(SimulatedBackendTest, Overflow)
{
    const auto backend = test::make_backend();
    const OpaqueValue max = backend->encrypt(kMaxPlaintext);

    EXPECT_ORACLE_ERROR(backend->add(max, backend->encrypt(1)), kIntegerOverflow);
    EXPECT_ORACLE_ERROR(backend->scalar_multiply(max, 2), kIntegerOverflow);
    EXPECT_EQ(kMaxPlaintext, backend->decrypt(backend->scalar_multiply(max, 1)));
}

TEST(SimulatedBackendTest, KeyMaterialRoundTrip)
{
    const auto generated = SimulatedBackend::generate();
    const auto restored = SimulatedBackend::from_key_material(generated->export_key_material());

    EXPECT_EQ(generated->encrypt(12345), restored->encrypt(12345));
    EXPECT_EQ(12345u, restored->decrypt(generated->encrypt(12345)));
}

TEST(SimulatedBackendTest, GeneratedKeysDiffer)
{
    const auto first = SimulatedBackend::generate();
    const auto second = SimulatedBackend::generate();
    EXPECT_NE(first->export_key_material(), second->export_key_material());
}

TEST(SimulatedBackendTest, RejectsBadKeys)
{
    EXPECT_ORACLE_ERROR(SimulatedBackend{std::vector<uint8_t>(16, 1)}, kConfigurationError);
    EXPECT_ORACLE_ERROR(SimulatedBackend::from_seed(std::vector<uint8_t>()), kConfigurationError);

    CBORMap key_material;
    key_material.insert("scheme", "bfv");
    key_material.insert("digest_key", std::vector<uint8_t>(32, 1));
    EXPECT_ORACLE_ERROR(SimulatedBackend::from_key_material(key_material.encode_cbor()),
                        kConfigurationError);

    CBORMap missing_key;
    missing_key.insert("scheme", FHECREDIT_SIMULATION_SCHEME);
    EXPECT_ORACLE_ERROR(SimulatedBackend::from_key_material(missing_key.encode_cbor()),
                        kDecodingError);
}

TEST(OpaqueValueCodecTest, OnlyOwnerDecrypts)
{
    const auto backend = test::make_backend();
    const Identity owner = test::make_identity(1);
    const OpaqueValueCodec codec(*backend, owner);

    const OpaqueValue value = codec.encrypt(50000);
    EXPECT_EQ(50000u, codec.decrypt(owner, value));
    EXPECT_ORACLE_ERROR(codec.decrypt(test::make_identity(2), value), kUnauthorizedCaller);
    EXPECT_EQ(owner, codec.owner());
    EXPECT_EQ(backend->ciphertext_size(), codec.ciphertext_size());
}

TEST(OpaqueValueCodecTest, ParseChecksLength)
{
    const auto backend = test::make_backend();
    const OpaqueValueCodec codec(*backend, test::make_identity(1));

    const OpaqueValue value = codec.encrypt(7);
    EXPECT_EQ(value, codec.parse(value.bytes()));
    EXPECT_ORACLE_ERROR(codec.parse(std::vector<uint8_t>(63, 0)), kMalformedCiphertext);
    EXPECT_ORACLE_ERROR(codec.check_size(OpaqueValue()), kMalformedCiphertext);
}

} // namespace
