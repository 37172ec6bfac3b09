#include "lib/crypto/simulated_backend.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "lib/common/cbor_map.hpp"
#include "lib/common/decoders.hpp"
#include "lib/common/encoders.hpp"
#include "lib/common/oracle_exception.hpp"
#include "lib/crypto/hash.hpp"
#include "lib/crypto/random.hpp"

namespace
{

std::vector<uint8_t> label_bytes(const char *label)
{
    const std::string text(label);
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

namespace fhecredit
{
namespace oracle
{

SimulatedBackend::SimulatedBackend(const std::vector<uint8_t> &digest_key)
    : digest_key_(digest_key)
{
    if (digest_key_.size() != FHECREDIT_DIGEST_KEY_LEN)
        THROW_EXCEPTION(kConfigurationError,
                        "Simulation digest key must be " +
                            std::to_string(FHECREDIT_DIGEST_KEY_LEN) + " bytes");

    pad_ = Hash::get_HMAC_SHA_256_digest(digest_key_, label_bytes("fhecredit-simulation-pad"));
}

std::unique_ptr<SimulatedBackend> SimulatedBackend::from_seed(const std::vector<uint8_t> &seed)
{
    if (seed.empty())
        THROW_EXCEPTION(kConfigurationError, "Simulation backend seed is empty");

    const auto key = Hash::get_HMAC_SHA_256_digest(seed, label_bytes("fhecredit-simulation-key"));
    return std::unique_ptr<SimulatedBackend>(
        new SimulatedBackend(std::vector<uint8_t>(key.begin(), key.end())));
}

std::unique_ptr<SimulatedBackend> SimulatedBackend::generate()
{
    return std::unique_ptr<SimulatedBackend>(
        new SimulatedBackend(random_bytes(FHECREDIT_DIGEST_KEY_LEN)));
}

std::unique_ptr<SimulatedBackend>
SimulatedBackend::from_key_material(const std::vector<uint8_t> &key_material)
{
    const CBORMap cbor(key_material, {"scheme", "digest_key"});
    const std::string &scheme = cbor.get("scheme").get_text_string_value();
    if (scheme != FHECREDIT_SIMULATION_SCHEME)
        THROW_EXCEPTION(kConfigurationError,
                        "Key material is for scheme \"" + scheme + "\", expected \"" +
                            FHECREDIT_SIMULATION_SCHEME + "\"");

    return std::unique_ptr<SimulatedBackend>(
        new SimulatedBackend(cbor.get("digest_key").get_byte_string_value()));
}

std::vector<uint8_t> SimulatedBackend::export_key_material() const
{
    CBORMap cbor;
    cbor.insert("scheme", FHECREDIT_SIMULATION_SCHEME);
    cbor.insert("digest_key", digest_key_);

    return cbor.encode_cbor();
}

std::array<uint8_t, FHECREDIT_TAG_LEN>
SimulatedBackend::tag(const std::vector<uint8_t> &field) const
{
    return Hash::get_HMAC_SHA_256_digest(digest_key_, field);
}

OpaqueValue SimulatedBackend::encrypt(uint64_t plaintext) const
{
    const std::vector<uint8_t> field = uint_to_be_bytes(plaintext, FHECREDIT_VALUE_FIELD_LEN);
    const auto field_tag = tag(field);

    std::vector<uint8_t> output(FHECREDIT_OPAQUE_VALUE_LEN, 0);
    std::copy(field_tag.begin(), field_tag.end(), output.begin());
    for (size_t i = 0; i < FHECREDIT_VALUE_FIELD_LEN; i++)
        output[FHECREDIT_TAG_LEN + i] = static_cast<uint8_t>(field[i] ^ pad_[i]);

    return wrap(std::move(output));
}

uint64_t SimulatedBackend::decrypt(const OpaqueValue &value) const
{
    check_size(value);

    const std::vector<uint8_t> &bytes = value.bytes();
    std::vector<uint8_t> field(FHECREDIT_VALUE_FIELD_LEN, 0);
    for (size_t i = 0; i < FHECREDIT_VALUE_FIELD_LEN; i++)
        field[i] = static_cast<uint8_t>(bytes[FHECREDIT_TAG_LEN + i] ^ pad_[i]);

    const auto expected_tag = tag(field);
    if (!constant_time_equal(expected_tag.data(), bytes.data(), FHECREDIT_TAG_LEN))
        THROW_EXCEPTION(kMalformedCiphertext, "Opaque value failed tag validation");

    try
    {
        return be_bytes_to_uint(field.data(), field.size());
    }
    catch (const OracleException &)
    {
        THROW_EXCEPTION(kMalformedCiphertext, "Opaque value outside the plaintext range");
    }
}

OpaqueValue SimulatedBackend::add(const OpaqueValue &a, const OpaqueValue &b) const
{
    const uint64_t x = decrypt(a);
    const uint64_t y = decrypt(b);
    if (x > std::numeric_limits<uint64_t>::max() - y)
        THROW_EXCEPTION(kIntegerOverflow, "Sum of opaque values overflows");

    return encrypt(x + y);
}

OpaqueValue SimulatedBackend::scalar_multiply(const OpaqueValue &a, uint64_t k) const
{
    const uint64_t x = decrypt(a);
    if (k != 0 && x > std::numeric_limits<uint64_t>::max() / k)
        THROW_EXCEPTION(kIntegerOverflow, "Scalar multiple of opaque value overflows");

    return encrypt(x * k);
}

bool SimulatedBackend::compare_at_least(const OpaqueValue &a, const OpaqueValue &b) const
{
    return decrypt(a) >= decrypt(b);
}

} // namespace oracle
} // namespace fhecredit
