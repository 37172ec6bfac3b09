/*
 * Reversible simulation of a homomorphic encryption backend
 *
 * NOT SECURE. Every opaque value is a keyed HMAC-SHA256 tag over the 256-bit big-endian
 * plaintext field, followed by that field XORed with a keyed pad. Anyone holding the digest key
 * can recover the plaintext, and equal plaintexts give equal ciphertexts. The arithmetic
 * operations decrypt, operate on the plaintexts and re-encrypt.
 *
 * Layout: tag (FHECREDIT_TAG_LEN) || masked value field (FHECREDIT_VALUE_FIELD_LEN)
 */

#pragma once

#include <array>
#include <memory>
#include <vector>

#include "include/fhecredit_constants.h"

#include "lib/crypto/encryption_backend.hpp"

namespace fhecredit
{
namespace oracle
{

class SimulatedBackend : public EncryptionBackend
{
public:
    // digest_key must be FHECREDIT_DIGEST_KEY_LEN bytes
    explicit SimulatedBackend(const std::vector<uint8_t> &digest_key);

    // Derive the digest key from a seed; the same seed always gives the same ciphertexts
    static std::unique_ptr<SimulatedBackend> from_seed(const std::vector<uint8_t> &seed);
    static std::unique_ptr<SimulatedBackend> generate();

    // CBOR map {"scheme": FHECREDIT_SIMULATION_SCHEME, "digest_key": bytes}
    static std::unique_ptr<SimulatedBackend>
    from_key_material(const std::vector<uint8_t> &key_material);
    std::vector<uint8_t> export_key_material() const;

    std::string name() const override { return FHECREDIT_SIMULATION_SCHEME; }
    size_t ciphertext_size() const override { return FHECREDIT_OPAQUE_VALUE_LEN; }

    OpaqueValue encrypt(uint64_t plaintext) const override;
    uint64_t decrypt(const OpaqueValue &value) const override;

    OpaqueValue add(const OpaqueValue &a, const OpaqueValue &b) const override;
    OpaqueValue scalar_multiply(const OpaqueValue &a, uint64_t k) const override;
    bool compare_at_least(const OpaqueValue &a, const OpaqueValue &b) const override;

private:
    std::array<uint8_t, FHECREDIT_TAG_LEN> tag(const std::vector<uint8_t> &field) const;

    std::vector<uint8_t> digest_key_;
    std::array<uint8_t, FHECREDIT_VALUE_FIELD_LEN> pad_;
};

} // namespace oracle
} // namespace fhecredit
