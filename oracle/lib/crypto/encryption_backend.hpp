/*
 * Contract every encryption backend must satisfy
 *
 * For all plaintexts x, y and public scalars k:
 *    decrypt(encrypt(x)) == x
 *    decrypt(add(encrypt(x), encrypt(y))) == x + y
 *    decrypt(scalar_multiply(encrypt(x), k)) == x * k
 *    compare_at_least(encrypt(x), encrypt(y)) == (x >= y)
 *    encrypt(x).size() == ciphertext_size()
 *
 * Operations fail with kMalformedCiphertext when an argument has the wrong size or fails
 * validation, and with kIntegerOverflow when a result leaves the 64-bit plaintext range.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "lib/crypto/opaque_value.hpp"

namespace fhecredit
{
namespace oracle
{

class EncryptionBackend
{
public:
    virtual ~EncryptionBackend() {}

    virtual std::string name() const = 0;
    virtual size_t ciphertext_size() const = 0;

    virtual OpaqueValue encrypt(uint64_t plaintext) const = 0;
    virtual uint64_t decrypt(const OpaqueValue &value) const = 0;

    virtual OpaqueValue add(const OpaqueValue &a, const OpaqueValue &b) const = 0;
    virtual OpaqueValue scalar_multiply(const OpaqueValue &a, uint64_t k) const = 0;
    virtual bool compare_at_least(const OpaqueValue &a, const OpaqueValue &b) const = 0;

    // Wrap bytes received from outside the process
    OpaqueValue parse(const std::vector<uint8_t> &bytes) const;

    // Throws kMalformedCiphertext unless value has exactly ciphertext_size() bytes
    void check_size(const OpaqueValue &value) const;

protected:
    static OpaqueValue wrap(std::vector<uint8_t> bytes) { return OpaqueValue(std::move(bytes)); }
};

} // namespace oracle
} // namespace fhecredit
