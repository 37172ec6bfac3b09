#pragma once

#include <cstdint>
#include <vector>

#include "lib/common/identity.hpp"
#include "lib/crypto/encryption_backend.hpp"

namespace fhecredit
{
namespace oracle
{

// Encodes plaintext integers into opaque values and back. Decryption is a capability held only by
// the data owner identity the codec was created for.
class OpaqueValueCodec
{
public:
    OpaqueValueCodec(const EncryptionBackend &backend, const Identity &owner);

    OpaqueValue encrypt(uint64_t plaintext) const;

    // Fails with kUnauthorizedCaller unless caller is the codec owner
    uint64_t decrypt(const Identity &caller, const OpaqueValue &value) const;

    OpaqueValue parse(const std::vector<uint8_t> &bytes) const { return backend_.parse(bytes); }
    void check_size(const OpaqueValue &value) const { backend_.check_size(value); }

    size_t ciphertext_size() const { return backend_.ciphertext_size(); }
    const Identity &owner() const { return owner_; }

private:
    const EncryptionBackend &backend_;
    const Identity owner_;
};

} // namespace oracle
} // namespace fhecredit
