#include "lib/crypto/encryption_backend.hpp"

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

OpaqueValue EncryptionBackend::parse(const std::vector<uint8_t> &bytes) const
{
    OpaqueValue value = wrap(bytes);
    check_size(value);
    return value;
}

void EncryptionBackend::check_size(const OpaqueValue &value) const
{
    if (value.size() != ciphertext_size())
        THROW_EXCEPTION(kMalformedCiphertext,
                        "Expected a " + std::to_string(ciphertext_size()) +
                            " byte opaque value for backend \"" + name() + "\", got " +
                            std::to_string(value.size()) + " bytes");
}

} // namespace oracle
} // namespace fhecredit
