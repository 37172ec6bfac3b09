#include "lib/crypto/opaque_value_codec.hpp"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"

namespace fhecredit
{
namespace oracle
{

OpaqueValueCodec::OpaqueValueCodec(const EncryptionBackend &backend, const Identity &owner)
    : backend_(backend), owner_(owner)
{
}

OpaqueValue OpaqueValueCodec::encrypt(uint64_t plaintext) const
{
    return backend_.encrypt(plaintext);
}

uint64_t OpaqueValueCodec::decrypt(const Identity &caller, const OpaqueValue &value) const
{
    if (caller != owner_)
        THROW_EXCEPTION(kUnauthorizedCaller,
                        caller.to_hex() + " does not hold the decryption capability");

    backend_.check_size(value);
    DEBUG_LOG("Codec decrypt by owner %s", caller.to_hex().c_str());
    return backend_.decrypt(value);
}

} // namespace oracle
} // namespace fhecredit
