#include "lib/crypto/hash.hpp"

#include "mbedtls/md.h"

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

std::array<uint8_t, FHECREDIT_SHA_256_LEN>
Hash::get_SHA_256_digest(const std::vector<uint8_t> &message)
{
    std::array<uint8_t, FHECREDIT_SHA_256_LEN> output;

    const mbedtls_md_info_t *md_info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (md_info == nullptr)
        THROW_EXCEPTION(kCryptoError, "SHA-256 not available");

    const int ret = mbedtls_md(md_info, message.data(), message.size(), output.data());
    if (ret != 0)
        THROW_EXCEPTION(kCryptoError, "mbedtls_md failed with " + std::to_string(ret));

    return output;
}

std::array<uint8_t, FHECREDIT_SHA_256_LEN>
Hash::get_HMAC_SHA_256_digest(const std::vector<uint8_t> &key, const std::vector<uint8_t> &message)
{
    std::array<uint8_t, FHECREDIT_SHA_256_LEN> output;

    const mbedtls_md_info_t *md_info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (md_info == nullptr)
        THROW_EXCEPTION(kCryptoError, "SHA-256 not available");

    const int ret = mbedtls_md_hmac(
        md_info, key.data(), key.size(), message.data(), message.size(), output.data());
    if (ret != 0)
        THROW_EXCEPTION(kCryptoError, "mbedtls_md_hmac failed with " + std::to_string(ret));

    return output;
}

bool constant_time_equal(const uint8_t *a, const uint8_t *b, size_t size)
{
    uint8_t diff = 0;
    for (size_t i = 0; i < size; i++)
        diff |= static_cast<uint8_t>(a[i] ^ b[i]);

    return diff == 0;
}

} // namespace oracle
} // namespace fhecredit
