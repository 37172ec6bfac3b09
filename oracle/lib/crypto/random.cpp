#include "lib/crypto/random.hpp"

#include <string>

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/entropy.h"

#include "lib/common/oracle_exception.hpp"

namespace
{

const char personalization[] = "fhecredit-oracle-keygen";

// Frees the mbedtls contexts on every exit path
class DRBG
{
public:
    DRBG()
    {
        mbedtls_entropy_init(&entropy_);
        mbedtls_ctr_drbg_init(&ctr_drbg_);
    }
    ~DRBG()
    {
        mbedtls_ctr_drbg_free(&ctr_drbg_);
        mbedtls_entropy_free(&entropy_);
    }
    DRBG(const DRBG &) = delete;
    DRBG &operator=(const DRBG &) = delete;

    mbedtls_entropy_context entropy_;
    mbedtls_ctr_drbg_context ctr_drbg_;
};

} // namespace

namespace fhecredit
{
namespace oracle
{

std::vector<uint8_t> random_bytes(size_t size)
{
    DRBG drbg;
    int ret = mbedtls_ctr_drbg_seed(&drbg.ctr_drbg_,
                                    mbedtls_entropy_func,
                                    &drbg.entropy_,
                                    reinterpret_cast<const unsigned char *>(personalization),
                                    sizeof(personalization) - 1);
    if (ret != 0)
        THROW_EXCEPTION(kCryptoError, "mbedtls_ctr_drbg_seed failed with " + std::to_string(ret));

    std::vector<uint8_t> output(size, 0);
    ret = mbedtls_ctr_drbg_random(&drbg.ctr_drbg_, output.data(), output.size());
    if (ret != 0)
        THROW_EXCEPTION(kCryptoError,
                        "mbedtls_ctr_drbg_random failed with " + std::to_string(ret));

    return output;
}

} // namespace oracle
} // namespace fhecredit
