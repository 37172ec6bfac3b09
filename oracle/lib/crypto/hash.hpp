#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "include/fhecredit_constants.h"

namespace fhecredit
{
namespace oracle
{

class Hash
{
public:
    static std::array<uint8_t, FHECREDIT_SHA_256_LEN>
    get_SHA_256_digest(const std::vector<uint8_t> &message);

    // HMAC-SHA256 of message under key
    static std::array<uint8_t, FHECREDIT_SHA_256_LEN>
    get_HMAC_SHA_256_digest(const std::vector<uint8_t> &key, const std::vector<uint8_t> &message);
};

// Compare two equal-length buffers without early exit
bool constant_time_equal(const uint8_t *a, const uint8_t *b, size_t size);

} // namespace oracle
} // namespace fhecredit
