#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fhecredit
{
namespace oracle
{

// Cryptographically secure random bytes from a CTR-DRBG seeded with platform entropy
std::vector<uint8_t> random_bytes(size_t size);

} // namespace oracle
} // namespace fhecredit
