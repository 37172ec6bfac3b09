#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

// Accepts upper or lower case digits, with or without a leading "0x"
std::vector<uint8_t> hex_decode(const std::string &hex_string);

// Inverse of uint_to_be_bytes, fails if the value doesn't fit in 64 bits
uint64_t be_bytes_to_uint(const uint8_t *bytes, size_t width);

} // namespace oracle
} // namespace fhecredit
