#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fhecredit
{
namespace oracle
{

std::string hex_encode(const std::vector<uint8_t> &bytes);

// Big-endian encoding of value into a field of width bytes (width >= 8)
std::vector<uint8_t> uint_to_be_bytes(uint64_t value, size_t width);

} // namespace oracle
} // namespace fhecredit
