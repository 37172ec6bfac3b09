#include "lib/common/encoders.hpp"

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

std::string hex_encode(const std::vector<uint8_t> &bytes)
{
    static const char hex_digits[] = "0123456789abcdef";

    std::string output;
    output.reserve(bytes.size() * 2);
    for (const uint8_t c : bytes)
    {
        output.push_back(hex_digits[c >> 4]);
        output.push_back(hex_digits[c & 15]);
    }
    return output;
}

std::vector<uint8_t> uint_to_be_bytes(uint64_t value, size_t width)
{
    if (width < sizeof(uint64_t))
        THROW_EXCEPTION(kEncodingError, "Field too narrow for a 64-bit value");

    std::vector<uint8_t> output(width, 0);
    for (size_t i = 0; i < sizeof(uint64_t); i++)
        output[width - 1 - i] = static_cast<uint8_t>(value >> (i * 8));

    return output;
}

} // namespace oracle
} // namespace fhecredit
