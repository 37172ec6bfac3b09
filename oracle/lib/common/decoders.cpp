#include "lib/common/decoders.hpp"

namespace
{

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

namespace fhecredit
{
namespace oracle
{

std::vector<uint8_t> hex_decode(const std::string &hex_string)
{
    size_t offset = 0;
    if (hex_string.size() >= 2 && hex_string[0] == '0' &&
        (hex_string[1] == 'x' || hex_string[1] == 'X'))
        offset = 2;

    if ((hex_string.size() - offset) % 2 != 0)
        THROW_EXCEPTION(kDecodingError, "Hex string has an odd number of digits");

    std::vector<uint8_t> output;
    output.reserve((hex_string.size() - offset) / 2);
    for (size_t i = offset; i < hex_string.size(); i += 2)
    {
        const int high = hex_value(hex_string[i]);
        const int low = hex_value(hex_string[i + 1]);
        if (high < 0 || low < 0)
            THROW_EXCEPTION(kDecodingError, "Hex string contains a non-hex character");
        output.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return output;
}

uint64_t be_bytes_to_uint(const uint8_t *bytes, size_t width)
{
    if (width < sizeof(uint64_t))
        THROW_EXCEPTION(kDecodingError, "Field too narrow for a 64-bit value");

    for (size_t i = 0; i < width - sizeof(uint64_t); i++)
    {
        if (bytes[i] != 0)
            THROW_EXCEPTION(kDecodingError, "Value does not fit in 64 bits");
    }

    uint64_t value = 0;
    for (size_t i = width - sizeof(uint64_t); i < width; i++)
        value = (value << 8) | bytes[i];

    return value;
}

} // namespace oracle
} // namespace fhecredit
