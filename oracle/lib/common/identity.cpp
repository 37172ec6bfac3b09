#include "lib/common/identity.hpp"

#include <algorithm>

#include "lib/common/decoders.hpp"
#include "lib/common/encoders.hpp"
#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

Identity::Identity() : bytes_() {}

Identity::Identity(const std::array<uint8_t, FHECREDIT_IDENTITY_LEN> &bytes) : bytes_(bytes) {}

Identity Identity::from_bytes(const std::vector<uint8_t> &bytes)
{
    if (bytes.size() != FHECREDIT_IDENTITY_LEN)
        THROW_EXCEPTION(kInvalidInput,
                        "Identity must be " + std::to_string(FHECREDIT_IDENTITY_LEN) +
                            " bytes, got " + std::to_string(bytes.size()));

    std::array<uint8_t, FHECREDIT_IDENTITY_LEN> array;
    std::copy(bytes.begin(), bytes.end(), array.begin());
    return Identity(array);
}

Identity Identity::from_hex(const std::string &hex) { return from_bytes(hex_decode(hex)); }

std::vector<uint8_t> Identity::to_vector() const
{
    return std::vector<uint8_t>(bytes_.begin(), bytes_.end());
}

bool Identity::is_zero() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::string Identity::to_hex() const { return "0x" + hex_encode(to_vector()); }

size_t IdentityHash::operator()(const Identity &identity) const
{
    // FNV-1a
    uint64_t hash = 14695981039346656037ULL;
    for (const uint8_t b : identity.bytes())
    {
        hash ^= b;
        hash *= 1099511628211ULL;
    }
    return static_cast<size_t>(hash);
}

} // namespace oracle
} // namespace fhecredit
