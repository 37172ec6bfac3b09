/*
 * Principal identifier (address-sized)
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "include/fhecredit_constants.h"

namespace fhecredit
{
namespace oracle
{

class Identity
{
public:
    // The all-zero identity
    Identity();
    explicit Identity(const std::array<uint8_t, FHECREDIT_IDENTITY_LEN> &bytes);

    // Fail with kInvalidInput unless the input is exactly FHECREDIT_IDENTITY_LEN bytes
    static Identity from_bytes(const std::vector<uint8_t> &bytes);
    static Identity from_hex(const std::string &hex);

    const std::array<uint8_t, FHECREDIT_IDENTITY_LEN> &bytes() const { return bytes_; }
    std::vector<uint8_t> to_vector() const;
    bool is_zero() const;

    // "0x" prefixed lower case hex
    std::string to_hex() const;

    bool operator==(const Identity &other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Identity &other) const { return bytes_ != other.bytes_; }
    bool operator<(const Identity &other) const { return bytes_ < other.bytes_; }

private:
    std::array<uint8_t, FHECREDIT_IDENTITY_LEN> bytes_;
};

struct IdentityHash
{
    size_t operator()(const Identity &identity) const;
};

} // namespace oracle
} // namespace fhecredit
