/*
 * Encrypted non-negative integer
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace fhecredit
{
namespace oracle
{

class EncryptionBackend;

// Bytes can only be wrapped by an EncryptionBackend, either as the output of one of its
// operations or through EncryptionBackend::parse (which checks the length)
class OpaqueValue
{
public:
    // Empty value, rejected as malformed by every backend
    OpaqueValue() {}

    const std::vector<uint8_t> &bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    bool operator==(const OpaqueValue &other) const { return bytes_ == other.bytes_; }
    bool operator!=(const OpaqueValue &other) const { return bytes_ != other.bytes_; }

private:
    friend class EncryptionBackend;
    explicit OpaqueValue(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    std::vector<uint8_t> bytes_;
};

} // namespace oracle
} // namespace fhecredit
