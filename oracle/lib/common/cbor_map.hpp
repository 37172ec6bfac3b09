/*
 * CBOR map with canonical (sorted key) encoding
 */

#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include "include/fhecredit_constants.h"
#include "include/fhecredit_status_codes.h"

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

enum CBORType
{
    kCBORUInt,
    kCBORTextString,
    kCBORByteString
};

class CBORMapValue
{
public:
    CBORMapValue(uint64_t value);
    CBORMapValue(const std::vector<uint8_t> &value);
    template <std::size_t N> CBORMapValue(const std::array<uint8_t, N> &value);
    CBORMapValue(const char *value);
    CBORMapValue(const std::string &value);

    CBORType get_type() const { return type_; }

    uint64_t get_uint_value() const;
    const std::vector<uint8_t> &get_byte_string_value() const;
    const std::string &get_text_string_value() const;

private:
    CBORType type_;

    uint64_t uint_value_;
    std::vector<uint8_t> byte_value_;
    std::string text_value_;
};

class CBORMap
{
public:
    CBORMap() {}

    // Decode a CBOR map, extracting only the listed keys (all of which must be present)
    CBORMap(const std::vector<uint8_t> &cbor, const std::vector<std::string> &keys);

    template <typename T> void insert(const std::string &key, const T &value);

    bool has(const std::string &key) const;
    const CBORMapValue &get(const std::string &key) const;
    std::vector<std::string> get_keys() const;

    std::vector<uint8_t> encode_cbor(size_t max_size = FHECREDIT_MAX_CBOR_LEN) const;

private:
    std::map<std::string, CBORMapValue> map_;
};

// ----

template <std::size_t N>
CBORMapValue::CBORMapValue(const std::array<uint8_t, N> &value)
    : type_(kCBORByteString), uint_value_(std::numeric_limits<uint64_t>::max()),
      byte_value_(value.begin(), value.end())
{
}

template <typename T> void CBORMap::insert(const std::string &key, const T &value)
{
    if (!map_.emplace(key, CBORMapValue(value)).second)
        THROW_EXCEPTION(kEncodingError, "Failed to insert key \"" + key + "\" into CBOR map");
}

} // namespace oracle
} // namespace fhecredit
