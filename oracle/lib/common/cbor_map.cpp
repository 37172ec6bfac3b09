#include "lib/common/cbor_map.hpp"

#include <tinycbor/cbor.h>

namespace fhecredit
{
namespace oracle
{

CBORMapValue::CBORMapValue(uint64_t value) : type_(kCBORUInt), uint_value_(value) {}

CBORMapValue::CBORMapValue(const std::vector<uint8_t> &value)
    : type_(kCBORByteString), uint_value_(std::numeric_limits<uint64_t>::max()), byte_value_(value)
{
}

CBORMapValue::CBORMapValue(const char *value)
    : type_(kCBORTextString), uint_value_(std::numeric_limits<uint64_t>::max()), text_value_(value)
{
}

CBORMapValue::CBORMapValue(const std::string &value)
    : type_(kCBORTextString), uint_value_(std::numeric_limits<uint64_t>::max()), text_value_(value)
{
}

uint64_t CBORMapValue::get_uint_value() const
{
    if (type_ != kCBORUInt)
        THROW_EXCEPTION(kDecodingError, "Can't get CBOR map element as type isn't uint");

    return uint_value_;
}

const std::vector<uint8_t> &CBORMapValue::get_byte_string_value() const
{
    if (type_ != kCBORByteString)
        THROW_EXCEPTION(kDecodingError, "Can't get CBOR map element as type isn't byte string");

    return byte_value_;
}

const std::string &CBORMapValue::get_text_string_value() const
{
    if (type_ != kCBORTextString)
        THROW_EXCEPTION(kDecodingError, "Can't get CBOR map element as type isn't text string");

    return text_value_;
}

// ----

CBORMap::CBORMap(const std::vector<uint8_t> &cbor, const std::vector<std::string> &keys)
{
    CborParser parser;
    CborValue map;
    if (cbor_parser_init(cbor.data(), cbor.size(), 0, &parser, &map) != CborNoError)
        THROW_EXCEPTION(kDecodingError, "Error initializing CBOR parser");

    if (!cbor_value_is_map(&map))
        THROW_EXCEPTION(kDecodingError, "Input CBOR is not a map");

    for (const std::string &key : keys)
    {
        CborValue element;
        if (cbor_value_map_find_value(&map, key.c_str(), &element) != CborNoError)
            THROW_EXCEPTION(kDecodingError, "Error extracting key \"" + key + "\"");

        if (cbor_value_get_type(&element) == CborInvalidType)
            THROW_EXCEPTION(kDecodingError, "Key \"" + key + "\" not found in map");

        if (cbor_value_is_unsigned_integer(&element))
        {
            uint64_t value;
            if (cbor_value_get_uint64(&element, &value) != CborNoError)
                THROW_EXCEPTION(kDecodingError,
                                "Error extracting unsigned int value for key \"" + key + "\"");

            this->insert(key, value);
            continue;
        }

        const bool is_byte_string = cbor_value_is_byte_string(&element);
        if (!is_byte_string && !cbor_value_is_text_string(&element))
            THROW_EXCEPTION(kDecodingError, "Type found for key \"" + key + "\" not handled");

        size_t length;
        if (cbor_value_calculate_string_length(&element, &length) != CborNoError)
            THROW_EXCEPTION(kDecodingError,
                            "Error extracting length of string for key \"" + key + "\"");

        std::vector<uint8_t> bytes(length, 0);
        size_t buflen = length;
        CborValue next;
        const CborError err =
            is_byte_string
                ? cbor_value_copy_byte_string(&element, bytes.data(), &buflen, &next)
                : cbor_value_copy_text_string(
                      &element, reinterpret_cast<char *>(bytes.data()), &buflen, &next);
        if (err != CborNoError)
            THROW_EXCEPTION(kDecodingError, "Error extracting string value for key \"" + key + "\"");

        if (is_byte_string)
            this->insert(key, bytes);
        else
            this->insert(key, std::string(bytes.begin(), bytes.end()));
    }
}

bool CBORMap::has(const std::string &key) const { return map_.count(key) == 1; }

const CBORMapValue &CBORMap::get(const std::string &key) const
{
    const auto iter = map_.find(key);
    if (iter == map_.end())
        THROW_EXCEPTION(kInvalidInput, "Key \"" + key + "\" not found");

    return iter->second;
}

std::vector<std::string> CBORMap::get_keys() const
{
    std::vector<std::string> keys;
    keys.reserve(map_.size());
    for (const auto &entry : map_)
        keys.push_back(entry.first);

    return keys;
}

std::vector<uint8_t> CBORMap::encode_cbor(size_t max_size) const
{
    std::vector<uint8_t> encoded_data(max_size, 0);
    CborEncoder encoder, map_encoder;
    cbor_encoder_init(&encoder, encoded_data.data(), encoded_data.size(), 0);
    cbor_encoder_create_map(&encoder, &map_encoder, map_.size());

    // std::map iterates in sorted key order
    for (const auto &entry : map_)
    {
        const CBORMapValue &value = entry.second;

        cbor_encode_text_stringz(&map_encoder, entry.first.c_str());
        switch (value.get_type())
        {
        case kCBORUInt:
            cbor_encode_uint(&map_encoder, value.get_uint_value());
            break;
        case kCBORTextString:
        {
            const auto &text = value.get_text_string_value();
            cbor_encode_text_string(&map_encoder, text.data(), text.size());
            break;
        }
        case kCBORByteString:
        {
            const auto &bytes = value.get_byte_string_value();
            cbor_encode_byte_string(&map_encoder, bytes.data(), bytes.size());
            break;
        }
        default:
            THROW_EXCEPTION(kEncodingError, "Incompatible CBOR type");
        }
    }

    cbor_encoder_close_container(&encoder, &map_encoder);

    if (cbor_encoder_get_extra_bytes_needed(&encoder) != 0)
        THROW_EXCEPTION(kEncodingError, "CBOR map larger than the output buffer");

    encoded_data.resize(cbor_encoder_get_buffer_size(&encoder, encoded_data.data()));

    return encoded_data;
}

} // namespace oracle
} // namespace fhecredit
