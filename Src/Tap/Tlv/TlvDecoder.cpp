/**
 * @file TlvDecoder.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Typed TLV decoder implementation
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Tlv/TlvDecoder.h"
#include "Utils/ByteUtils.h"
#include "Utils/Logging.h"

using namespace tap;

namespace
{
    etl::unexpected<error::Error> missingTag(TlvTag tag)
    {
        etl::string_view name = nameOf(tag);
        LOG_DEBUG("TLV tag %.*s (0x%02X) not found", static_cast<int>(name.size()), name.data(),
                  static_cast<unsigned>(tag));
        return etl::unexpected<error::Error>(error::Error::fromTlv(error::TlvError::MissingTag));
    }

    etl::unexpected<error::Error> typeMismatch()
    {
        return etl::unexpected<error::Error>(error::Error::fromTlv(error::TlvError::TypeMismatch));
    }

    bool isBytesKind(TlvValueType type)
    {
        return type == TlvValueType::ByteArray ||
               type == TlvValueType::HexString ||
               type == TlvValueType::Nested ||
               type == TlvValueType::Utf8String;
    }
}

TlvDecoder::TlvDecoder(const TlvMessage& tlv)
    : tlv(tlv)
{
}

const Tlv* TlvDecoder::find(TlvTag tag) const
{
    for (const Tlv& record : tlv)
    {
        if (record.tag == tag)
        {
            return &record;
        }
    }
    return nullptr;
}

bool TlvDecoder::contains(TlvTag tag) const
{
    return find(tag) != nullptr;
}

size_t TlvDecoder::count(TlvTag tag) const
{
    size_t matches = 0;
    for (const Tlv& record : tlv)
    {
        if (record.tag == tag)
        {
            ++matches;
        }
    }
    return matches;
}

etl::expected<void, error::Error> TlvDecoder::decodeBytes(TlvTag tag, etl::ivector<uint8_t>& out) const
{
    auto present = decodeOptionalBytes(tag, out);
    if (!present)
    {
        return etl::unexpected(present.error());
    }

    if (!present.value())
    {
        return missingTag(tag);
    }

    return {};
}

etl::expected<bool, error::Error> TlvDecoder::decodeOptionalBytes(TlvTag tag, etl::ivector<uint8_t>& out) const
{
    out.clear();

    const Tlv* record = find(tag);
    if (!record)
    {
        return false;
    }

    if (!isBytesKind(valueTypeOf(tag)) || record->value.size() > out.capacity())
    {
        return typeMismatch();
    }

    out.assign(record->value.begin(), record->value.end());
    return true;
}

etl::expected<uint64_t, error::Error> TlvDecoder::toInt(TlvTag tag, const TlvValue& value)
{
    size_t expectedMin = 1;
    size_t expectedMax = 8;

    switch (valueTypeOf(tag))
    {
        case TlvValueType::Byte:
        case TlvValueType::Enum:
            expectedMax = 1;
            break;
        case TlvValueType::UInt16:
            expectedMin = 2;
            expectedMax = 2;
            break;
        case TlvValueType::Int:
            break;
        default:
            return typeMismatch();
    }

    if (value.size() < expectedMin || value.size() > expectedMax)
    {
        return typeMismatch();
    }

    uint64_t number = 0;
    for (uint8_t byte : value)
    {
        number = (number << 8U) | byte;
    }
    return number;
}

etl::expected<uint64_t, error::Error> TlvDecoder::decodeInt(TlvTag tag) const
{
    const Tlv* record = find(tag);
    if (!record)
    {
        return missingTag(tag);
    }

    return toInt(tag, record->value);
}

etl::expected<etl::optional<uint64_t>, error::Error> TlvDecoder::decodeOptionalInt(TlvTag tag) const
{
    const Tlv* record = find(tag);
    if (!record)
    {
        return etl::optional<uint64_t>();
    }

    auto number = toInt(tag, record->value);
    if (!number)
    {
        return etl::unexpected(number.error());
    }

    return etl::optional<uint64_t>(number.value());
}

etl::expected<uint8_t, error::Error> TlvDecoder::decodeByte(TlvTag tag) const
{
    const TlvValueType type = valueTypeOf(tag);
    if (type != TlvValueType::Byte && type != TlvValueType::Enum)
    {
        return typeMismatch();
    }

    auto number = decodeInt(tag);
    if (!number)
    {
        return etl::unexpected(number.error());
    }

    return static_cast<uint8_t>(number.value());
}

etl::expected<uint16_t, error::Error> TlvDecoder::decodeUInt16(TlvTag tag) const
{
    if (valueTypeOf(tag) != TlvValueType::UInt16)
    {
        return typeMismatch();
    }

    auto number = decodeInt(tag);
    if (!number)
    {
        return etl::unexpected(number.error());
    }

    return static_cast<uint16_t>(number.value());
}

etl::expected<bool, error::Error> TlvDecoder::decodeBool(TlvTag tag) const
{
    const Tlv* record = find(tag);
    if (!record)
    {
        return missingTag(tag);
    }

    if (valueTypeOf(tag) != TlvValueType::Bool || record->value.size() != 1U || record->value[0] > 0x01U)
    {
        return typeMismatch();
    }

    return record->value[0] == 0x01U;
}

etl::expected<bool, error::Error> TlvDecoder::decodeOptionalBool(TlvTag tag) const
{
    if (!contains(tag))
    {
        return false;
    }

    return decodeBool(tag);
}

etl::expected<void, error::Error> TlvDecoder::decodeString(TlvTag tag, etl::istring& out) const
{
    auto present = decodeOptionalString(tag, out);
    if (!present)
    {
        return etl::unexpected(present.error());
    }

    if (!present.value())
    {
        return missingTag(tag);
    }

    return {};
}

etl::expected<bool, error::Error> TlvDecoder::decodeOptionalString(TlvTag tag, etl::istring& out) const
{
    out.clear();

    const Tlv* record = find(tag);
    if (!record)
    {
        return false;
    }

    switch (valueTypeOf(tag))
    {
        case TlvValueType::Utf8String:
        {
            // Cards pad fixed-size text fields with trailing zero bytes
            size_t length = record->value.size();
            while (length > 0U && record->value[length - 1U] == 0x00U)
            {
                --length;
            }

            if (length > out.capacity() || !utils::isValidUtf8(record->value.data(), length))
            {
                return typeMismatch();
            }

            out.assign(reinterpret_cast<const char*>(record->value.data()), length);
            return true;
        }

        case TlvValueType::HexString:
            if (!utils::toHex(record->value, out))
            {
                return typeMismatch();
            }
            return true;

        default:
            return typeMismatch();
    }
}

etl::expected<TlvDate, error::Error> TlvDecoder::decodeDate(TlvTag tag) const
{
    const Tlv* record = find(tag);
    if (!record)
    {
        return missingTag(tag);
    }

    if (valueTypeOf(tag) != TlvValueType::Date || record->value.size() != 4U)
    {
        return typeMismatch();
    }

    TlvDate date;
    date.year = static_cast<uint16_t>((record->value[0] << 8U) | record->value[1]);
    date.month = record->value[2];
    date.day = record->value[3];

    if (date.month < 1U || date.month > 12U || date.day < 1U || date.day > 31U)
    {
        return typeMismatch();
    }

    return date;
}

etl::expected<void, error::Error> TlvDecoder::decodeNested(TlvTag tag, TlvMessage& out) const
{
    out.clear();

    const Tlv* record = find(tag);
    if (!record)
    {
        return missingTag(tag);
    }

    if (valueTypeOf(tag) != TlvValueType::Nested)
    {
        return typeMismatch();
    }

    auto parsed = deserializeTlv(record->value, out);
    if (!parsed)
    {
        return typeMismatch();
    }

    return {};
}

etl::expected<void, error::Error> TlvDecoder::decodeAllInts(TlvTag tag, etl::ivector<uint64_t>& out) const
{
    out.clear();
    for (const Tlv& record : tlv)
    {
        if (record.tag != tag)
        {
            continue;
        }

        auto number = toInt(tag, record.value);
        if (!number)
        {
            return etl::unexpected(number.error());
        }

        if (out.full())
        {
            return typeMismatch();
        }

        out.push_back(number.value());
    }
    return {};
}
