/**
 * @file TlvBuilder.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Typed TLV encoder implementation
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Tlv/TlvBuilder.h"
#include "Utils/ByteUtils.h"

using namespace tap;

namespace
{
    constexpr int64_t LEGACY_MODE_VALUE = 4;

    etl::unexpected<error::Error> tlvError(error::TlvError err)
    {
        return etl::unexpected<error::Error>(error::Error::fromTlv(err));
    }
}

TlvBuilder TlvBuilder::forCommand(bool legacyMode)
{
    TlvBuilder builder;
    if (legacyMode)
    {
        // Fresh builder, the record always fits
        (void)builder.appendInt(TlvTag::LegacyMode, LEGACY_MODE_VALUE);
    }
    return builder;
}

etl::expected<void, error::Error> TlvBuilder::checkAppend(TlvTag tag, size_t length) const
{
    const TlvTagInfo* info = describeTag(tag);
    if (!info)
    {
        return tlvError(error::TlvError::UnknownTag);
    }

    if (length > buffer::TLV_VALUE_MAX)
    {
        return tlvError(error::TlvError::ValueTooLong);
    }

    if (!info->multiple)
    {
        for (const Tlv& record : tlv)
        {
            if (record.tag == tag)
            {
                return tlvError(error::TlvError::DuplicateTag);
            }
        }
    }

    if (tlv.full())
    {
        return tlvError(error::TlvError::BufferOverflow);
    }

    return {};
}

etl::expected<void, error::Error> TlvBuilder::push(TlvTag tag, const etl::ivector<uint8_t>& data)
{
    auto check = checkAppend(tag, data.size());
    if (!check)
    {
        return check;
    }

    tlv.push_back(Tlv(tag, data));
    return {};
}

etl::expected<void, error::Error> TlvBuilder::appendBytes(TlvTag tag, const etl::ivector<uint8_t>& data)
{
    switch (valueTypeOf(tag))
    {
        case TlvValueType::ByteArray:
        case TlvValueType::HexString:
        case TlvValueType::Nested:
            return push(tag, data);

        case TlvValueType::Utf8String:
            if (!utils::isValidUtf8(data.data(), data.size()))
            {
                return tlvError(error::TlvError::EncodingFailed);
            }
            return push(tag, data);

        default:
            return tlvError(error::TlvError::EncodingFailed);
    }
}

etl::expected<void, error::Error> TlvBuilder::appendInt(TlvTag tag, int64_t number)
{
    if (number < 0)
    {
        return tlvError(error::TlvError::InvalidValue);
    }

    const uint64_t value = static_cast<uint64_t>(number);
    size_t width = 0;

    switch (valueTypeOf(tag))
    {
        case TlvValueType::Byte:
        case TlvValueType::Enum:
            width = 1;
            break;
        case TlvValueType::UInt16:
            width = 2;
            break;
        case TlvValueType::Int:
            width = utils::minimalWidth(value);
            break;
        default:
            return tlvError(error::TlvError::EncodingFailed);
    }

    if (width < 8U && (value >> (width * 8U)) != 0U)
    {
        return tlvError(error::TlvError::InvalidValue);
    }

    etl::vector<uint8_t, 8> bytes;
    utils::appendBigEndian(value, width, bytes);
    return push(tag, bytes);
}

etl::expected<void, error::Error> TlvBuilder::appendString(TlvTag tag, etl::string_view text)
{
    switch (valueTypeOf(tag))
    {
        case TlvValueType::Utf8String:
        {
            if (text.size() > buffer::TLV_VALUE_MAX)
            {
                return tlvError(error::TlvError::ValueTooLong);
            }

            const uint8_t* raw = reinterpret_cast<const uint8_t*>(text.data());
            if (!utils::isValidUtf8(raw, text.size()))
            {
                return tlvError(error::TlvError::EncodingFailed);
            }

            TlvValue bytes;
            bytes.assign(raw, raw + text.size());
            return push(tag, bytes);
        }

        case TlvValueType::HexString:
        {
            TlvValue bytes;
            if (!utils::fromHex(text, bytes))
            {
                return tlvError(error::TlvError::EncodingFailed);
            }
            return push(tag, bytes);
        }

        default:
            return tlvError(error::TlvError::EncodingFailed);
    }
}

etl::expected<void, error::Error> TlvBuilder::appendBool(TlvTag tag, bool flag)
{
    if (valueTypeOf(tag) != TlvValueType::Bool)
    {
        return tlvError(error::TlvError::EncodingFailed);
    }

    etl::vector<uint8_t, 1> bytes;
    bytes.push_back(flag ? 0x01U : 0x00U);
    return push(tag, bytes);
}

etl::expected<void, error::Error> TlvBuilder::appendDate(TlvTag tag, const TlvDate& date)
{
    if (valueTypeOf(tag) != TlvValueType::Date)
    {
        return tlvError(error::TlvError::EncodingFailed);
    }

    if (date.month < 1U || date.month > 12U || date.day < 1U || date.day > 31U)
    {
        return tlvError(error::TlvError::InvalidValue);
    }

    etl::vector<uint8_t, 4> bytes;
    bytes.push_back(static_cast<uint8_t>(date.year >> 8U));
    bytes.push_back(static_cast<uint8_t>(date.year & 0xFFU));
    bytes.push_back(date.month);
    bytes.push_back(date.day);
    return push(tag, bytes);
}

etl::expected<void, error::Error> TlvBuilder::appendNested(TlvTag tag, const TlvMessage& records)
{
    if (valueTypeOf(tag) != TlvValueType::Nested)
    {
        return tlvError(error::TlvError::EncodingFailed);
    }

    TlvValue bytes;
    auto serialized = serializeTlv(records, bytes);
    if (!serialized)
    {
        return tlvError(error::TlvError::ValueTooLong);
    }

    return push(tag, bytes);
}

etl::expected<void, error::Error> TlvBuilder::serialize(etl::ivector<uint8_t>& out) const
{
    return serializeTlv(tlv, out);
}
