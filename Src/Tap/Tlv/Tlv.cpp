/**
 * @file Tlv.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief TLV record and wire format implementation
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Tlv/Tlv.h"

using namespace tap;

namespace
{
    constexpr uint8_t EXTENDED_LENGTH_MARKER = 0xFF;
}

Tlv::Tlv(TlvTag tag, const etl::ivector<uint8_t>& data)
    : tag(tag)
    , value()
{
    // Callers check the size against TLV_VALUE_MAX before constructing
    const size_t count = data.size() < value.capacity() ? data.size() : value.capacity();
    value.assign(data.begin(), data.begin() + count);
}

size_t Tlv::encodedSize() const
{
    const size_t lengthSize = value.size() > buffer::TLV_SHORT_LENGTH_MAX ? 3U : 1U;
    return 1U + lengthSize + value.size();
}

etl::expected<void, error::Error> Tlv::serialize(etl::ivector<uint8_t>& out) const
{
    if (value.size() > buffer::TLV_EXTENDED_LENGTH_MAX)
    {
        return etl::unexpected(error::Error::fromTlv(error::TlvError::ValueTooLong));
    }

    if (out.available() < encodedSize())
    {
        return etl::unexpected(error::Error::fromTlv(error::TlvError::BufferOverflow));
    }

    out.push_back(static_cast<uint8_t>(tag));

    if (value.size() > buffer::TLV_SHORT_LENGTH_MAX)
    {
        out.push_back(EXTENDED_LENGTH_MARKER);
        out.push_back(static_cast<uint8_t>((value.size() >> 8U) & 0xFFU));
        out.push_back(static_cast<uint8_t>(value.size() & 0xFFU));
    }
    else
    {
        out.push_back(static_cast<uint8_t>(value.size()));
    }

    out.insert(out.end(), value.begin(), value.end());
    return {};
}

etl::expected<Tlv, error::Error> Tlv::parse(const etl::ivector<uint8_t>& data, size_t& offset)
{
    size_t position = offset;

    if (position + 2U > data.size())
    {
        return etl::unexpected(error::Error::fromTlv(error::TlvError::MalformedRecord));
    }

    Tlv record;
    record.tag = static_cast<TlvTag>(data[position++]);

    size_t length = data[position++];
    if (length == EXTENDED_LENGTH_MARKER)
    {
        if (position + 2U > data.size())
        {
            return etl::unexpected(error::Error::fromTlv(error::TlvError::MalformedRecord));
        }

        length = (static_cast<size_t>(data[position]) << 8U) | data[position + 1U];
        position += 2U;
    }

    if (position + length > data.size())
    {
        return etl::unexpected(error::Error::fromTlv(error::TlvError::MalformedRecord));
    }

    if (length > record.value.capacity())
    {
        return etl::unexpected(error::Error::fromTlv(error::TlvError::ValueTooLong));
    }

    record.value.assign(data.begin() + position, data.begin() + position + length);
    offset = position + length;
    return record;
}

etl::expected<void, error::Error> tap::deserializeTlv(const etl::ivector<uint8_t>& data, TlvMessage& out)
{
    out.clear();

    size_t offset = 0;
    while (offset < data.size())
    {
        auto recordResult = Tlv::parse(data, offset);
        if (!recordResult)
        {
            return etl::unexpected(recordResult.error());
        }

        if (out.full())
        {
            return etl::unexpected(error::Error::fromTlv(error::TlvError::BufferOverflow));
        }

        out.push_back(recordResult.value());
    }

    return {};
}

etl::expected<void, error::Error> tap::serializeTlv(const TlvMessage& records, etl::ivector<uint8_t>& out)
{
    for (const Tlv& record : records)
    {
        auto result = record.serialize(out);
        if (!result)
        {
            return result;
        }
    }

    return {};
}
