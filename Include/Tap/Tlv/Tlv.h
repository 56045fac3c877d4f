/**
 * @file Tlv.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief TLV record and wire format
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/expected.h>
#include <cstdint>
#include <cstddef>
#include "TlvTag.h"
#include "Tap/BufferSizes.h"
#include "Error/Error.h"

namespace tap
{
    using TlvValue = etl::vector<uint8_t, buffer::TLV_VALUE_MAX>;

    /**
     * @brief Calendar date as carried by Date tags
     */
    struct TlvDate
    {
        uint16_t year = 0;
        uint8_t month = 0;
        uint8_t day = 0;

        bool operator==(const TlvDate& other) const
        {
            return year == other.year && month == other.month && day == other.day;
        }

        bool operator!=(const TlvDate& other) const
        {
            return !(*this == other);
        }
    };

    /**
     * @brief Single tag-length-value record
     *
     * Wire layout: [tag(1)][length(1) | 0xFF length_hi length_lo][value]
     * The length is always value.size().
     */
    struct Tlv
    {
        TlvTag tag = TlvTag::Unknown;
        TlvValue value;

        Tlv() = default;

        Tlv(TlvTag tag, const etl::ivector<uint8_t>& data);

        size_t length() const
        {
            return value.size();
        }

        /**
         * @brief Number of bytes this record occupies on the wire
         */
        size_t encodedSize() const;

        /**
         * @brief Append this record's wire encoding to out
         *
         * @param out Destination buffer
         * @return etl::expected<void, error::Error> BufferOverflow if out cannot hold the record
         */
        etl::expected<void, error::Error> serialize(etl::ivector<uint8_t>& out) const;

        /**
         * @brief Parse one record starting at offset and advance offset past it
         *
         * @param data Wire bytes
         * @param offset Read position, updated on success
         * @return etl::expected<Tlv, error::Error> Record or MalformedRecord / ValueTooLong
         */
        static etl::expected<Tlv, error::Error> parse(const etl::ivector<uint8_t>& data, size_t& offset);
    };

    using TlvMessage = etl::vector<Tlv, buffer::TLV_RECORDS_MAX>;

    /**
     * @brief Parse a full TLV sequence
     *
     * Records with tags outside the registry are kept as they are.
     *
     * @param data Wire bytes
     * @param out Parsed records in wire order
     * @return etl::expected<void, error::Error> Success or error
     */
    etl::expected<void, error::Error> deserializeTlv(const etl::ivector<uint8_t>& data, TlvMessage& out);

    /**
     * @brief Serialize a TLV sequence in record order
     */
    etl::expected<void, error::Error> serializeTlv(const TlvMessage& records, etl::ivector<uint8_t>& out);

} // namespace tap
