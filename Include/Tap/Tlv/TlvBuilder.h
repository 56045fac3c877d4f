/**
 * @file TlvBuilder.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Typed TLV encoder
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string_view.h>
#include "Tlv.h"

namespace tap
{
    /**
     * @brief Builds an ordered TLV message from typed values
     *
     * Every append checks the value against the tag's declared kind. Records
     * keep their append order on the wire.
     */
    class TlvBuilder
    {
    public:
        TlvBuilder() = default;

        /**
         * @brief Create a builder for a command request
         *
         * @param legacyMode Prepend the LegacyMode record used by older card readers
         * @return TlvBuilder Builder
         */
        static TlvBuilder forCommand(bool legacyMode);

        /**
         * @brief Append raw bytes (ByteArray, HexString or Nested tags)
         */
        etl::expected<void, error::Error> appendBytes(TlvTag tag, const etl::ivector<uint8_t>& data);

        /**
         * @brief Append an integer (Byte, Enum, UInt16 or Int tags)
         *
         * Int tags are written big-endian with minimal width; negative values
         * and values wider than the fixed kinds fail with InvalidValue.
         */
        etl::expected<void, error::Error> appendInt(TlvTag tag, int64_t number);

        /**
         * @brief Append text (Utf8String tags, or hex text for HexString tags)
         */
        etl::expected<void, error::Error> appendString(TlvTag tag, etl::string_view text);

        etl::expected<void, error::Error> appendBool(TlvTag tag, bool flag);

        etl::expected<void, error::Error> appendDate(TlvTag tag, const TlvDate& date);

        /**
         * @brief Append a nested TLV message as the value of a Nested tag
         */
        etl::expected<void, error::Error> appendNested(TlvTag tag, const TlvMessage& records);

        /**
         * @brief Serialize all records
         *
         * @param out Destination, BufferOverflow when the message does not fit
         */
        etl::expected<void, error::Error> serialize(etl::ivector<uint8_t>& out) const;

        const TlvMessage& records() const
        {
            return tlv;
        }

    private:
        etl::expected<void, error::Error> checkAppend(TlvTag tag, size_t length) const;
        etl::expected<void, error::Error> push(TlvTag tag, const etl::ivector<uint8_t>& data);

        TlvMessage tlv;
    };

} // namespace tap
