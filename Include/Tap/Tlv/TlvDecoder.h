/**
 * @file TlvDecoder.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Typed TLV decoder
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/optional.h>
#include <etl/string.h>
#include "Tlv.h"

namespace tap
{
    /**
     * @brief Reads typed values out of a parsed TLV message
     *
     * decode* returns the first record with the tag and fails with MissingTag
     * when there is none; decodeOptional* reports absence instead. A record
     * whose length or content does not fit the declared kind fails with
     * TypeMismatch. Records with unknown tags are ignored.
     *
     * The decoder keeps a reference to the message, which must outlive it.
     */
    class TlvDecoder
    {
    public:
        explicit TlvDecoder(const TlvMessage& tlv);

        bool contains(TlvTag tag) const;

        size_t count(TlvTag tag) const;

        /**
         * @brief Raw value of a ByteArray / HexString / Nested / Utf8String tag
         *
         * @param tag Tag to read
         * @param out Destination, TypeMismatch if the value does not fit
         */
        etl::expected<void, error::Error> decodeBytes(TlvTag tag, etl::ivector<uint8_t>& out) const;

        /**
         * @brief Optional raw value
         *
         * @return etl::expected<bool, error::Error> true when the tag was present
         */
        etl::expected<bool, error::Error> decodeOptionalBytes(TlvTag tag, etl::ivector<uint8_t>& out) const;

        /**
         * @brief Integer value of a Byte / Enum / UInt16 / Int tag
         */
        etl::expected<uint64_t, error::Error> decodeInt(TlvTag tag) const;

        etl::expected<etl::optional<uint64_t>, error::Error> decodeOptionalInt(TlvTag tag) const;

        /**
         * @brief Single byte value of a Byte / Enum tag
         */
        etl::expected<uint8_t, error::Error> decodeByte(TlvTag tag) const;

        etl::expected<uint16_t, error::Error> decodeUInt16(TlvTag tag) const;

        etl::expected<bool, error::Error> decodeBool(TlvTag tag) const;

        /**
         * @brief Optional flag, absent decodes as false
         */
        etl::expected<bool, error::Error> decodeOptionalBool(TlvTag tag) const;

        /**
         * @brief Text of a Utf8String tag, or upper-case hex of a HexString tag
         */
        etl::expected<void, error::Error> decodeString(TlvTag tag, etl::istring& out) const;

        etl::expected<bool, error::Error> decodeOptionalString(TlvTag tag, etl::istring& out) const;

        etl::expected<TlvDate, error::Error> decodeDate(TlvTag tag) const;

        /**
         * @brief Parse the value of a Nested tag as a TLV message
         */
        etl::expected<void, error::Error> decodeNested(TlvTag tag, TlvMessage& out) const;

        /**
         * @brief All raw values of a tag, in wire order
         *
         * An absent tag yields an empty sequence.
         */
        template <size_t N>
        etl::expected<void, error::Error> decodeAllBytes(TlvTag tag, etl::ivector<etl::vector<uint8_t, N>>& out) const
        {
            out.clear();
            for (const Tlv& record : tlv)
            {
                if (record.tag != tag)
                {
                    continue;
                }

                if (record.value.size() > N || out.full())
                {
                    return etl::unexpected(error::Error::fromTlv(error::TlvError::TypeMismatch));
                }

                out.push_back(etl::vector<uint8_t, N>(record.value.begin(), record.value.end()));
            }
            return {};
        }

        /**
         * @brief All integer values of a tag, in wire order
         */
        etl::expected<void, error::Error> decodeAllInts(TlvTag tag, etl::ivector<uint64_t>& out) const;

    private:
        const Tlv* find(TlvTag tag) const;
        static etl::expected<uint64_t, error::Error> toInt(TlvTag tag, const TlvValue& value);

        const TlvMessage& tlv;
    };

} // namespace tap
