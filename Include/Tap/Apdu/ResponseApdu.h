/**
 * @file ResponseApdu.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Response APDU
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "CommandApdu.h"

namespace tap
{
    class ResponseApdu
    {
    public:
        ApduData data;
        uint8_t sw1;
        uint8_t sw2;

        ResponseApdu() : sw1(0), sw2(0) {}

        ResponseApdu(const etl::ivector<uint8_t>& responseData, uint16_t statusWord)
            : data(responseData.begin(), responseData.end())
            , sw1(static_cast<uint8_t>(statusWord >> 8))
            , sw2(static_cast<uint8_t>(statusWord & 0xFF)) {}

        bool isSuccess() const
        {
            return (sw1 == 0x90 && sw2 == 0x00);
        }

        uint16_t getStatusWord() const
        {
            return (static_cast<uint16_t>(sw1) << 8) | sw2;
        }

        /**
         * @brief Error for a non-success status word
         *
         * Unlisted status words map to StatusWordError::Unknown.
         */
        error::Error statusError() const;

        /**
         * @brief Encode as DATA SW1 SW2
         */
        etl::expected<void, error::Error> serialize(etl::ivector<uint8_t>& out) const;

        /**
         * @brief Split a raw response into data and status word
         *
         * @param frame Raw bytes, at least SW1 SW2
         * @return etl::expected<ResponseApdu, error::Error> Response or FrameError
         */
        static etl::expected<ResponseApdu, error::Error> parse(const etl::ivector<uint8_t>& frame);
    };

} // namespace tap
