/**
 * @file CommandApdu.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command APDU
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/expected.h>
#include "Instruction.h"
#include "Tap/BufferSizes.h"
#include "Error/Error.h"

namespace tap
{
    using ApduData = etl::vector<uint8_t, buffer::APDU_DATA_MAX>;
    using ApduFrame = etl::vector<uint8_t, buffer::APDU_COMMAND_MAX>;

    /**
     * @brief Command APDU with extended length encoding
     *
     * Frame: CLA INS P1 P2 00 Lc_hi Lc_lo DATA. P1 carries the encryption
     * mode of the payload.
     */
    class CommandApdu
    {
    public:
        uint8_t cla;
        Instruction ins;
        uint8_t p1;
        uint8_t p2;
        ApduData data;

        CommandApdu() : cla(0x00), ins(Instruction::Unknown), p1(0x00), p2(0x00) {}

        CommandApdu(Instruction instruction, const etl::ivector<uint8_t>& payload)
            : cla(0x00), ins(instruction), p1(0x00), p2(0x00), data(payload.begin(), payload.end()) {}

        /**
         * @brief Encode the frame
         *
         * @param out Destination, FrameError when it cannot hold the frame
         */
        etl::expected<void, error::Error> serialize(etl::ivector<uint8_t>& out) const;

        /**
         * @brief Decode a frame produced by serialize()
         *
         * @param frame Raw frame
         * @return etl::expected<CommandApdu, error::Error> APDU or FrameError
         */
        static etl::expected<CommandApdu, error::Error> parse(const etl::ivector<uint8_t>& frame);
    };

} // namespace tap
