/**
 * @file ICardTransport.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Transport collaborator interface
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/vector.h>

#include "CommandApdu.h"
#include "Error/Error.h"

namespace tap
{
    /**
     * @brief Interface for the radio session that carries APDUs to the card
     *
     * One request is in flight at a time. The session calls pause() when it
     * has no further need for the card for a while (e.g. while waiting on a
     * network call) and resume() before the next exchange.
     */
    class ICardTransport
    {
    public:
        virtual ~ICardTransport() = default;

        /**
         * @brief Transmit a command frame and receive the raw response
         *
         * @param request Serialized command APDU
         * @return etl::expected<ApduFrame, error::Error> DATA SW1 SW2, or a TransportError
         */
        virtual etl::expected<ApduFrame, error::Error> transceive(const etl::ivector<uint8_t>& request) = 0;

        virtual void pause() = 0;

        virtual void resume() = 0;
    };

} // namespace tap
