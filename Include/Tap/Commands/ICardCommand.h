/**
 * @file ICardCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card command interface
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string_view.h>
#include <etl/expected.h>
#include "Tap/Apdu/CommandApdu.h"
#include "Tap/Tlv/Tlv.h"
#include "Error/Error.h"

namespace tap
{
    // Forward declarations
    struct Card;
    struct SessionEnvironment;

    /**
     * @brief Card command interface
     *
     * A command is executed by CardSession::executeCommand in fixed stages:
     * preCheck, buildRequest, transceive, parseResponse, mapError. Commands
     * never change the environment; results are kept in the command and
     * applied back through the session by the caller.
     */
    class ICardCommand
    {
    public:
        virtual ~ICardCommand() = default;

        /**
         * @brief Get command name
         *
         * @return etl::string_view Command name
         */
        virtual etl::string_view name() const = 0;

        /**
         * @brief Whether the command needs the card record from a preflight read
         */
        virtual bool requiresCard() const
        {
            return true;
        }

        /**
         * @brief Validate the command against the card before any I/O
         *
         * @param card Card record from the preflight read
         * @return etl::expected<void, error::Error> Success or a terminal error
         */
        virtual etl::expected<void, error::Error> preCheck(const Card& card) const
        {
            (void)card;
            return {};
        }

        /**
         * @brief Build the request
         *
         * Called again for every re-send, so it must pick up environment changes.
         *
         * @param environment Session environment
         * @return etl::expected<CommandApdu, error::Error> Request with a plain TLV payload
         */
        virtual etl::expected<CommandApdu, error::Error> buildRequest(const SessionEnvironment& environment) = 0;

        /**
         * @brief Parse the decoded response
         *
         * @param tlv Response records
         * @param environment Session environment the request was built with
         * @return etl::expected<void, error::Error> Success or error
         */
        virtual etl::expected<void, error::Error> parseResponse(
            const TlvMessage& tlv,
            const SessionEnvironment& environment) = 0;

        /**
         * @brief Translate a failure into a more specific error
         *
         * @param card Card record, nullptr before the preflight read
         * @param err Error raised by any stage after preCheck
         * @return error::Error Error to report
         */
        virtual error::Error mapError(const Card* card, const error::Error& err) const
        {
            (void)card;
            return err;
        }
    };

} // namespace tap
