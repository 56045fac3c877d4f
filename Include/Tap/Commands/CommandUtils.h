/**
 * @file CommandUtils.h
 * @brief Internal helpers shared by card commands
 */

#pragma once

#include "Tap/Apdu/CommandApdu.h"
#include "Tap/Session/SessionEnvironment.h"
#include "Tap/Tlv/TlvBuilder.h"
#include "Error/Error.h"
#include <etl/expected.h>

namespace tap
{
    namespace command_detail
    {
        inline etl::unexpected<error::Error> commandError(error::CommandError err)
        {
            return etl::unexpected<error::Error>(error::Error::fromCommand(err));
        }

        /**
         * @brief Append the access code hash and card ID most commands start with
         */
        inline etl::expected<void, error::Error> appendCardHeader(TlvBuilder& builder, const SessionEnvironment& environment)
        {
            auto pin = builder.appendBytes(TlvTag::Pin, environment.accessCode);
            if (!pin)
            {
                return pin;
            }

            if (!environment.card.has_value())
            {
                return commandError(error::CommandError::MissingPreflightRead);
            }

            const Card& card = environment.card.value();
            return builder.appendString(TlvTag::CardId, etl::string_view(card.cardId.data(), card.cardId.size()));
        }

        /**
         * @brief Serialize the builder into a command APDU
         */
        inline etl::expected<CommandApdu, error::Error> finishRequest(Instruction instruction, const TlvBuilder& builder)
        {
            CommandApdu apdu;
            apdu.ins = instruction;

            auto serialized = builder.serialize(apdu.data);
            if (!serialized)
            {
                return etl::unexpected(serialized.error());
            }

            return apdu;
        }

        /**
         * @brief Append a 32-bit counter as 4 big-endian bytes
         */
        inline void appendCounter(uint32_t counter, etl::ivector<uint8_t>& out)
        {
            out.push_back(static_cast<uint8_t>((counter >> 24) & 0xFF));
            out.push_back(static_cast<uint8_t>((counter >> 16) & 0xFF));
            out.push_back(static_cast<uint8_t>((counter >> 8) & 0xFF));
            out.push_back(static_cast<uint8_t>(counter & 0xFF));
        }

    } // namespace command_detail

} // namespace tap
