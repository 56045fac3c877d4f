/**
 * @file ReadCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Preflight read command
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "ICardCommand.h"
#include "Tap/Card/Card.h"
#include "Tap/Tlv/TlvDecoder.h"

namespace tap
{
    /**
     * @brief Read command
     *
     * Reads the card record (INS 0xF2, InteractionMode ReadCard). This is the
     * preflight read every other command depends on.
     */
    class ReadCommand : public ICardCommand
    {
    public:
        ReadCommand();

        etl::string_view name() const override;

        bool requiresCard() const override;

        etl::expected<CommandApdu, error::Error> buildRequest(const SessionEnvironment& environment) override;

        etl::expected<void, error::Error> parseResponse(
            const TlvMessage& tlv,
            const SessionEnvironment& environment) override;

        /**
         * @brief Get the card record decoded from the last response
         *
         * @return const Card& Card record
         */
        const Card& getCard() const;

    private:
        etl::expected<void, error::Error> parseCardData(const TlvDecoder& decoder);
        etl::expected<void, error::Error> parseLegacyWallet(const TlvDecoder& decoder);

        Card card;
    };

} // namespace tap
