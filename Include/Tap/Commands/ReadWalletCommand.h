/**
 * @file ReadWalletCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Read one wallet by index
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "ICardCommand.h"
#include "Tap/Card/CardWallet.h"

namespace tap
{
    /**
     * @brief ReadWallet command
     *
     * Read instruction with InteractionMode ReadWallet for one wallet index.
     */
    class ReadWalletCommand : public ICardCommand
    {
    public:
        explicit ReadWalletCommand(uint32_t walletIndex);

        etl::string_view name() const override;

        etl::expected<void, error::Error> preCheck(const Card& card) const override;

        etl::expected<CommandApdu, error::Error> buildRequest(const SessionEnvironment& environment) override;

        etl::expected<void, error::Error> parseResponse(
            const TlvMessage& tlv,
            const SessionEnvironment& environment) override;

        /**
         * @brief WalletNotFound status word becomes CommandError::WalletNotFound
         */
        error::Error mapError(const Card* card, const error::Error& err) const override;

        const CardWallet& getWallet() const;

    private:
        uint32_t walletIndex;
        CardWallet wallet;
    };

} // namespace tap
