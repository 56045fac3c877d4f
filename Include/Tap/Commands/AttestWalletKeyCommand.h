/**
 * @file AttestWalletKeyCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Wallet key attestation command
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "ICardCommand.h"
#include "Tap/Card/CardWallet.h"
#include <etl/optional.h>
#include <etl/string.h>

namespace tap
{
    /**
     * @brief AttestWalletKey command
     *
     * Challenges one wallet; the wallet signs challenge || salt with its key.
     * The signature is checked with the scheme of the wallet's curve, an
     * unnamed curve is secp256k1.
     */
    class AttestWalletKeyCommand : public ICardCommand
    {
    public:
        explicit AttestWalletKeyCommand(const PublicKey& walletPublicKey);

        etl::string_view name() const override;

        etl::expected<void, error::Error> preCheck(const Card& card) const override;

        etl::expected<CommandApdu, error::Error> buildRequest(const SessionEnvironment& environment) override;

        etl::expected<void, error::Error> parseResponse(
            const TlvMessage& tlv,
            const SessionEnvironment& environment) override;

        error::Error mapError(const Card* card, const error::Error& err) const override;

        /**
         * @brief Number of wallet attestations the card has answered, when reported
         */
        const etl::optional<uint64_t>& getCounter() const;

    private:
        PublicKey walletPublicKey;
        etl::string<buffer::TEXT_FIELD_MAX> curve;
        etl::vector<uint8_t, buffer::CHALLENGE_SIZE> challenge;
        etl::optional<uint64_t> counter;
    };

} // namespace tap
