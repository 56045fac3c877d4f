/**
 * @file WriteIssuerDataCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Issuer data write command
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "ICardCommand.h"
#include "Tap/Card/CardWallet.h"
#include <etl/optional.h>

namespace tap
{
    /**
     * @brief WriteIssuerData command
     *
     * Writes up to 512 bytes of issuer data signed by the issuer key.
     * The signature covers cardId || data, followed by the 4-byte big-endian
     * counter when one is given. Cards with replay protection require the
     * counter and reject stale ones with InvalidParams.
     */
    class WriteIssuerDataCommand : public ICardCommand
    {
    public:
        using IssuerData = etl::vector<uint8_t, buffer::TLV_VALUE_MAX>;
        using Signature = etl::vector<uint8_t, buffer::SIGNATURE_MAX>;

        /**
         * @brief Construct WriteIssuerData command
         *
         * @param data Issuer data
         * @param signature Issuer signature (64-byte r || s)
         * @param counter Anti-replay counter
         * @param issuerPublicKey Key to check the signature with, defaults to the key read from the card
         */
        WriteIssuerDataCommand(
            const etl::ivector<uint8_t>& data,
            const etl::ivector<uint8_t>& signature,
            const etl::optional<uint32_t>& counter = etl::optional<uint32_t>(),
            const etl::optional<PublicKey>& issuerPublicKey = etl::optional<PublicKey>());

        etl::string_view name() const override;

        etl::expected<void, error::Error> preCheck(const Card& card) const override;

        etl::expected<CommandApdu, error::Error> buildRequest(const SessionEnvironment& environment) override;

        etl::expected<void, error::Error> parseResponse(
            const TlvMessage& tlv,
            const SessionEnvironment& environment) override;

        error::Error mapError(const Card* card, const error::Error& err) const override;

    private:
        etl::expected<void, error::Error> verifySignature(const Card& card, const PublicKey& publicKey) const;

        IssuerData issuerData;
        size_t issuerDataSize;
        Signature signature;
        etl::optional<uint32_t> counter;
        etl::optional<PublicKey> issuerPublicKey;
    };

} // namespace tap
