/**
 * @file AttestCardKeyCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card key attestation command
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "ICardCommand.h"
#include "Tap/Card/CardWallet.h"
#include <etl/vector.h>

namespace tap
{
    /**
     * @brief AttestCardKey command
     *
     * Sends a 16-byte challenge; the card answers with a salt and its
     * signature over challenge || salt. The request always carries the full
     * interaction mode, so a card with linked cards also returns their public
     * keys, which are appended to the signed message after the
     * "BACKUP_CARDS" prefix. Mode::Full only adds the firmware 6.16 check.
     *
     * A signature that does not verify against the card public key fails
     * with AttestationError::CardVerificationFailed.
     */
    class AttestCardKeyCommand : public ICardCommand
    {
    public:
        enum class Mode : uint8_t
        {
            Default = 0x00,
            Full = 0x01
        };

        using Challenge = etl::vector<uint8_t, buffer::CHALLENGE_SIZE>;
        using LinkedKeys = etl::vector<PublicKey, buffer::LINKED_CARDS_MAX>;

        /**
         * @brief Construct AttestCardKey command
         *
         * @param mode Full requires firmware 6.16 or later
         * @param challenge Fixed challenge; a random one is generated when empty
         */
        explicit AttestCardKeyCommand(Mode mode = Mode::Default, const Challenge& challenge = Challenge());

        etl::string_view name() const override;

        etl::expected<void, error::Error> preCheck(const Card& card) const override;

        etl::expected<CommandApdu, error::Error> buildRequest(const SessionEnvironment& environment) override;

        etl::expected<void, error::Error> parseResponse(
            const TlvMessage& tlv,
            const SessionEnvironment& environment) override;

        const Challenge& getChallenge() const;

        const etl::vector<uint8_t, buffer::SALT_MAX>& getSalt() const;

        const etl::vector<uint8_t, buffer::SIGNATURE_MAX>& getCardSignature() const;

        const LinkedKeys& getLinkedCardPublicKeys() const;

    private:
        Mode mode;
        Challenge challenge;
        etl::vector<uint8_t, buffer::SALT_MAX> salt;
        etl::vector<uint8_t, buffer::SIGNATURE_MAX> cardSignature;
        LinkedKeys linkedCardPublicKeys;
    };

} // namespace tap
