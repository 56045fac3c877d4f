/**
 * @file AttestCardKeyCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card key attestation command implementation
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Commands/AttestCardKeyCommand.h"
#include "Tap/Commands/CommandUtils.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "Utils/CryptoUtils.h"
#include "Utils/Logging.h"

using namespace tap;
using command_detail::commandError;

namespace
{
    // Every request asks for linked cards, the mode only gates the firmware check
    constexpr int64_t REQUESTED_INTERACTION_MODE = static_cast<int64_t>(AttestCardKeyCommand::Mode::Full);

    constexpr char LINKED_CARDS_PREFIX[] = "BACKUP_CARDS";
    constexpr size_t LINKED_CARDS_PREFIX_LENGTH = sizeof(LINKED_CARDS_PREFIX) - 1U;
    constexpr size_t SIGNED_MESSAGE_MAX = buffer::CHALLENGE_SIZE + buffer::SALT_MAX + LINKED_CARDS_PREFIX_LENGTH +
                                          buffer::LINKED_CARDS_MAX * buffer::PUBLIC_KEY_MAX;
}

AttestCardKeyCommand::AttestCardKeyCommand(Mode mode, const Challenge& challenge)
    : mode(mode)
    , challenge(challenge)
    , salt()
    , cardSignature()
    , linkedCardPublicKeys()
{
}

etl::string_view AttestCardKeyCommand::name() const
{
    return "AttestCardKey";
}

etl::expected<void, error::Error> AttestCardKeyCommand::preCheck(const Card& card) const
{
    if (mode == Mode::Full && card.firmwareVersion < firmware::KEYS_IMPORT_AVAILABLE)
    {
        return commandError(error::CommandError::NotSupportedFirmwareVersion);
    }

    if (card.cardPublicKey.empty())
    {
        return commandError(error::CommandError::MissingPreflightRead);
    }

    return {};
}

etl::expected<CommandApdu, error::Error> AttestCardKeyCommand::buildRequest(const SessionEnvironment& environment)
{
    // Re-sends keep the first challenge
    if (challenge.empty())
    {
        auto random = crypto::generateRandomBytes(challenge, buffer::CHALLENGE_SIZE);
        if (!random)
        {
            return etl::unexpected(random.error());
        }
    }

    TlvBuilder builder = TlvBuilder::forCommand(environment.legacyMode());

    auto header = command_detail::appendCardHeader(builder, environment);
    if (!header)
    {
        return etl::unexpected(header.error());
    }

    auto challengeResult = builder.appendBytes(TlvTag::Challenge, challenge);
    if (!challengeResult)
    {
        return etl::unexpected(challengeResult.error());
    }

    auto modeResult = builder.appendInt(TlvTag::InteractionMode, REQUESTED_INTERACTION_MODE);
    if (!modeResult)
    {
        return etl::unexpected(modeResult.error());
    }

    return command_detail::finishRequest(Instruction::AttestCardKey, builder);
}

etl::expected<void, error::Error> AttestCardKeyCommand::parseResponse(
    const TlvMessage& tlv,
    const SessionEnvironment& environment)
{
    if (!environment.card.has_value())
    {
        return commandError(error::CommandError::MissingPreflightRead);
    }

    TlvDecoder decoder(tlv);

    auto saltResult = decoder.decodeBytes(TlvTag::Salt, salt);
    if (!saltResult)
    {
        return saltResult;
    }

    auto signatureResult = decoder.decodeBytes(TlvTag::CardSignature, cardSignature);
    if (!signatureResult)
    {
        return signatureResult;
    }

    auto linkedResult = decoder.decodeAllBytes(TlvTag::BackupCardPublicKey, linkedCardPublicKeys);
    if (!linkedResult)
    {
        return linkedResult;
    }

    etl::vector<uint8_t, SIGNED_MESSAGE_MAX> message;
    message.assign(challenge.begin(), challenge.end());
    message.insert(message.end(), salt.begin(), salt.end());

    if (!linkedCardPublicKeys.empty())
    {
        message.insert(message.end(), LINKED_CARDS_PREFIX, LINKED_CARDS_PREFIX + LINKED_CARDS_PREFIX_LENGTH);
        for (const PublicKey& key : linkedCardPublicKeys)
        {
            message.insert(message.end(), key.begin(), key.end());
        }
    }

    auto verified = crypto::verifySecp256k1(environment.card.value().cardPublicKey, message, cardSignature);
    if (!verified)
    {
        return etl::unexpected(verified.error());
    }

    if (!verified.value())
    {
        LOG_WARN("Card key signature does not verify");
        return etl::unexpected(error::Error::fromAttestation(error::AttestationError::CardVerificationFailed));
    }

    LOG_DEBUG("Card key verified (%u linked card(s))", static_cast<unsigned>(linkedCardPublicKeys.size()));
    return {};
}

const AttestCardKeyCommand::Challenge& AttestCardKeyCommand::getChallenge() const
{
    return challenge;
}

const etl::vector<uint8_t, buffer::SALT_MAX>& AttestCardKeyCommand::getSalt() const
{
    return salt;
}

const etl::vector<uint8_t, buffer::SIGNATURE_MAX>& AttestCardKeyCommand::getCardSignature() const
{
    return cardSignature;
}

const AttestCardKeyCommand::LinkedKeys& AttestCardKeyCommand::getLinkedCardPublicKeys() const
{
    return linkedCardPublicKeys;
}
