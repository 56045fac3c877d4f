/**
 * @file WriteIssuerDataCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Issuer data write command implementation
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Commands/WriteIssuerDataCommand.h"
#include "Tap/Commands/CommandUtils.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "Utils/CryptoUtils.h"
#include "Utils/Logging.h"
#include <etl/algorithm.h>

using namespace tap;
using command_detail::commandError;

namespace
{
    constexpr size_t COUNTER_SIZE = 4;
    constexpr size_t SIGNED_MESSAGE_MAX = buffer::CARD_ID_SIZE + buffer::ISSUER_DATA_MAX + COUNTER_SIZE;
}

WriteIssuerDataCommand::WriteIssuerDataCommand(
    const etl::ivector<uint8_t>& data,
    const etl::ivector<uint8_t>& signature,
    const etl::optional<uint32_t>& counter,
    const etl::optional<PublicKey>& issuerPublicKey)
    : issuerData()
    , issuerDataSize(data.size())
    , signature()
    , counter(counter)
    , issuerPublicKey(issuerPublicKey)
{
    // Oversized input is kept truncated and rejected by preCheck
    const size_t kept = etl::min(data.size(), issuerData.capacity());
    issuerData.assign(data.begin(), data.begin() + kept);

    const size_t signatureKept = etl::min(signature.size(), this->signature.capacity());
    this->signature.assign(signature.begin(), signature.begin() + signatureKept);
}

etl::string_view WriteIssuerDataCommand::name() const
{
    return "WriteIssuerData";
}

etl::expected<void, error::Error> WriteIssuerDataCommand::preCheck(const Card& card) const
{
    if (card.status == CardStatus::NotPersonalized)
    {
        return commandError(error::CommandError::NotPersonalized);
    }

    // Issuer data is locked once the card has been activated
    if (card.isActivated)
    {
        return commandError(error::CommandError::NotActivated);
    }

    const PublicKey* publicKey = nullptr;
    if (issuerPublicKey.has_value())
    {
        publicKey = &issuerPublicKey.value();
    }
    else if (card.issuerPublicKey.has_value())
    {
        publicKey = &card.issuerPublicKey.value();
    }

    if (!publicKey)
    {
        return commandError(error::CommandError::MissingIssuerPublicKey);
    }

    if (issuerDataSize > buffer::ISSUER_DATA_MAX)
    {
        LOG_ERROR("Issuer data of %u bytes exceeds %u", static_cast<unsigned>(issuerDataSize),
                  static_cast<unsigned>(buffer::ISSUER_DATA_MAX));
        return commandError(error::CommandError::DataSizeTooLarge);
    }

    if (card.hasSetting(settings::PROTECT_ISSUER_DATA_AGAINST_REPLAY) && !counter.has_value())
    {
        return commandError(error::CommandError::MissingCounter);
    }

    return verifySignature(card, *publicKey);
}

etl::expected<void, error::Error> WriteIssuerDataCommand::verifySignature(const Card& card, const PublicKey& publicKey) const
{
    etl::vector<uint8_t, SIGNED_MESSAGE_MAX> message;
    if (!card.cardIdBytes(message))
    {
        return commandError(error::CommandError::MissingPreflightRead);
    }

    message.insert(message.end(), issuerData.begin(), issuerData.end());
    if (counter.has_value())
    {
        command_detail::appendCounter(counter.value(), message);
    }

    auto verified = crypto::verifySecp256k1(publicKey, message, signature);
    if (!verified || !verified.value())
    {
        LOG_WARN("Issuer data signature does not verify");
        return commandError(error::CommandError::IssuerSignatureInvalid);
    }

    return {};
}

etl::expected<CommandApdu, error::Error> WriteIssuerDataCommand::buildRequest(const SessionEnvironment& environment)
{
    TlvBuilder builder = TlvBuilder::forCommand(environment.legacyMode());

    auto header = command_detail::appendCardHeader(builder, environment);
    if (!header)
    {
        return etl::unexpected(header.error());
    }

    auto data = builder.appendBytes(TlvTag::IssuerData, issuerData);
    if (!data)
    {
        return etl::unexpected(data.error());
    }

    auto signatureResult = builder.appendBytes(TlvTag::IssuerDataSignature, signature);
    if (!signatureResult)
    {
        return etl::unexpected(signatureResult.error());
    }

    if (counter.has_value())
    {
        auto counterResult = builder.appendInt(TlvTag::IssuerDataCounter, static_cast<int64_t>(counter.value()));
        if (!counterResult)
        {
            return etl::unexpected(counterResult.error());
        }
    }

    return command_detail::finishRequest(Instruction::WriteIssuerData, builder);
}

etl::expected<void, error::Error> WriteIssuerDataCommand::parseResponse(
    const TlvMessage& tlv,
    const SessionEnvironment& environment)
{
    TlvDecoder decoder(tlv);

    etl::string<buffer::CARD_ID_TEXT_MAX> cardId;
    auto cardIdResult = decoder.decodeString(TlvTag::CardId, cardId);
    if (!cardIdResult)
    {
        return cardIdResult;
    }

    if (environment.card.has_value() && environment.card.value().cardId != cardId)
    {
        LOG_ERROR("Card answered with card ID %s", cardId.c_str());
        return commandError(error::CommandError::InvalidResponse);
    }

    LOG_INFO("Issuer data written (%u bytes)", static_cast<unsigned>(issuerData.size()));
    return {};
}

error::Error WriteIssuerDataCommand::mapError(const Card* card, const error::Error& err) const
{
    if (card && card->hasSetting(settings::PROTECT_ISSUER_DATA_AGAINST_REPLAY) &&
        err.is(error::StatusWordError::InvalidParams))
    {
        return error::Error::fromCommand(error::CommandError::DataCannotBeWritten);
    }

    return err;
}
