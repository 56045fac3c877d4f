/**
 * @file ReadCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Preflight read command implementation
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Commands/ReadCommand.h"
#include "Tap/Commands/CommandUtils.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "Utils/CryptoUtils.h"
#include "Utils/Logging.h"

using namespace tap;
using command_detail::commandError;

ReadCommand::ReadCommand()
    : card()
{
}

etl::string_view ReadCommand::name() const
{
    return "Read";
}

bool ReadCommand::requiresCard() const
{
    return false;
}

etl::expected<CommandApdu, error::Error> ReadCommand::buildRequest(const SessionEnvironment& environment)
{
    TlvBuilder builder = TlvBuilder::forCommand(environment.legacyMode());

    auto pin = builder.appendBytes(TlvTag::Pin, environment.accessCode);
    if (!pin)
    {
        return etl::unexpected(pin.error());
    }

    auto mode = builder.appendInt(TlvTag::InteractionMode, static_cast<int64_t>(ReadMode::ReadCard));
    if (!mode)
    {
        return etl::unexpected(mode.error());
    }

    const TerminalKeys* keys = environment.terminalKeys();
    if (keys)
    {
        auto terminal = builder.appendBytes(TlvTag::TerminalPublicKey, keys->publicKey);
        if (!terminal)
        {
            return etl::unexpected(terminal.error());
        }
    }

    return command_detail::finishRequest(Instruction::Read, builder);
}

etl::expected<void, error::Error> ReadCommand::parseResponse(
    const TlvMessage& tlv,
    const SessionEnvironment& environment)
{
    (void)environment;

    card = Card();
    TlvDecoder decoder(tlv);

    auto cardId = decoder.decodeString(TlvTag::CardId, card.cardId);
    if (!cardId)
    {
        return cardId;
    }

    auto manufacturer = decoder.decodeString(TlvTag::ManufacturerName, card.manufacturerName);
    if (!manufacturer)
    {
        return manufacturer;
    }

    auto status = decoder.decodeByte(TlvTag::Status);
    if (!status)
    {
        return etl::unexpected(status.error());
    }
    if (status.value() > static_cast<uint8_t>(CardStatus::Purged))
    {
        LOG_ERROR("Unknown card status 0x%02X", static_cast<unsigned>(status.value()));
        return commandError(error::CommandError::InvalidResponse);
    }
    card.status = static_cast<CardStatus>(status.value());

    etl::string<buffer::TEXT_FIELD_MAX> firmwareText;
    auto firmware = decoder.decodeString(TlvTag::FirmwareVersion, firmwareText);
    if (!firmware)
    {
        return firmware;
    }

    auto version = FirmwareVersion::parse(etl::string_view(firmwareText.data(), firmwareText.size()));
    if (!version)
    {
        LOG_ERROR("Malformed firmware version '%s'", firmwareText.c_str());
        return etl::unexpected(version.error());
    }
    card.firmwareVersion = version.value();

    // Not personalized cards have no key yet
    auto publicKey = decoder.decodeOptionalBytes(TlvTag::CardPublicKey, card.cardPublicKey);
    if (!publicKey)
    {
        return etl::unexpected(publicKey.error());
    }

    auto settingsMask = decoder.decodeOptionalInt(TlvTag::SettingsMask);
    if (!settingsMask)
    {
        return etl::unexpected(settingsMask.error());
    }
    card.settingsMask = static_cast<uint32_t>(settingsMask.value().value_or(0U));

    PublicKey issuerKey;
    auto issuer = decoder.decodeOptionalBytes(TlvTag::IssuerDataPublicKey, issuerKey);
    if (!issuer)
    {
        return etl::unexpected(issuer.error());
    }
    if (issuer.value())
    {
        card.issuerPublicKey = issuerKey;
    }

    auto activated = decoder.decodeOptionalBool(TlvTag::IsActivated);
    if (!activated)
    {
        return etl::unexpected(activated.error());
    }
    card.isActivated = activated.value();

    auto cardData = parseCardData(decoder);
    if (!cardData)
    {
        return cardData;
    }

    auto wallet = parseLegacyWallet(decoder);
    if (!wallet)
    {
        return wallet;
    }

    const etl::string<32> firmwareName = card.firmwareVersion.toString();
    LOG_INFO("Read card %s (firmware %s, %u wallet(s))", card.cardId.c_str(), firmwareName.c_str(),
             static_cast<unsigned>(card.wallets.size()));
    return {};
}

etl::expected<void, error::Error> ReadCommand::parseCardData(const TlvDecoder& decoder)
{
    if (!decoder.contains(TlvTag::CardData))
    {
        return {};
    }

    TlvMessage nested;
    auto nestedResult = decoder.decodeNested(TlvTag::CardData, nested);
    if (!nestedResult)
    {
        return nestedResult;
    }

    TlvDecoder cardData(nested);

    auto batch = cardData.decodeOptionalString(TlvTag::BatchId, card.batchId);
    if (!batch)
    {
        return etl::unexpected(batch.error());
    }

    if (cardData.contains(TlvTag::ManufactureDateTime))
    {
        auto date = cardData.decodeDate(TlvTag::ManufactureDateTime);
        if (!date)
        {
            return etl::unexpected(date.error());
        }
        card.manufactureDate = date.value();
    }

    auto issuerName = cardData.decodeOptionalString(TlvTag::IssuerName, card.issuerName);
    if (!issuerName)
    {
        return etl::unexpected(issuerName.error());
    }

    return {};
}

etl::expected<void, error::Error> ReadCommand::parseLegacyWallet(const TlvDecoder& decoder)
{
    // Single-wallet firmware reports its wallet inline
    if (!decoder.contains(TlvTag::WalletPublicKey))
    {
        return {};
    }

    CardWallet wallet;
    wallet.index = 0;
    wallet.status = WalletStatus::Loaded;

    auto publicKey = decoder.decodeBytes(TlvTag::WalletPublicKey, wallet.publicKey);
    if (!publicKey)
    {
        return publicKey;
    }

    auto curve = decoder.decodeOptionalString(TlvTag::CurveId, wallet.curve);
    if (!curve)
    {
        return etl::unexpected(curve.error());
    }
    if (!curve.value())
    {
        // Older firmware leaves out the curve of its only wallet
        wallet.curve.assign(crypto::CURVE_SECP256K1);
    }

    auto signedHashes = decoder.decodeOptionalInt(TlvTag::WalletSignedHashes);
    if (!signedHashes)
    {
        return etl::unexpected(signedHashes.error());
    }
    wallet.totalSignedHashes = signedHashes.value();

    auto remaining = decoder.decodeOptionalInt(TlvTag::WalletRemainingSignatures);
    if (!remaining)
    {
        return etl::unexpected(remaining.error());
    }
    wallet.remainingSignatures = remaining.value();

    return card.upsertWallet(wallet);
}

const Card& ReadCommand::getCard() const
{
    return card;
}
