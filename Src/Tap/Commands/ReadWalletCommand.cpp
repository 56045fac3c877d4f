/**
 * @file ReadWalletCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Read wallet command implementation
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Commands/ReadWalletCommand.h"
#include "Tap/Commands/CommandUtils.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "Utils/Logging.h"

using namespace tap;
using command_detail::commandError;

ReadWalletCommand::ReadWalletCommand(uint32_t walletIndex)
    : walletIndex(walletIndex)
    , wallet()
{
}

etl::string_view ReadWalletCommand::name() const
{
    return "ReadWallet";
}

etl::expected<void, error::Error> ReadWalletCommand::preCheck(const Card& card) const
{
    if (card.status == CardStatus::NotPersonalized)
    {
        return commandError(error::CommandError::NotPersonalized);
    }

    return {};
}

etl::expected<CommandApdu, error::Error> ReadWalletCommand::buildRequest(const SessionEnvironment& environment)
{
    TlvBuilder builder = TlvBuilder::forCommand(environment.legacyMode());

    auto pin = builder.appendBytes(TlvTag::Pin, environment.accessCode);
    if (!pin)
    {
        return etl::unexpected(pin.error());
    }

    auto mode = builder.appendInt(TlvTag::InteractionMode, static_cast<int64_t>(ReadMode::ReadWallet));
    if (!mode)
    {
        return etl::unexpected(mode.error());
    }

    if (!environment.card.has_value())
    {
        return commandError(error::CommandError::MissingPreflightRead);
    }

    const Card& card = environment.card.value();
    auto cardId = builder.appendString(TlvTag::CardId, etl::string_view(card.cardId.data(), card.cardId.size()));
    if (!cardId)
    {
        return etl::unexpected(cardId.error());
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

    auto index = builder.appendInt(TlvTag::WalletIndex, walletIndex);
    if (!index)
    {
        return etl::unexpected(index.error());
    }

    LOG_DEBUG("Reading wallet at index %u", static_cast<unsigned>(walletIndex));
    return command_detail::finishRequest(Instruction::Read, builder);
}

etl::expected<void, error::Error> ReadWalletCommand::parseResponse(
    const TlvMessage& tlv,
    const SessionEnvironment& environment)
{
    (void)environment;

    wallet = CardWallet();
    TlvDecoder decoder(tlv);

    auto index = decoder.decodeOptionalInt(TlvTag::WalletIndex);
    if (!index)
    {
        return etl::unexpected(index.error());
    }
    wallet.index = static_cast<uint32_t>(index.value().value_or(walletIndex));

    if (wallet.index != walletIndex)
    {
        LOG_ERROR("Requested wallet %u, card answered %u", static_cast<unsigned>(walletIndex),
                  static_cast<unsigned>(wallet.index));
        return commandError(error::CommandError::InvalidResponse);
    }

    auto status = decoder.decodeByte(TlvTag::WalletStatus);
    if (!status)
    {
        return etl::unexpected(status.error());
    }
    if (status.value() < static_cast<uint8_t>(WalletStatus::Empty) ||
        status.value() > static_cast<uint8_t>(WalletStatus::Purged))
    {
        return commandError(error::CommandError::InvalidResponse);
    }
    wallet.status = static_cast<WalletStatus>(status.value());

    if (wallet.status != WalletStatus::Loaded)
    {
        return {};
    }

    auto publicKey = decoder.decodeBytes(TlvTag::WalletPublicKey, wallet.publicKey);
    if (!publicKey)
    {
        return publicKey;
    }

    auto curve = decoder.decodeString(TlvTag::CurveId, wallet.curve);
    if (!curve)
    {
        return curve;
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

    return {};
}

error::Error ReadWalletCommand::mapError(const Card* card, const error::Error& err) const
{
    (void)card;

    if (err.is(error::StatusWordError::WalletNotFound))
    {
        return error::Error::fromCommand(error::CommandError::WalletNotFound);
    }

    return err;
}

const CardWallet& ReadWalletCommand::getWallet() const
{
    return wallet;
}
