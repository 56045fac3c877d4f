/**
 * @file AttestWalletKeyCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Wallet key attestation command implementation
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Commands/AttestWalletKeyCommand.h"
#include "Tap/Commands/CommandUtils.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "Utils/CryptoUtils.h"
#include "Utils/Logging.h"

using namespace tap;
using command_detail::commandError;

namespace
{
    const CardWallet* findByKey(const Card& card, const PublicKey& publicKey)
    {
        for (const CardWallet& wallet : card.wallets)
        {
            if (wallet.publicKey == publicKey)
            {
                return &wallet;
            }
        }
        return nullptr;
    }
}

AttestWalletKeyCommand::AttestWalletKeyCommand(const PublicKey& walletPublicKey)
    : walletPublicKey(walletPublicKey)
    , curve()
    , challenge()
    , counter()
{
}

etl::string_view AttestWalletKeyCommand::name() const
{
    return "AttestWalletKey";
}

etl::expected<void, error::Error> AttestWalletKeyCommand::preCheck(const Card& card) const
{
    const CardWallet* wallet = findByKey(card, walletPublicKey);
    if (!wallet)
    {
        return commandError(error::CommandError::WalletNotFound);
    }

    if (!crypto::isSupportedCurve(etl::string_view(wallet->curve.data(), wallet->curve.size())))
    {
        LOG_ERROR("Wallet %u uses unsupported curve %s", static_cast<unsigned>(wallet->index), wallet->curve.c_str());
        return commandError(error::CommandError::UnsupportedCurve);
    }

    return {};
}

etl::expected<CommandApdu, error::Error> AttestWalletKeyCommand::buildRequest(const SessionEnvironment& environment)
{
    if (!environment.card.has_value())
    {
        return commandError(error::CommandError::MissingPreflightRead);
    }

    const CardWallet* wallet = findByKey(environment.card.value(), walletPublicKey);
    if (!wallet)
    {
        return commandError(error::CommandError::WalletNotFound);
    }
    curve = wallet->curve;

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

    auto index = builder.appendInt(TlvTag::WalletIndex, wallet->index);
    if (!index)
    {
        return etl::unexpected(index.error());
    }

    return command_detail::finishRequest(Instruction::AttestWalletKey, builder);
}

etl::expected<void, error::Error> AttestWalletKeyCommand::parseResponse(
    const TlvMessage& tlv,
    const SessionEnvironment& environment)
{
    (void)environment;

    TlvDecoder decoder(tlv);

    etl::vector<uint8_t, buffer::SALT_MAX> salt;
    auto saltResult = decoder.decodeBytes(TlvTag::Salt, salt);
    if (!saltResult)
    {
        return saltResult;
    }

    etl::vector<uint8_t, buffer::SIGNATURE_MAX> signature;
    auto signatureResult = decoder.decodeBytes(TlvTag::WalletSignature, signature);
    if (!signatureResult)
    {
        return signatureResult;
    }

    auto counterResult = decoder.decodeOptionalInt(TlvTag::CheckWalletCounter);
    if (!counterResult)
    {
        return etl::unexpected(counterResult.error());
    }
    counter = counterResult.value();

    etl::vector<uint8_t, buffer::CHALLENGE_SIZE + buffer::SALT_MAX> message;
    message.assign(challenge.begin(), challenge.end());
    message.insert(message.end(), salt.begin(), salt.end());

    auto verified = crypto::verifySignature(etl::string_view(curve.data(), curve.size()), walletPublicKey, message, signature);
    if (!verified)
    {
        return etl::unexpected(verified.error());
    }

    if (!verified.value())
    {
        LOG_WARN("Wallet key signature does not verify");
        return etl::unexpected(error::Error::fromAttestation(error::AttestationError::CardVerificationFailed));
    }

    return {};
}

error::Error AttestWalletKeyCommand::mapError(const Card* card, const error::Error& err) const
{
    (void)card;

    if (err.is(error::StatusWordError::WalletNotFound))
    {
        return error::Error::fromCommand(error::CommandError::WalletNotFound);
    }

    return err;
}

const etl::optional<uint64_t>& AttestWalletKeyCommand::getCounter() const
{
    return counter;
}
