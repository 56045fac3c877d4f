/**
 * @file CardSession.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card session implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Session/CardSession.h"
#include "Tap/Session/ISessionRecovery.h"
#include "Tap/Apdu/ICardTransport.h"
#include "Tap/Apdu/ResponseApdu.h"
#include "Tap/Commands/ICardCommand.h"
#include "Tap/Commands/ReadCommand.h"
#include "Utils/Logging.h"

using namespace tap;

namespace
{
    void logError(etl::string_view commandName, const error::Error& err)
    {
        const etl::string<160> text = err.toString();
        LOG_ERROR("%.*s failed: %s", static_cast<int>(commandName.size()), commandName.data(), text.c_str());
    }
}

CardSession::CardSession(ICardTransport& transport, const SdkConfig& config, ISessionRecovery* recovery)
    : transport(transport)
    , recovery(recovery)
    , env(config)
    , channel()
    , paused(false)
{
    Logger::setLevel(config.logLevel);
}

etl::expected<void, error::Error> CardSession::executeCommand(ICardCommand& command)
{
    const etl::string_view name = command.name();

    // 1. Precheck, no I/O
    if (command.requiresCard() && !env.card.has_value())
    {
        LOG_ERROR("%.*s requires a preflight read", static_cast<int>(name.size()), name.data());
        return etl::unexpected(error::Error::fromCommand(error::CommandError::MissingPreflightRead));
    }

    if (env.card.has_value())
    {
        auto preCheckResult = command.preCheck(env.card.value());
        if (!preCheckResult)
        {
            logError(name, preCheckResult.error());
            return etl::unexpected(preCheckResult.error());
        }
    }

    uint8_t attempts = 0;
    while (true)
    {
        auto result = executeOnce(command);
        if (result)
        {
            return {};
        }

        // 2. Error mapping with the current card state
        const error::Error err = command.mapError(card(), result.error());
        if (!err.isRecoverable())
        {
            logError(name, err);
            return etl::unexpected(err);
        }

        // 3. Retry policy
        if (attempts >= env.config.maxRecoveryAttempts)
        {
            LOG_ERROR("%.*s: giving up after %u recovery attempts", static_cast<int>(name.size()), name.data(),
                      static_cast<unsigned>(attempts));
            return etl::unexpected(error::Error::fromCommand(error::CommandError::RetryLimitExceeded));
        }
        ++attempts;

        auto recoverResult = recover(err);
        if (!recoverResult)
        {
            logError(name, recoverResult.error());
            return etl::unexpected(recoverResult.error());
        }

        LOG_INFO("%.*s: re-sending (attempt %u)", static_cast<int>(name.size()), name.data(),
                 static_cast<unsigned>(attempts + 1U));
    }
}

etl::expected<void, error::Error> CardSession::executeOnce(ICardCommand& command)
{
    if (paused)
    {
        resume();
    }

    // 1. Build request
    auto requestResult = command.buildRequest(env);
    if (!requestResult)
    {
        return etl::unexpected(requestResult.error());
    }

    CommandApdu& request = requestResult.value();
    request.p1 = static_cast<uint8_t>(env.encryptionMode);

    // 2. Protect payload
    auto pipeResult = channel.makeSecurePipe(env.encryptionMode, env.encryptionKey);
    if (!pipeResult)
    {
        return etl::unexpected(pipeResult.error());
    }
    ISecurePipe* pipe = pipeResult.value();

    auto protectedPayload = pipe->protect(request.data);
    if (!protectedPayload)
    {
        return etl::unexpected(protectedPayload.error());
    }
    request.data = protectedPayload.value();

    ApduFrame frame;
    auto serializeResult = request.serialize(frame);
    if (!serializeResult)
    {
        return etl::unexpected(serializeResult.error());
    }

    // 3. Transceive
    const etl::string_view name = command.name();
    LOG_DEBUG("%.*s: sending %u bytes (INS 0x%02X)", static_cast<int>(name.size()), name.data(),
              static_cast<unsigned>(frame.size()), static_cast<unsigned>(request.ins));

    auto rawResult = transport.transceive(frame);
    if (!rawResult)
    {
        return etl::unexpected(rawResult.error());
    }

    auto responseResult = ResponseApdu::parse(rawResult.value());
    if (!responseResult)
    {
        return etl::unexpected(responseResult.error());
    }
    const ResponseApdu& response = responseResult.value();

    LOG_DEBUG("%.*s: SW %04X", static_cast<int>(name.size()), name.data(),
              static_cast<unsigned>(response.getStatusWord()));

    // 4. Status word
    if (!response.isSuccess())
    {
        return etl::unexpected(response.statusError());
    }

    // 5. Unprotect and decode
    auto plain = pipe->unprotect(response.data);
    if (!plain)
    {
        return etl::unexpected(plain.error());
    }

    TlvMessage tlv;
    auto decodeResult = deserializeTlv(plain.value(), tlv);
    if (!decodeResult)
    {
        return etl::unexpected(decodeResult.error());
    }

    return command.parseResponse(tlv, env);
}

etl::expected<void, error::Error> CardSession::recover(const error::Error& err)
{
    if (!recovery)
    {
        return etl::unexpected(err);
    }

    if (err.is(error::StatusWordError::NeedEncryption))
    {
        auto keyResult = recovery->renegotiateEncryption(env);
        if (!keyResult)
        {
            return etl::unexpected(keyResult.error());
        }
        return setEncryption(keyResult.value().mode, keyResult.value().key);
    }

    const CodeType type = err.is(error::StatusWordError::InvalidPasscode) ? CodeType::Passcode : CodeType::AccessCode;
    auto codeResult = recovery->requestCode(type);
    if (!codeResult)
    {
        return etl::unexpected(codeResult.error());
    }

    const CodeText& code = codeResult.value();
    if (type == CodeType::Passcode)
    {
        setPasscode(etl::string_view(code.data(), code.size()));
    }
    else
    {
        setAccessCode(etl::string_view(code.data(), code.size()));
    }
    return {};
}

etl::expected<void, error::Error> CardSession::preflightRead()
{
    ReadCommand command;
    auto result = executeCommand(command);
    if (!result)
    {
        return result;
    }

    setCard(command.getCard());
    return {};
}

void CardSession::setCard(const Card& card)
{
    env.card = card;
}

etl::expected<void, error::Error> CardSession::setAttestation(const Attestation& attestation)
{
    if (!env.card.has_value())
    {
        return etl::unexpected(error::Error::fromCommand(error::CommandError::MissingPreflightRead));
    }

    env.card.value().attestation = attestation;
    return {};
}

etl::expected<void, error::Error> CardSession::upsertWallet(const CardWallet& wallet)
{
    if (!env.card.has_value())
    {
        return etl::unexpected(error::Error::fromCommand(error::CommandError::MissingPreflightRead));
    }

    return env.card.value().upsertWallet(wallet);
}

etl::expected<void, error::Error> CardSession::setEncryption(EncryptionMode mode, const etl::ivector<uint8_t>& key)
{
    if (mode != EncryptionMode::None && key.empty())
    {
        return etl::unexpected(error::Error::fromEnvelope(error::EnvelopeError::MissingEncryptionKey));
    }

    if (key.size() > env.encryptionKey.capacity())
    {
        return etl::unexpected(error::Error::fromEnvelope(error::EnvelopeError::InvalidKeyLength));
    }

    env.encryptionMode = mode;
    env.encryptionKey.assign(key.begin(), key.end());

    etl::string_view modeText = encryptionModeName(mode);
    LOG_INFO("Encryption mode set to %.*s", static_cast<int>(modeText.size()), modeText.data());
    return {};
}

void CardSession::setAccessCode(etl::string_view code)
{
    env.accessCode = SessionEnvironment::hashCode(code);
}

void CardSession::setPasscode(etl::string_view code)
{
    env.passcode = SessionEnvironment::hashCode(code);
}

void CardSession::setTerminalKeys(const TerminalKeys& keys)
{
    env.terminalKeyPair = keys;
}

void CardSession::pause()
{
    if (!paused)
    {
        LOG_DEBUG("Pausing card session");
        transport.pause();
        paused = true;
    }
}

void CardSession::resume()
{
    if (paused)
    {
        LOG_DEBUG("Resuming card session");
        transport.resume();
        paused = false;
    }
}
