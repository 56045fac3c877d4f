/**
 * @file AttestationTask.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card attestation flow implementation
 * @version 0.1
 * @date 2026-03-11
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Attestation/AttestationTask.h"
#include "Tap/Commands/AttestCardKeyCommand.h"
#include "Tap/Commands/AttestWalletKeyCommand.h"
#include "Tap/Session/CardSession.h"
#include "Utils/Logging.h"

using namespace tap;

AttestationTask::AttestationTask(
    AttestationMode mode,
    TrustCache& trustCache,
    IOnlineCardVerifier& onlineVerifier,
    IAttestationPrompt& prompt)
    : mode(mode)
    , trustCache(trustCache)
    , onlineVerifier(onlineVerifier)
    , prompt(prompt)
    , session(nullptr)
    , completion()
    , current()
    , onlineSlot()
    , shouldKeepSessionOpened(false)
{
}

AttestationTask::~AttestationTask()
{
    onlineSlot.reset();
}

void AttestationTask::run(CardSession& cardSession, Completion onComplete)
{
    if (completion)
    {
        LOG_ERROR("Attestation already in progress");
        onComplete(etl::unexpected(error::Error::fromCommand(error::CommandError::InvalidState)));
        return;
    }

    session = &cardSession;
    completion = std::move(onComplete);
    current = Attestation();

    if (!isValidAttestationMode(static_cast<uint8_t>(mode)))
    {
        fail(error::Error::fromAttestation(error::AttestationError::UnsupportedMode));
        return;
    }

    if (!session->card())
    {
        fail(error::Error::fromCommand(error::CommandError::MissingPreflightRead));
        return;
    }

    LOG_INFO("Attestation started in %s mode", modeName(mode).data());
    attestCard();
}

void AttestationTask::attestCard()
{
    AttestCardKeyCommand command;
    auto result = session->executeCommand(command);

    if (result)
    {
        const etl::optional<TrustedVerdict> cached = trustCache.lookup(session->card()->cardPublicKey);
        if (cached.has_value() && modeSatisfies(cached.value().mode, mode))
        {
            LOG_INFO("Card already trusted at %s mode", modeName(cached.value().mode).data());
            current = cached.value().attestation;
            complete();
            return;
        }

        current.cardKeyAttestation = AttestationStatus::VerifiedOffline;
    }
    else if (result.error().isVerificationFailure())
    {
        LOG_WARN("Card key attestation failed");
        current.cardKeyAttestation = AttestationStatus::Failed;
    }
    else
    {
        fail(result.error());
        return;
    }

    continueAttestation();
}

void AttestationTask::continueAttestation()
{
    switch (mode)
    {
        case AttestationMode::Offline:
            processReport();
            break;

        case AttestationMode::Normal:
            dispatchOnline();
            waitForOnline();
            break;

        case AttestationMode::Full:
        {
            dispatchOnline();

            auto wallets = attestWallets();
            if (!wallets)
            {
                fail(wallets.error());
                return;
            }

            current.walletKeysAttestation = wallets.value();
            LOG_INFO("Wallet keys attestation: %s", statusName(wallets.value()).data());
            waitForOnline();
            break;
        }
    }
}

etl::expected<AttestationStatus, error::Error> AttestationTask::attestWallets()
{
    // Snapshot, the session card is not touched by the commands below
    const etl::vector<CardWallet, buffer::WALLETS_MAX> wallets = session->card()->wallets;

    bool hasWarnings = false;

    for (const CardWallet& wallet : wallets)
    {
        if (wallet.totalSignedHashes.has_value() && wallet.totalSignedHashes.value() > MAX_COUNTER)
        {
            hasWarnings = true;
        }
    }

    for (const CardWallet& wallet : wallets)
    {
        if (wallet.publicKey.empty())
        {
            continue;
        }

        AttestWalletKeyCommand command(wallet.publicKey);
        auto result = session->executeCommand(command);
        if (!result)
        {
            if (result.error().isVerificationFailure())
            {
                LOG_WARN("Wallet %u key attestation failed", static_cast<unsigned>(wallet.index));
                return AttestationStatus::Failed;
            }

            return etl::unexpected(result.error());
        }

        const etl::optional<uint64_t>& counter = command.getCounter();
        if (counter.has_value() && counter.value() > MAX_COUNTER)
        {
            LOG_WARN("Wallet %u attest counter %llu looks suspicious", static_cast<unsigned>(wallet.index),
                     static_cast<unsigned long long>(counter.value()));
            hasWarnings = true;
        }
    }

    return hasWarnings ? AttestationStatus::Warning : AttestationStatus::Verified;
}

void AttestationTask::dispatchOnline()
{
    const OnlineResultSlot::Token token = onlineSlot.arm();
    OnlineResultSlot::Publisher publisher = onlineSlot.publisher(token);

    const Card* card = session->card();

    // Development cards never pass, cards that already failed need not be asked
    if (card->isDevelopmentCard() || card->attestation.cardKeyAttestation == AttestationStatus::Failed)
    {
        LOG_DEBUG("Online verification skipped");
        publisher(etl::unexpected(error::Error::fromAttestation(error::AttestationError::CardVerificationFailed)));
        return;
    }

    LOG_DEBUG("Online verification requested (token %u)", static_cast<unsigned>(token));
    onlineVerifier.getCardInfo(etl::string_view(card->cardId.data(), card->cardId.size()), card->cardPublicKey, publisher);
}

void AttestationTask::waitForOnline()
{
    if (!shouldKeepSessionOpened)
    {
        session->pause();
    }

    onlineSlot.subscribe([this](const VerificationResult& result) {
        handleOnlineResult(result);
    });
}

void AttestationTask::handleOnlineResult(const VerificationResult& result)
{
    if (result && result.value().passed)
    {
        current.cardKeyAttestation = AttestationStatus::Verified;
        LOG_INFO("Card verified online");

        auto recorded = trustCache.record(session->card()->cardPublicKey, current, mode);
        if (!recorded)
        {
            LOG_WARN("Trusted card not stored: %s", recorded.error().toString().c_str());
        }
    }
    else if (result || result.error().isVerificationFailure())
    {
        LOG_WARN("Card rejected by online verification");
        current.cardKeyAttestation = AttestationStatus::Failed;
    }
    else
    {
        // Only an explicit rejection changes the verdict
        LOG_WARN("Online verification unavailable: %s", result.error().toString().c_str());
    }

    processReport();
}

void AttestationTask::retryOnline()
{
    if (!session->card())
    {
        fail(error::Error::fromCommand(error::CommandError::MissingPreflightRead));
        return;
    }

    LOG_INFO("Retrying online verification");
    dispatchOnline();
    waitForOnline();
}

void AttestationTask::processReport()
{
    const Card* card = session->card();
    const AttestationStatus status = current.status();
    LOG_INFO("Attestation report: %s", current.toString().c_str());

    switch (status)
    {
        case AttestationStatus::Failed:
        case AttestationStatus::Skipped:
        case AttestationStatus::NotAttested:
        {
            const bool isDevelopmentCard = card->isDevelopmentCard();
            if (isDevelopmentCard || session->environment().config.allowUntrustedCards)
            {
                prompt.attestationDidFail(
                    isDevelopmentCard,
                    [this]() { complete(); },
                    [this]() { fail(error::Error::fromAttestation(error::AttestationError::UserCancelled)); });
                return;
            }

            fail(error::Error::fromAttestation(error::AttestationError::CardVerificationFailed));
            break;
        }

        case AttestationStatus::Verified:
            complete();
            break;

        case AttestationStatus::VerifiedOffline:
            if (session->environment().config.attestationMode == AttestationMode::Offline)
            {
                complete();
                return;
            }

            prompt.attestationCompletedOffline(
                [this]() { complete(); },
                [this]() { fail(error::Error::fromAttestation(error::AttestationError::UserCancelled)); },
                [this]() { retryOnline(); });
            break;

        case AttestationStatus::Warning:
            prompt.attestationCompletedWithWarnings([this]() { complete(); });
            break;
    }
}

void AttestationTask::complete()
{
    auto applied = session->setAttestation(current);
    if (!applied)
    {
        fail(applied.error());
        return;
    }

    LOG_INFO("Attestation completed: %s", statusName(current.status()).data());
    finish(current);
}

void AttestationTask::fail(const error::Error& err)
{
    LOG_ERROR("Attestation failed: %s", err.toString().c_str());
    finish(etl::unexpected(err));
}

void AttestationTask::finish(const etl::expected<Attestation, error::Error>& result)
{
    if (!completion)
    {
        LOG_WARN("Attestation already completed");
        return;
    }

    Completion done = std::move(completion);
    completion = nullptr;
    onlineSlot.reset();
    done(result);
}
