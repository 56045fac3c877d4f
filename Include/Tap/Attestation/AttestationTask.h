/**
 * @file AttestationTask.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card attestation flow
 * @version 0.1
 * @date 2026-03-11
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <functional>
#include <etl/expected.h>
#include "Attestation.h"
#include "IAttestationPrompt.h"
#include "IOnlineCardVerifier.h"
#include "OnlineResultSlot.h"
#include "TrustCache.h"
#include "Error/Error.h"

namespace tap
{
    class CardSession;

    /**
     * @brief Attests the card in a session and decides whether it can be used
     *
     * Flow: card key challenge, trust cache short-circuit, online lookup
     * (normal and full), wallet key challenges (full), then the decision
     * policy with user prompts where consent is needed. On success the
     * verdict is written to the session's card.
     *
     * Card commands run on the caller's thread inside run(). The online
     * answer and prompt callbacks may arrive later on any thread; the
     * completion is invoked exactly once from whichever thread finishes the
     * flow. The task, session, cache, verifier and prompt must stay alive
     * until then. Destroying the task drops any pending online result.
     */
    class AttestationTask
    {
    public:
        using Completion = std::function<void(const etl::expected<Attestation, error::Error>&)>;

        /// Attest or sign counters above this look suspicious
        static constexpr uint64_t MAX_COUNTER = 100000;

        AttestationTask(
            AttestationMode mode,
            TrustCache& trustCache,
            IOnlineCardVerifier& onlineVerifier,
            IAttestationPrompt& prompt);

        ~AttestationTask();

        AttestationTask(const AttestationTask&) = delete;
        AttestationTask& operator=(const AttestationTask&) = delete;

        /**
         * @brief Run the flow
         *
         * @param session Session with a preflight read done
         * @param completion Final verdict, or the error that ended the flow
         */
        void run(CardSession& session, Completion completion);

        /**
         * @brief Keep the transport active while waiting for the online answer
         *
         * Off by default: the transport is paused once no more card commands
         * are needed.
         */
        void setShouldKeepSessionOpened(bool keepOpened)
        {
            shouldKeepSessionOpened = keepOpened;
        }

        AttestationMode getMode() const
        {
            return mode;
        }

    private:
        void attestCard();
        void continueAttestation();
        etl::expected<AttestationStatus, error::Error> attestWallets();
        void dispatchOnline();
        void waitForOnline();
        void handleOnlineResult(const VerificationResult& result);
        void retryOnline();
        void processReport();
        void complete();
        void finish(const etl::expected<Attestation, error::Error>& result);
        void fail(const error::Error& err);

        AttestationMode mode;
        TrustCache& trustCache;
        IOnlineCardVerifier& onlineVerifier;
        IAttestationPrompt& prompt;

        CardSession* session;
        Completion completion;
        Attestation current;
        OnlineResultSlot onlineSlot;
        bool shouldKeepSessionOpened;
    };

} // namespace tap
