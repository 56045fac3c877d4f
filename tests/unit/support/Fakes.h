/**
 * @file Fakes.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Fakes for the attestation collaborators
 * @version 0.1
 * @date 2026-03-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "Tap/Attestation/IAttestationPrompt.h"
#include "Tap/Attestation/IOnlineCardVerifier.h"
#include "Tap/Attestation/ISecureStorage.h"
#include "Tap/Session/ISessionRecovery.h"

namespace fake
{
    /**
     * @brief Verification service answering immediately or on demand
     */
    class FakeVerifier : public tap::IOnlineCardVerifier
    {
    public:
        enum class Answer
        {
            Passed,
            Rejected,
            NetworkError,
            Hold           // Keep the callback for deliver()
        };

        void getCardInfo(etl::string_view cardId, const etl::ivector<uint8_t>& cardPublicKey, Callback callback) override
        {
            (void)cardPublicKey;
            ++calls;
            lastCardId.assign(cardId.begin(), cardId.end());

            const Answer current = answers.empty() ? defaultAnswer : answers.front();
            if (!answers.empty())
            {
                answers.erase(answers.begin());
            }

            if (current == Answer::Hold)
            {
                held.push_back(callback);
                return;
            }

            callback(make(current));
        }

        /**
         * @brief Invoke a held callback
         */
        void deliver(size_t which, Answer answer)
        {
            // Copy first, the callback may trigger another lookup that grows held
            Callback callback = held.at(which);
            callback(make(answer));
        }

        tap::VerificationResult make(Answer answer) const
        {
            switch (answer)
            {
                case Answer::Rejected:
                    return etl::unexpected(error::Error::fromAttestation(error::AttestationError::CardVerificationFailed));
                case Answer::NetworkError:
                    return etl::unexpected(error::Error::fromAttestation(error::AttestationError::NetworkError));
                default:
                {
                    tap::VerificationRecord record;
                    record.cardId = lastCardId;
                    record.passed = true;
                    record.manufacturerName = "TANGEM";
                    return record;
                }
            }
        }

        Answer defaultAnswer = Answer::Passed;
        std::vector<Answer> answers;
        std::vector<Callback> held;
        size_t calls = 0;
        etl::string<tap::buffer::CARD_ID_TEXT_MAX> lastCardId;
    };

    /**
     * @brief Prompt that picks a scripted choice
     */
    class FakePrompt : public tap::IAttestationPrompt
    {
    public:
        enum class Choice
        {
            Continue,
            Cancel,
            Retry,
            Ignore         // Keep the actions for later
        };

        void attestationDidFail(bool isDevelopmentCard, Action onContinue, Action onCancel) override
        {
            ++didFailCount;
            lastIsDevelopmentCard = isDevelopmentCard;
            pick(onContinue, onCancel, nullptr);
        }

        void attestationCompletedOffline(Action onContinue, Action onCancel, Action onRetry) override
        {
            ++offlineCount;
            pick(onContinue, onCancel, onRetry);
        }

        void attestationCompletedWithWarnings(Action onContinue) override
        {
            ++warningCount;
            pick(onContinue, nullptr, nullptr);
        }

        std::vector<Choice> choices;
        Choice defaultChoice = Choice::Continue;
        size_t didFailCount = 0;
        size_t offlineCount = 0;
        size_t warningCount = 0;
        bool lastIsDevelopmentCard = false;
        Action pendingContinue;

    private:
        void pick(const Action& onContinue, const Action& onCancel, const Action& onRetry)
        {
            const Choice choice = choices.empty() ? defaultChoice : choices.front();
            if (!choices.empty())
            {
                choices.erase(choices.begin());
            }

            switch (choice)
            {
                case Choice::Cancel:
                    if (onCancel)
                    {
                        onCancel();
                        return;
                    }
                    break;
                case Choice::Retry:
                    if (onRetry)
                    {
                        onRetry();
                        return;
                    }
                    break;
                case Choice::Ignore:
                    pendingContinue = onContinue;
                    return;
                default:
                    break;
            }
            onContinue();
        }
    };

    /**
     * @brief In-memory secure storage
     */
    class MemoryStorage : public tap::ISecureStorage
    {
    public:
        etl::expected<bool, error::Error> get(etl::string_view key, etl::ivector<uint8_t>& out) override
        {
            out.clear();
            if (failReads)
            {
                return etl::unexpected(readError);
            }

            auto it = values.find(std::string(key.data(), key.size()));
            if (it == values.end())
            {
                return false;
            }

            if (it->second.size() > out.capacity())
            {
                return etl::unexpected(error::Error::fromStorage(error::StorageError::CapacityExceeded));
            }

            out.assign(it->second.begin(), it->second.end());
            return true;
        }

        etl::expected<void, error::Error> set(etl::string_view key, const etl::ivector<uint8_t>& value) override
        {
            if (failWrites)
            {
                return etl::unexpected(writeError);
            }

            ++writes;
            values[std::string(key.data(), key.size())] = std::vector<uint8_t>(value.begin(), value.end());
            return {};
        }

        etl::expected<void, error::Error> remove(etl::string_view key) override
        {
            values.erase(std::string(key.data(), key.size()));
            return {};
        }

        std::map<std::string, std::vector<uint8_t>> values;
        bool failReads = false;
        bool failWrites = false;
        error::Error readError = error::Error::fromStorage(error::StorageError::ReadFailed);
        error::Error writeError = error::Error::fromStorage(error::StorageError::WriteFailed);
        size_t writes = 0;
    };

    /**
     * @brief Session recovery returning scripted codes and keys
     */
    class FakeRecovery : public tap::ISessionRecovery
    {
    public:
        etl::expected<tap::CodeText, error::Error> requestCode(tap::CodeType type) override
        {
            ++codeRequests;
            lastCodeType = type;
            if (cancelCodeEntry)
            {
                return etl::unexpected(error::Error::fromAttestation(error::AttestationError::UserCancelled));
            }
            return code;
        }

        etl::expected<tap::SessionKey, error::Error> renegotiateEncryption(const tap::SessionEnvironment& environment) override
        {
            (void)environment;
            ++renegotiations;
            tap::SessionKey sessionKey;
            sessionKey.mode = tap::EncryptionMode::Fast;
            sessionKey.key = key;
            return sessionKey;
        }

        tap::CodeText code;
        tap::SessionKeyBytes key;
        bool cancelCodeEntry = false;
        size_t codeRequests = 0;
        size_t renegotiations = 0;
        tap::CodeType lastCodeType = tap::CodeType::AccessCode;
    };

} // namespace fake
