/**
 * @file CardSession.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card session driving commands over a transport
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/string_view.h>
#include "SessionEnvironment.h"
#include "Tap/Pipe/SecureChannel.h"
#include "Error/Error.h"

namespace tap
{
    // Forward declarations
    class ICardCommand;
    class ICardTransport;
    class ISessionRecovery;

    /**
     * @brief Card session
     *
     * Owns the SessionEnvironment and runs one command at a time over the
     * transport. Not thread-safe.
     */
    class CardSession
    {
    public:
        /**
         * @brief Construct a new CardSession
         *
         * @param transport Radio session to the card
         * @param config Caller configuration
         * @param recovery Optional collaborator for recoverable card errors
         */
        CardSession(ICardTransport& transport, const SdkConfig& config, ISessionRecovery* recovery = nullptr);

        /**
         * @brief Execute a command
         *
         * Runs the precheck without I/O, then builds, protects and sends the
         * request, checks the status word, unprotects and decodes the
         * response. Recoverable errors are resolved through the recovery
         * collaborator and the command is re-sent, at most
         * config.maxRecoveryAttempts times.
         *
         * @param command Command to execute
         * @return etl::expected<void, error::Error> Success or error
         */
        etl::expected<void, error::Error> executeCommand(ICardCommand& command);

        /**
         * @brief Read the card and store the record in the environment
         *
         * @return etl::expected<void, error::Error> Success or error
         */
        etl::expected<void, error::Error> preflightRead();

        const SessionEnvironment& environment() const
        {
            return env;
        }

        const Card* card() const
        {
            return env.card.has_value() ? &env.card.value() : nullptr;
        }

        void setCard(const Card& card);

        /**
         * @brief Store an attestation verdict on the card record
         */
        etl::expected<void, error::Error> setAttestation(const Attestation& attestation);

        etl::expected<void, error::Error> upsertWallet(const CardWallet& wallet);

        /**
         * @brief Switch payload encryption for subsequent commands
         */
        etl::expected<void, error::Error> setEncryption(EncryptionMode mode, const etl::ivector<uint8_t>& key);

        void setAccessCode(etl::string_view code);

        void setPasscode(etl::string_view code);

        void setTerminalKeys(const TerminalKeys& keys);

        /**
         * @brief Release the radio while the flow waits on something else
         */
        void pause();

        void resume();

        bool isPaused() const
        {
            return paused;
        }

    private:
        etl::expected<void, error::Error> executeOnce(ICardCommand& command);
        etl::expected<void, error::Error> recover(const error::Error& err);

        ICardTransport& transport;
        ISessionRecovery* recovery;
        SessionEnvironment env;
        SecureChannel channel;
        bool paused;
    };

} // namespace tap
