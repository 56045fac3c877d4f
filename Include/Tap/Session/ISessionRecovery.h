/**
 * @file ISessionRecovery.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Recovery collaborator for recoverable card errors
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/string.h>
#include "SessionEnvironment.h"
#include "Error/Error.h"

namespace tap
{
    enum class CodeType : uint8_t
    {
        AccessCode,
        Passcode
    };

    using CodeText = etl::string<buffer::TEXT_FIELD_MAX>;

    /**
     * @brief Negotiated encryption for the rest of the session
     */
    struct SessionKey
    {
        EncryptionMode mode;
        SessionKeyBytes key;
    };

    /**
     * @brief Supplies what a CardSession needs to re-send a rejected command
     *
     * Returning an error (typically UserCancelled) stops the command with
     * that error.
     */
    class ISessionRecovery
    {
    public:
        virtual ~ISessionRecovery() = default;

        /**
         * @brief Ask the user to enter the code again
         *
         * @param type Code the card rejected
         * @return etl::expected<CodeText, error::Error> Code as typed by the user
         */
        virtual etl::expected<CodeText, error::Error> requestCode(CodeType type) = 0;

        /**
         * @brief Establish a fresh session key with the card
         *
         * @param environment Current environment
         * @return etl::expected<SessionKey, error::Error> New mode and key
         */
        virtual etl::expected<SessionKey, error::Error> renegotiateEncryption(const SessionEnvironment& environment) = 0;
    };

} // namespace tap
