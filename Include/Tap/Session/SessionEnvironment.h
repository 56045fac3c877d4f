/**
 * @file SessionEnvironment.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Per-session state read by commands
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/optional.h>
#include <etl/string_view.h>
#include <etl/vector.h>
#include "SdkConfig.h"
#include "Tap/Card/Card.h"

namespace tap
{
    using CodeHash = etl::vector<uint8_t, buffer::SHA256_SIZE>;
    using SessionKeyBytes = etl::vector<uint8_t, buffer::SESSION_KEY_MAX>;

    constexpr const char* DEFAULT_ACCESS_CODE = "000000";
    constexpr const char* DEFAULT_PASSCODE = "000";

    /**
     * @brief Key pair of a linked terminal
     */
    struct TerminalKeys
    {
        etl::vector<uint8_t, buffer::PRIVATE_KEY_SIZE> privateKey;
        PublicKey publicKey;
    };

    /**
     * @brief State owned by a CardSession for its whole lifetime
     *
     * Commands get a const view while they build requests and decode
     * responses. Only the session changes it, between commands.
     */
    struct SessionEnvironment
    {
        SdkConfig config;
        etl::optional<Card> card;
        EncryptionMode encryptionMode;
        SessionKeyBytes encryptionKey;
        CodeHash accessCode;
        CodeHash passcode;
        etl::optional<TerminalKeys> terminalKeyPair;

        explicit SessionEnvironment(const SdkConfig& config = SdkConfig());

        bool legacyMode() const
        {
            return config.legacyMode.has_value() && config.legacyMode.value();
        }

        /**
         * @brief Linked terminal keys, or nullptr when disabled or not provisioned
         */
        const TerminalKeys* terminalKeys() const;

        /**
         * @brief SHA-256 of a UTF-8 code
         */
        static CodeHash hashCode(etl::string_view code);
    };

} // namespace tap
