/**
 * @file SdkConfig.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Caller configuration
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/optional.h>
#include "Tap/Attestation/Attestation.h"
#include "Tap/Pipe/EncryptionMode.h"
#include "Utils/Logging.h"

namespace tap
{
    struct SdkConfig
    {
        /// Depth of attestation the caller asks for
        AttestationMode attestationMode = AttestationMode::Normal;

        /// Offer to continue with cards that fail attestation instead of failing outright
        bool allowUntrustedCards = false;

        /// Prepend the LegacyMode record to requests (off when unset)
        etl::optional<bool> legacyMode;

        /// Send the linked terminal public key (on when unset)
        etl::optional<bool> linkedTerminal;

        EncryptionMode defaultEncryptionMode = EncryptionMode::None;

        /// Re-sends per command after recoverable errors
        uint8_t maxRecoveryAttempts = 3;

        Logger::Level logLevel = Logger::Level::Info;
    };

} // namespace tap
