/**
 * @file CommandError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines command level error codes
 * @version 0.1
 * @date 2026-03-05
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class CommandError : uint8_t {
        Ok,
        MissingPreflightRead,
        NotPersonalized,
        NotActivated,
        NotSupportedFirmwareVersion,
        MissingIssuerPublicKey,
        DataSizeTooLarge,
        MissingCounter,
        IssuerSignatureInvalid,
        DataCannotBeWritten,
        WalletNotFound,
        UnsupportedCurve,
        InvalidResponse,
        InvalidState,
        RetryLimitExceeded
    };

} // namespace error
