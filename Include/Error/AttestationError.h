/**
 * @file AttestationError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines attestation error codes
 * @version 0.1
 * @date 2026-03-09
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class AttestationError : uint8_t {
        Ok,
        CardVerificationFailed,
        UserCancelled,
        UnsupportedMode,
        NetworkError,
        CryptoFailure
    };

} // namespace error
