/**
 * @file EnvelopeError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines secure channel envelope error codes
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class EnvelopeError : uint8_t {
        Ok,
        DecryptionFailed,
        MissingEncryptionKey,
        InvalidKeyLength,
        PayloadTooLarge
    };

} // namespace error
