/**
 * @file StatusWordError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines card status words (SW1SW2)
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class StatusWordError : uint16_t {
        Ok = 0x9000,
        ErrorProcessingCommand = 0x6286,
        NeedEncryption = 0x6982,
        InvalidState = 0x6985,
        FileNotFound = 0x6A82,
        InvalidParams = 0x6A86,
        WalletNotFound = 0x6A88,
        InvalidAccessCode = 0x6AF1,
        InvalidPasscode = 0x6AF2,
        InsNotSupported = 0x6D00,
        NeedPause = 0x9789,
        Unknown = 0xFFFF
    };

} // namespace error
