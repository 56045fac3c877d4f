/**
 * @file EncryptionMode.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Payload encryption modes
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <etl/string_view.h>

namespace tap
{
    /**
     * @brief Encryption applied to command payloads
     *
     * The value is sent as P1 of every command APDU.
     */
    enum class EncryptionMode : uint8_t
    {
        None = 0x00,
        Fast = 0x01,
        Strong = 0x02
    };

    inline etl::string_view encryptionModeName(EncryptionMode mode)
    {
        switch (mode)
        {
            case EncryptionMode::None: return "None";
            case EncryptionMode::Fast: return "Fast";
            case EncryptionMode::Strong: return "Strong";
            default: return "Unknown";
        }
    }

} // namespace tap
