/**
 * @file Instruction.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card instruction bytes
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

namespace tap
{
    enum class Instruction : uint8_t
    {
        Unknown = 0x00,
        Read = 0xF2,
        AttestCardKey = 0xF3,
        WriteIssuerData = 0xF6,
        AttestWalletKey = 0xFA
    };

    /**
     * @brief Sub-mode of the Read instruction (InteractionMode tag)
     */
    enum class ReadMode : uint8_t
    {
        ReadCard = 0x01,
        ReadWallet = 0x02
    };

} // namespace tap
