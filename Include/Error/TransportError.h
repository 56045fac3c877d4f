/**
 * @file TransportError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines errors reported by the card transport
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class TransportError : uint8_t {
        Ok,
        Timeout,
        TagLost,
        SessionClosed,
        FrameError,
        Unknown
    };

} // namespace error
