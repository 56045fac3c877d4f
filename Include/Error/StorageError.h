/**
 * @file StorageError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines secure storage error codes
 * @version 0.1
 * @date 2026-03-11
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class StorageError : uint8_t {
        Ok,
        ReadFailed,
        WriteFailed,
        CorruptedData,
        CapacityExceeded
    };

} // namespace error
