/**
 * @file TlvError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines TLV codec error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class TlvError : uint8_t {
        Ok,
        EncodingFailed,     // Value shape does not match the declared kind
        InvalidValue,       // Value out of range for the declared kind
        ValueTooLong,
        DuplicateTag,       // Second append of a single-valued tag
        UnknownTag,
        MissingTag,
        TypeMismatch,       // Length or content invalid for the declared kind
        MalformedRecord,    // Truncated tag/length/value on the wire
        BufferOverflow
    };

} // namespace error
