/**
 * @file ByteUtils.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Byte buffer helpers (hex, UTF-8, big-endian)
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/vector.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <cstdint>
#include <cstddef>

namespace utils
{
    /**
     * @brief Check that data is well formed UTF-8 (no overlongs, no surrogates)
     */
    bool isValidUtf8(const uint8_t* data, size_t length);

    /**
     * @brief Render bytes as upper-case hex
     * 
     * @return false if out is too small
     */
    bool toHex(const etl::ivector<uint8_t>& data, etl::istring& out);

    /**
     * @brief Parse hex text (either case, even length, no separators)
     * 
     * @return false on odd length, non-hex characters or overflow of out
     */
    bool fromHex(etl::string_view text, etl::ivector<uint8_t>& out);

    /**
     * @brief Append value big-endian using exactly width bytes
     */
    bool appendBigEndian(uint64_t value, size_t width, etl::ivector<uint8_t>& out);

    /**
     * @brief Number of bytes needed to hold value without leading zero bytes (at least 1)
     */
    size_t minimalWidth(uint64_t value);

    /**
     * @brief Constant time comparison of two buffers
     */
    bool equalConstantTime(const uint8_t* a, const uint8_t* b, size_t length);

} // namespace utils
