/**
 * @file ByteUtils.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Byte buffer helpers implementation
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Utils/ByteUtils.h"

namespace
{
    int hexValue(char c)
    {
        if (c >= '0' && c <= '9')
        {
            return c - '0';
        }
        if (c >= 'A' && c <= 'F')
        {
            return 10 + (c - 'A');
        }
        if (c >= 'a' && c <= 'f')
        {
            return 10 + (c - 'a');
        }
        return -1;
    }
}

namespace utils
{
    bool isValidUtf8(const uint8_t* data, size_t length)
    {
        size_t i = 0;
        while (i < length)
        {
            const uint8_t lead = data[i];
            size_t continuation = 0;
            uint32_t codePoint = 0;

            if (lead < 0x80U)
            {
                ++i;
                continue;
            }
            else if ((lead & 0xE0U) == 0xC0U)
            {
                continuation = 1;
                codePoint = lead & 0x1FU;
            }
            else if ((lead & 0xF0U) == 0xE0U)
            {
                continuation = 2;
                codePoint = lead & 0x0FU;
            }
            else if ((lead & 0xF8U) == 0xF0U)
            {
                continuation = 3;
                codePoint = lead & 0x07U;
            }
            else
            {
                return false;
            }

            if (i + continuation >= length)
            {
                return false;
            }

            for (size_t k = 1; k <= continuation; ++k)
            {
                const uint8_t next = data[i + k];
                if ((next & 0xC0U) != 0x80U)
                {
                    return false;
                }
                codePoint = (codePoint << 6U) | (next & 0x3FU);
            }

            // Overlong encodings
            if ((continuation == 1 && codePoint < 0x80U) ||
                (continuation == 2 && codePoint < 0x800U) ||
                (continuation == 3 && codePoint < 0x10000U))
            {
                return false;
            }

            if (codePoint > 0x10FFFFU || (codePoint >= 0xD800U && codePoint <= 0xDFFFU))
            {
                return false;
            }

            i += continuation + 1U;
        }

        return true;
    }

    bool toHex(const etl::ivector<uint8_t>& data, etl::istring& out)
    {
        static const char DIGITS[] = "0123456789ABCDEF";

        out.clear();
        if (out.capacity() < data.size() * 2U)
        {
            return false;
        }

        for (uint8_t byte : data)
        {
            out.push_back(DIGITS[(byte >> 4U) & 0x0FU]);
            out.push_back(DIGITS[byte & 0x0FU]);
        }

        return true;
    }

    bool fromHex(etl::string_view text, etl::ivector<uint8_t>& out)
    {
        out.clear();
        if ((text.size() % 2U) != 0U || out.capacity() < text.size() / 2U)
        {
            return false;
        }

        for (size_t i = 0; i < text.size(); i += 2U)
        {
            const int high = hexValue(text[i]);
            const int low = hexValue(text[i + 1U]);
            if (high < 0 || low < 0)
            {
                out.clear();
                return false;
            }
            out.push_back(static_cast<uint8_t>((high << 4) | low));
        }

        return true;
    }

    bool appendBigEndian(uint64_t value, size_t width, etl::ivector<uint8_t>& out)
    {
        if (width == 0U || width > 8U || out.available() < width)
        {
            return false;
        }

        for (size_t i = width; i > 0U; --i)
        {
            out.push_back(static_cast<uint8_t>((value >> ((i - 1U) * 8U)) & 0xFFU));
        }

        return true;
    }

    size_t minimalWidth(uint64_t value)
    {
        size_t width = 1;
        while (width < 8U && (value >> (width * 8U)) != 0U)
        {
            ++width;
        }
        return width;
    }

    bool equalConstantTime(const uint8_t* a, const uint8_t* b, size_t length)
    {
        uint8_t diff = 0;
        for (size_t i = 0; i < length; ++i)
        {
            diff = static_cast<uint8_t>(diff | (a[i] ^ b[i]));
        }
        return diff == 0U;
    }

} // namespace utils
