/**
 * @file FirmwareVersion.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Firmware version parsing
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Card/FirmwareVersion.h"
#include <etl/to_string.h>

using namespace tap;

namespace
{
    bool readNumber(etl::string_view text, size_t& pos, uint16_t& out)
    {
        const size_t start = pos;
        uint32_t value = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        {
            value = value * 10U + static_cast<uint32_t>(text[pos] - '0');
            if (value > 0xFFFFU)
            {
                return false;
            }
            ++pos;
        }
        out = static_cast<uint16_t>(value);
        return pos > start;
    }

    etl::string_view trimmed(etl::string_view text)
    {
        while (!text.empty() && text.front() == ' ')
        {
            text.remove_prefix(1);
        }
        while (!text.empty() && text.back() == ' ')
        {
            text.remove_suffix(1);
        }
        return text;
    }
}

etl::expected<FirmwareVersion, error::Error> FirmwareVersion::parse(etl::string_view text)
{
    FirmwareVersion version;
    size_t pos = 0;

    if (!readNumber(text, pos, version.major) || pos >= text.size() || text[pos] != '.')
    {
        return etl::unexpected(error::Error::fromTlv(error::TlvError::TypeMismatch));
    }
    ++pos;

    if (!readNumber(text, pos, version.minor))
    {
        return etl::unexpected(error::Error::fromTlv(error::TlvError::TypeMismatch));
    }

    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        if (!readNumber(text, pos, version.patch))
        {
            return etl::unexpected(error::Error::fromTlv(error::TlvError::TypeMismatch));
        }
    }

    const etl::string_view suffix = trimmed(text.substr(pos));
    if (suffix == etl::string_view("r"))
    {
        version.type = FirmwareType::Release;
    }
    else if (suffix == etl::string_view("d SDK") || suffix == etl::string_view("d"))
    {
        version.type = FirmwareType::Sdk;
    }
    else
    {
        version.type = FirmwareType::Special;
    }

    return version;
}

etl::string<32> FirmwareVersion::toString() const
{
    etl::string<32> text;
    etl::to_string(major, text);
    text.push_back('.');
    etl::to_string(minor, text, true);
    if (patch != 0)
    {
        text.push_back('.');
        etl::to_string(patch, text, true);
    }

    switch (type)
    {
        case FirmwareType::Release:
            text.append("r");
            break;
        case FirmwareType::Sdk:
            text.append("d SDK");
            break;
        default:
            break;
    }
    return text;
}

int FirmwareVersion::compare(const FirmwareVersion& other) const
{
    if (major != other.major)
    {
        return major < other.major ? -1 : 1;
    }
    if (minor != other.minor)
    {
        return minor < other.minor ? -1 : 1;
    }
    if (patch != other.patch)
    {
        return patch < other.patch ? -1 : 1;
    }
    return 0;
}
