/**
 * @file main.cpp
 * @brief TLV inspection example
 *
 * Flow:
 *   1) Read a hex encoded TLV message from the command line
 *   2) Parse it into records
 *   3) Print every record with its registry name and a typed rendering of the value
 */

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <etl/string.h>
#include "Tap/Tlv/Tlv.h"
#include "Tap/Tlv/TlvTag.h"
#include "Utils/ByteUtils.h"
#include "Utils/Logging.h"

using namespace tap;

namespace
{
    std::string toHex(const etl::ivector<uint8_t>& data)
    {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (size_t i = 0; i < data.size(); ++i)
        {
            oss << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    void printUsage(const char* exeName)
    {
        std::cout << "Usage:\n";
        std::cout << "  " << exeName << " <HEX> [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  --verbose                         Enable debug logging\n";
        std::cout << "\nExample:\n";
        std::cout << "  " << exeName << " 0108CB22000000027374020102\n";
    }

    std::string renderValue(const Tlv& record)
    {
        const TlvValue& value = record.value;

        switch (valueTypeOf(record.tag))
        {
            case TlvValueType::Byte:
            case TlvValueType::Enum:
            case TlvValueType::UInt16:
            case TlvValueType::Int:
            {
                if (value.empty() || value.size() > 8U)
                {
                    return "<bad int> " + toHex(value);
                }
                uint64_t number = 0;
                for (uint8_t b : value)
                {
                    number = (number << 8) | b;
                }
                return std::to_string(number);
            }
            case TlvValueType::Bool:
                if (value.size() != 1U || value[0] > 1U)
                {
                    return "<bad bool> " + toHex(value);
                }
                return value[0] == 1U ? "true" : "false";
            case TlvValueType::Utf8String:
                if (!utils::isValidUtf8(value.data(), value.size()))
                {
                    return "<bad utf8> " + toHex(value);
                }
                return "\"" + std::string(value.begin(), value.end()) + "\"";
            case TlvValueType::Date:
            {
                if (value.size() != 4U)
                {
                    return "<bad date> " + toHex(value);
                }
                std::ostringstream oss;
                oss << ((static_cast<unsigned>(value[0]) << 8) | value[1]) << '-'
                    << std::setfill('0') << std::setw(2) << static_cast<int>(value[2]) << '-'
                    << std::setw(2) << static_cast<int>(value[3]);
                return oss.str();
            }
            case TlvValueType::Nested:
            case TlvValueType::HexString:
            case TlvValueType::ByteArray:
            default:
                return toHex(value);
        }
    }

    bool printMessage(const etl::ivector<uint8_t>& bytes, int depth)
    {
        TlvMessage records;
        auto parsed = deserializeTlv(bytes, records);
        if (!parsed)
        {
            std::cerr << std::string(depth * 2, ' ') << "Parse failed: " << parsed.error().toString().c_str() << "\n";
            return false;
        }

        bool ok = true;
        for (const Tlv& record : records)
        {
            etl::string_view name = nameOf(record.tag);
            std::cout << std::string(depth * 2, ' ')
                      << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                      << static_cast<int>(record.tag) << std::dec << std::setfill(' ')
                      << " " << std::string(name.begin(), name.end())
                      << " [" << record.length() << "] "
                      << renderValue(record) << "\n";

            if (valueTypeOf(record.tag) == TlvValueType::Nested)
            {
                ok = printMessage(record.value, depth + 1) && ok;
            }
        }
        return ok;
    }
}

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    Logger::setLevel(Logger::Level::Warn);
    for (int i = 2; i < argc; ++i)
    {
        const std::string opt = argv[i];
        if (opt == "--verbose")
        {
            Logger::setLevel(Logger::Level::Debug);
        }
        else
        {
            std::cerr << "Unknown argument: " << opt << "\n";
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    etl::vector<uint8_t, buffer::APDU_DATA_MAX> bytes;
    if (!utils::fromHex(etl::string_view(argv[1]), bytes))
    {
        std::cerr << "Input is not valid hex or longer than " << buffer::APDU_DATA_MAX << " bytes\n";
        return EXIT_FAILURE;
    }

    std::cout << "Input: " << bytes.size() << " byte(s)\n";
    return printMessage(bytes, 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
