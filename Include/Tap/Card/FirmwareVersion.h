/**
 * @file FirmwareVersion.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card operating system version
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/expected.h>
#include "Error/Error.h"

namespace tap
{
    enum class FirmwareType : uint8_t
    {
        Release,
        Sdk,
        Special
    };

    /**
     * @brief Firmware version as reported by the card, e.g. "4.52r" or "6.33d SDK"
     *
     * Versions compare by major, minor and patch; the build type is not part
     * of the ordering.
     */
    struct FirmwareVersion
    {
        uint16_t major;
        uint16_t minor;
        uint16_t patch;
        FirmwareType type;

        FirmwareVersion() : major(0), minor(0), patch(0), type(FirmwareType::Special) {}

        FirmwareVersion(uint16_t major, uint16_t minor, uint16_t patch = 0, FirmwareType type = FirmwareType::Release)
            : major(major), minor(minor), patch(patch), type(type) {}

        /**
         * @brief Parse the textual form
         *
         * Suffix "r" is a release build, "d SDK" a development build, anything
         * else a special build.
         *
         * @return etl::expected<FirmwareVersion, error::Error> TypeMismatch when the numeric part is malformed
         */
        static etl::expected<FirmwareVersion, error::Error> parse(etl::string_view text);

        etl::string<32> toString() const;

        int compare(const FirmwareVersion& other) const;

        bool operator<(const FirmwareVersion& other) const { return compare(other) < 0; }
        bool operator>=(const FirmwareVersion& other) const { return compare(other) >= 0; }
        bool operator==(const FirmwareVersion& other) const { return compare(other) == 0; }
        bool operator!=(const FirmwareVersion& other) const { return compare(other) != 0; }
    };

    namespace firmware
    {
        /// First version that can report linked (backup) card keys
        const FirmwareVersion KEYS_IMPORT_AVAILABLE(6, 16);
    }

} // namespace tap
