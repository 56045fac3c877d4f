/**
 * @file ISecureStorage.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Opaque blob storage interface
 * @version 0.1
 * @date 2026-03-09
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/string_view.h>
#include <etl/vector.h>
#include "Error/Error.h"

namespace tap
{
    /**
     * @brief Key/value store for host-side state (keychain, secure element, file)
     *
     * Values are opaque to the store.
     */
    class ISecureStorage
    {
    public:
        virtual ~ISecureStorage() = default;

        /**
         * @brief Read a value
         *
         * @param key Entry name
         * @param out Destination, cleared first
         * @return etl::expected<bool, error::Error> false when the key is absent
         */
        virtual etl::expected<bool, error::Error> get(etl::string_view key, etl::ivector<uint8_t>& out) = 0;

        virtual etl::expected<void, error::Error> set(etl::string_view key, const etl::ivector<uint8_t>& value) = 0;

        /**
         * @brief Delete a value, absent keys are not an error
         */
        virtual etl::expected<void, error::Error> remove(etl::string_view key) = 0;
    };

} // namespace tap
