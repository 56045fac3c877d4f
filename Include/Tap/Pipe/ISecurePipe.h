/**
 * @file ISecurePipe.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Secure pipe interface for command payloads
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/expected.h>
#include "Tap/BufferSizes.h"
#include "Error/Error.h"

namespace tap
{
    using SecurePayload = etl::vector<uint8_t, buffer::APDU_DATA_MAX>;

    /**
     * @brief Secure pipe interface
     *
     * Wraps serialized TLV payloads before transmission and unwraps card
     * responses before decoding.
     */
    class ISecurePipe
    {
    public:
        virtual ~ISecurePipe() = default;

        /**
         * @brief Protect an outgoing payload
         *
         * @param payload Serialized TLV bytes
         * @return etl::expected<SecurePayload, error::Error> Bytes to transmit or error
         */
        virtual etl::expected<SecurePayload, error::Error> protect(const etl::ivector<uint8_t>& payload) = 0;

        /**
         * @brief Unprotect an incoming payload
         *
         * @param payload Received bytes
         * @return etl::expected<SecurePayload, error::Error> Serialized TLV bytes, or
         *         DecryptionFailed when the payload does not authenticate
         */
        virtual etl::expected<SecurePayload, error::Error> unprotect(const etl::ivector<uint8_t>& payload) = 0;
    };

} // namespace tap
