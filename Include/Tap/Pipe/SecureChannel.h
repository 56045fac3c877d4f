/**
 * @file SecureChannel.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Pipe selection for the active encryption mode
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "EncryptionMode.h"
#include "PlainPipe.h"
#include "EncPipe.h"

namespace tap
{
    /**
     * @brief Owns the available pipes and hands out the one matching a mode
     */
    class SecureChannel
    {
    public:
        /**
         * @brief Select the pipe for an encryption mode
         *
         * @param mode Requested mode
         * @param key Negotiated session key, ignored for EncryptionMode::None
         * @return etl::expected<ISecurePipe*, error::Error> Pipe, or
         *         MissingEncryptionKey when an encrypted mode has no key
         */
        etl::expected<ISecurePipe*, error::Error> makeSecurePipe(
            EncryptionMode mode,
            const etl::ivector<uint8_t>& key);

    private:
        PlainPipe plainPipe;
        EncPipe encPipe;
    };

} // namespace tap
