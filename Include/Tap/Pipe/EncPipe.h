/**
 * @file EncPipe.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Authenticated encryption pipe
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/array.h>
#include "ISecurePipe.h"

namespace tap
{
    /**
     * @brief Encryption pipe (encrypt-then-MAC)
     *
     * Wire layout of a protected payload:
     *   IV (16) || AES-128-CBC(payload || ISO 9797-1 M2 padding) || CMAC (16)
     *
     * The CMAC covers IV || ciphertext and is checked before decryption.
     * Encryption and MAC keys are derived from the negotiated session key
     * with AES-CMAC.
     */
    class EncPipe : public ISecurePipe
    {
    public:
        EncPipe();

        /**
         * @brief Install the negotiated session key
         *
         * @param sessionKey 16 or 32 byte key
         * @return etl::expected<void, error::Error> InvalidKeyLength for other sizes
         */
        etl::expected<void, error::Error> setSessionKey(const etl::ivector<uint8_t>& sessionKey);

        bool hasSessionKey() const
        {
            return keyed;
        }

        /**
         * @brief Forget the session keys
         */
        void clear();

        etl::expected<SecurePayload, error::Error> protect(const etl::ivector<uint8_t>& payload) override;

        etl::expected<SecurePayload, error::Error> unprotect(const etl::ivector<uint8_t>& payload) override;

    private:
        etl::array<uint8_t, buffer::KEY_SIZE_AES128> encKey;
        etl::array<uint8_t, buffer::KEY_SIZE_AES128> macKey;
        bool keyed;
    };

} // namespace tap
