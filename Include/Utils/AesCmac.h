/**
 * @file AesCmac.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief AES-128 CBC and CMAC primitives
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <cstdint>
#include <cstddef>

namespace crypto
{
    constexpr uint8_t AES_CMAC_RB = 0x87U;
    constexpr uint8_t ISO_PADDING_MARKER = 0x80U;

    /**
     * @brief Encrypt one 16-byte block with AES-128 ECB
     *
     * @param key AES key (16 bytes)
     * @param input Plaintext block
     * @param output Ciphertext block, may alias input
     */
    void aesEncryptBlock(const uint8_t* key, const uint8_t* input, uint8_t* output);

    /**
     * @brief Derive the CMAC sub-keys K1 and K2 (NIST SP 800-38B)
     */
    void generateCmacSubkeys(const uint8_t* key, uint8_t* k1, uint8_t* k2);

    /**
     * @brief AES-128 CMAC over a message
     *
     * @param key AES key (16 bytes)
     * @param message Message bytes, may be empty
     * @param messageLength Message length
     * @param outCmac Output tag (16 bytes)
     */
    void calculateCmac(const uint8_t* key, const uint8_t* message, size_t messageLength, uint8_t* outCmac);

    /**
     * @brief Append ISO/IEC 9797-1 method 2 padding (0x80 then zeros to a block boundary)
     *
     * @return false if the buffer cannot hold the padded data
     */
    bool padIso9797M2(etl::ivector<uint8_t>& data);

    /**
     * @brief Remove ISO/IEC 9797-1 method 2 padding
     *
     * @return false if no valid padding marker is found
     */
    bool unpadIso9797M2(etl::ivector<uint8_t>& data);

    /**
     * @brief AES-128 CBC encryption in place
     *
     * @param key AES key (16 bytes)
     * @param iv Initialization vector (16 bytes)
     * @param data Buffer, length a multiple of 16
     */
    bool aesCbcEncrypt(const uint8_t* key, const uint8_t* iv, etl::ivector<uint8_t>& data);

    bool aesCbcDecrypt(const uint8_t* key, const uint8_t* iv, etl::ivector<uint8_t>& data);

} // namespace crypto
