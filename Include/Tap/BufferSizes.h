/**
 * @file BufferSizes.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Buffer size constants for the card protocol layers
 * @version 0.2
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstddef>

namespace tap
{
    namespace buffer
    {
        // ========================================================================
        // TLV Layer
        // ========================================================================

        /**
         * @brief Maximum value length of a single TLV record
         * 
         * Largest field carried by a command is the 512-byte issuer data block,
         * nested wallet records stay well below this.
         */
        constexpr size_t TLV_VALUE_MAX = 1024;

        /**
         * @brief Maximum number of records in one TLV message
         */
        constexpr size_t TLV_RECORDS_MAX = 32;

        /**
         * @brief Largest value length encodable in the single byte length form
         * 
         * 0xFF is reserved as the marker of the 2-byte extended form
         */
        constexpr size_t TLV_SHORT_LENGTH_MAX = 0xFE;

        /**
         * @brief Largest value length encodable in the extended form
         */
        constexpr size_t TLV_EXTENDED_LENGTH_MAX = 0xFFFF;

        // ========================================================================
        // APDU Layer (extended length)
        // ========================================================================

        /**
         * @brief Maximum APDU data field (serialized TLV, possibly enveloped)
         */
        constexpr size_t APDU_DATA_MAX = 2048;

        /**
         * @brief APDU header size
         * 
         * CLA(1) + INS(1) + P1(1) + P2(1) = 4 bytes
         */
        constexpr size_t APDU_HEADER_SIZE = 4;

        /**
         * @brief Extended Lc size
         * 
         * 0x00 + Lc_hi + Lc_lo = 3 bytes
         */
        constexpr size_t APDU_EXTENDED_LC_SIZE = 3;

        /**
         * @brief Maximum encoded command APDU
         */
        constexpr size_t APDU_COMMAND_MAX = APDU_HEADER_SIZE + APDU_EXTENDED_LC_SIZE + APDU_DATA_MAX;

        /**
         * @brief APDU status word size
         * 
         * SW1(1) + SW2(1) = 2 bytes
         */
        constexpr size_t APDU_STATUS_SIZE = 2;

        /**
         * @brief Maximum raw response (data + status word)
         */
        constexpr size_t APDU_RESPONSE_MAX = APDU_DATA_MAX + APDU_STATUS_SIZE;

        // ========================================================================
        // Secure Channel Envelope
        // ========================================================================

        /**
         * @brief AES block size
         */
        constexpr size_t AES_BLOCK_SIZE = 16;

        /**
         * @brief AES-128 key size
         */
        constexpr size_t KEY_SIZE_AES128 = 16;

        /**
         * @brief Negotiated session key maximum size
         */
        constexpr size_t SESSION_KEY_MAX = 32;

        /**
         * @brief Envelope CMAC size (untruncated)
         */
        constexpr size_t ENVELOPE_MAC_SIZE = 16;

        /**
         * @brief Envelope overhead: IV + worst case padding + CMAC
         */
        constexpr size_t ENVELOPE_OVERHEAD = AES_BLOCK_SIZE + AES_BLOCK_SIZE + ENVELOPE_MAC_SIZE;

        // ========================================================================
        // Card Data
        // ========================================================================

        /**
         * @brief Card ID size (8 bytes, rendered as 16 hex characters)
         */
        constexpr size_t CARD_ID_SIZE = 8;

        /**
         * @brief Card ID text size
         */
        constexpr size_t CARD_ID_TEXT_MAX = 2 * CARD_ID_SIZE;

        /**
         * @brief Public key maximum size (uncompressed secp256k1 point)
         */
        constexpr size_t PUBLIC_KEY_MAX = 65;

        /**
         * @brief Private key size for linked terminal keys
         */
        constexpr size_t PRIVATE_KEY_SIZE = 32;

        /**
         * @brief Raw r||s signature size
         */
        constexpr size_t SIGNATURE_MAX = 64;

        /**
         * @brief SHA-256 digest size
         */
        constexpr size_t SHA256_SIZE = 32;

        /**
         * @brief Attestation challenge size
         */
        constexpr size_t CHALLENGE_SIZE = 16;

        /**
         * @brief Card generated salt maximum size
         */
        constexpr size_t SALT_MAX = 32;

        /**
         * @brief Issuer data block maximum size
         */
        constexpr size_t ISSUER_DATA_MAX = 512;

        /**
         * @brief Maximum wallets on one card
         */
        constexpr size_t WALLETS_MAX = 20;

        /**
         * @brief Maximum linked cards returned by a full card key attestation
         */
        constexpr size_t LINKED_CARDS_MAX = 3;

        /**
         * @brief Short text fields (manufacturer, firmware, issuer names)
         */
        constexpr size_t TEXT_FIELD_MAX = 64;

        // ========================================================================
        // Trust Cache
        // ========================================================================

        /**
         * @brief Maximum cached trusted cards
         */
        constexpr size_t TRUSTED_CARDS_MAX = 128;

        /**
         * @brief Maximum serialized trust cache blob
         */
        constexpr size_t TRUST_CACHE_BLOB_MAX = TRUSTED_CARDS_MAX * 48 + 16;

    } // namespace buffer

} // namespace tap
