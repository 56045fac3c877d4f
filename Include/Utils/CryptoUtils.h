/**
 * @file CryptoUtils.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Hashing, signature verification and randomness
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/expected.h>
#include <etl/string_view.h>
#include "Tap/BufferSizes.h"
#include "Error/Error.h"

namespace crypto
{
    using Sha256Digest = etl::vector<uint8_t, tap::buffer::SHA256_SIZE>;

    // Curve identifiers as reported in the card's CurveId tag
    constexpr const char* CURVE_SECP256K1 = "secp256k1";
    constexpr const char* CURVE_SECP256R1 = "secp256r1";
    constexpr const char* CURVE_ED25519 = "ed25519";
    constexpr const char* CURVE_ED25519_SLIP0010 = "ed25519_slip0010";

    /**
     * @brief SHA-256 of a buffer
     *
     * @param data Input bytes
     * @param length Number of input bytes
     * @return Sha256Digest 32-byte digest
     */
    Sha256Digest sha256(const uint8_t* data, size_t length);

    Sha256Digest sha256(const etl::ivector<uint8_t>& data);

    /**
     * @brief Verify a secp256k1 ECDSA signature over SHA-256(message)
     *
     * @param publicKey SEC1 public key, 65 bytes uncompressed or 33 bytes compressed
     * @param message Signed message (hashed before verification)
     * @param signature Raw 64-byte r || s signature
     * @return etl::expected<bool, error::Error> Verification outcome, CryptoFailure
     *         when the key or signature cannot be parsed
     */
    etl::expected<bool, error::Error> verifySecp256k1(
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature);

    /**
     * @brief Verify a secp256r1 (P-256) ECDSA signature over SHA-256(message)
     */
    etl::expected<bool, error::Error> verifySecp256r1(
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature);

    /**
     * @brief Verify a pure Ed25519 signature over the message itself
     *
     * @param publicKey Raw 32-byte public key
     * @param message Signed message
     * @param signature 64-byte signature
     */
    etl::expected<bool, error::Error> verifyEd25519(
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature);

    /**
     * @brief true when verifySignature can check signatures made on this curve
     *
     * An empty name is the card default, secp256k1.
     */
    bool isSupportedCurve(etl::string_view curve);

    /**
     * @brief Verify a signature with the scheme of the named curve
     *
     * @return etl::expected<bool, error::Error> Verification outcome, CryptoFailure
     *         for unparseable input or a curve outside isSupportedCurve
     */
    etl::expected<bool, error::Error> verifySignature(
        etl::string_view curve,
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature);

    /**
     * @brief Fill a buffer with cryptographically secure random bytes
     *
     * @param output Output buffer, cleared first
     * @param length Number of bytes to generate
     * @return etl::expected<void, error::Error> CryptoFailure if the generator fails
     */
    etl::expected<void, error::Error> generateRandomBytes(etl::ivector<uint8_t>& output, size_t length);

} // namespace crypto
