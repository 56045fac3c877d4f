/**
 * @file Attestation.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Attestation verdict and mode
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

namespace tap
{
    /**
     * @brief Outcome of one attestation component
     *
     * Values are persisted by the trust cache and must stay stable.
     */
    enum class AttestationStatus : uint8_t
    {
        NotAttested = 0x00,
        Skipped = 0x01,
        VerifiedOffline = 0x02,
        Verified = 0x03,
        Warning = 0x04,
        Failed = 0x05
    };

    /**
     * @brief Depth of attestation requested by the caller
     *
     * Ordered by trust: Offline < Normal < Full.
     */
    enum class AttestationMode : uint8_t
    {
        Offline = 0x00,
        Normal = 0x01,
        Full = 0x02
    };

    /**
     * @brief Severity rank used to combine component statuses
     *
     * failed > skipped > warning > verifiedOffline > verified > notAttested
     */
    uint8_t severityOf(AttestationStatus status);

    bool isValidAttestationStatus(uint8_t value);

    bool isValidAttestationMode(uint8_t value);

    /**
     * @brief True when a verdict achieved at @p achieved also answers a request for @p requested
     */
    inline bool modeSatisfies(AttestationMode achieved, AttestationMode requested)
    {
        return static_cast<uint8_t>(achieved) >= static_cast<uint8_t>(requested);
    }

    etl::string_view statusName(AttestationStatus status);

    etl::string_view modeName(AttestationMode mode);

    struct Attestation
    {
        AttestationStatus cardKeyAttestation;
        AttestationStatus walletKeysAttestation;

        Attestation()
            : cardKeyAttestation(AttestationStatus::NotAttested)
            , walletKeysAttestation(AttestationStatus::NotAttested) {}

        Attestation(AttestationStatus cardKey, AttestationStatus walletKeys)
            : cardKeyAttestation(cardKey)
            , walletKeysAttestation(walletKeys) {}

        /**
         * @brief Most severe component status
         */
        AttestationStatus status() const;

        bool operator==(const Attestation& other) const
        {
            return cardKeyAttestation == other.cardKeyAttestation &&
                   walletKeysAttestation == other.walletKeysAttestation;
        }

        bool operator!=(const Attestation& other) const
        {
            return !(*this == other);
        }

        etl::string<64> toString() const;
    };

} // namespace tap
