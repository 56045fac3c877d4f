/**
 * @file Attestation.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Attestation verdict implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Attestation/Attestation.h"

namespace tap
{
    uint8_t severityOf(AttestationStatus status)
    {
        switch (status)
        {
            case AttestationStatus::NotAttested: return 0;
            case AttestationStatus::Verified: return 1;
            case AttestationStatus::VerifiedOffline: return 2;
            case AttestationStatus::Warning: return 3;
            case AttestationStatus::Skipped: return 4;
            case AttestationStatus::Failed: return 5;
            default: return 5;
        }
    }

    bool isValidAttestationStatus(uint8_t value)
    {
        return value <= static_cast<uint8_t>(AttestationStatus::Failed);
    }

    bool isValidAttestationMode(uint8_t value)
    {
        return value <= static_cast<uint8_t>(AttestationMode::Full);
    }

    etl::string_view statusName(AttestationStatus status)
    {
        switch (status)
        {
            case AttestationStatus::NotAttested: return "notAttested";
            case AttestationStatus::Skipped: return "skipped";
            case AttestationStatus::VerifiedOffline: return "verifiedOffline";
            case AttestationStatus::Verified: return "verified";
            case AttestationStatus::Warning: return "warning";
            case AttestationStatus::Failed: return "failed";
            default: return "unknown";
        }
    }

    etl::string_view modeName(AttestationMode mode)
    {
        switch (mode)
        {
            case AttestationMode::Offline: return "offline";
            case AttestationMode::Normal: return "normal";
            case AttestationMode::Full: return "full";
            default: return "unknown";
        }
    }

    AttestationStatus Attestation::status() const
    {
        return severityOf(walletKeysAttestation) > severityOf(cardKeyAttestation)
            ? walletKeysAttestation
            : cardKeyAttestation;
    }

    etl::string<64> Attestation::toString() const
    {
        etl::string<64> text("cardKey=");
        etl::string_view cardKey = statusName(cardKeyAttestation);
        text.append(cardKey.data(), cardKey.size());
        text.append(" walletKeys=");
        etl::string_view walletKeys = statusName(walletKeysAttestation);
        text.append(walletKeys.data(), walletKeys.size());
        return text;
    }

} // namespace tap
