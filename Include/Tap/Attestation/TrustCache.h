/**
 * @file TrustCache.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Cache of attestation verdicts for cards verified online
 * @version 0.1
 * @date 2026-03-09
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/optional.h>
#include <etl/vector.h>
#include "Attestation.h"
#include "ISecureStorage.h"
#include "Tap/BufferSizes.h"
#include "Utils/CryptoUtils.h"

namespace tap
{
    /**
     * @brief Cached verdict and the mode it was reached at
     */
    struct TrustedVerdict
    {
        Attestation attestation;
        AttestationMode mode;

        TrustedVerdict() : attestation(), mode(AttestationMode::Offline) {}

        TrustedVerdict(const Attestation& attestation, AttestationMode mode)
            : attestation(attestation), mode(mode) {}
    };

    /**
     * @brief Verdicts keyed by SHA-256 of the card public key
     *
     * Lookups always reflect the last successful record() in this process.
     * With a storage backend every change is mirrored as one TLV blob and
     * the cache reloads it on construction. Entries never expire: once
     * TRUSTED_CARDS_MAX cards are stored, verdicts for new cards are refused
     * with CapacityExceeded until clear() is called.
     *
     * Blob layout: StorageVersion, then one TrustedCard record per entry
     * holding TrustedCardKeyHash, CardKeyAttestation, WalletKeysAttestation
     * and AttestationMode.
     */
    class TrustCache
    {
    public:
        static constexpr const char* STORAGE_KEY = "tap.trustedCards";
        static constexpr uint8_t STORAGE_VERSION = 1;

        using Blob = etl::vector<uint8_t, buffer::TRUST_CACHE_BLOB_MAX>;

        /**
         * @brief Construct the cache and load the stored blob
         *
         * @param storage Optional backend, must outlive the cache
         */
        explicit TrustCache(ISecureStorage* storage = nullptr);

        etl::optional<TrustedVerdict> lookup(const etl::ivector<uint8_t>& publicKey) const;

        /**
         * @brief Store or replace the verdict of a card
         *
         * The in-memory entry is updated even when mirroring fails; the
         * storage error is returned. A new card on a full cache is refused
         * with CapacityExceeded and nothing is written.
         */
        etl::expected<void, error::Error> record(
            const etl::ivector<uint8_t>& publicKey,
            const Attestation& attestation,
            AttestationMode mode);

        etl::expected<void, error::Error> clear();

        /**
         * @brief Replace the cache contents with the stored blob
         *
         * Backend failures outside the storage layer are reported as ReadFailed.
         * Without a backend this is a no-op.
         */
        etl::expected<void, error::Error> load();

        size_t size() const
        {
            return entries.size();
        }

        /**
         * @brief Serialize the cache into the storage blob format
         */
        etl::expected<void, error::Error> serialize(Blob& out) const;

        /**
         * @brief Replace the cache contents with a storage blob
         *
         * @return etl::expected<void, error::Error> CorruptedData on any malformed entry or
         *         CapacityExceeded for more than TRUSTED_CARDS_MAX entries, cache left empty
         */
        etl::expected<void, error::Error> deserialize(const etl::ivector<uint8_t>& blob);

    private:
        struct Entry
        {
            crypto::Sha256Digest keyHash;
            TrustedVerdict verdict;
        };

        etl::expected<void, error::Error> persist() const;
        Entry* find(const crypto::Sha256Digest& keyHash);

        static etl::expected<Entry, error::Error> parseEntry(const etl::ivector<uint8_t>& value);

        etl::vector<Entry, buffer::TRUSTED_CARDS_MAX> entries;     // Record order
        ISecureStorage* storage;
    };

} // namespace tap
