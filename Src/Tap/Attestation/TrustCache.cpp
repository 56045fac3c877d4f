/**
 * @file TrustCache.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Trust cache implementation
 * @version 0.1
 * @date 2026-03-09
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Attestation/TrustCache.h"
#include "Tap/Tlv/TlvBuilder.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "Utils/Logging.h"

using namespace tap;

namespace
{
    etl::unexpected<error::Error> corrupted()
    {
        return etl::unexpected<error::Error>(error::Error::fromStorage(error::StorageError::CorruptedData));
    }
}

TrustCache::TrustCache(ISecureStorage* storage)
    : entries()
    , storage(storage)
{
    auto loaded = load();
    if (!loaded)
    {
        LOG_WARN("Trust cache not loaded: %s", loaded.error().toString().c_str());
    }
}

TrustCache::Entry* TrustCache::find(const crypto::Sha256Digest& keyHash)
{
    for (Entry& entry : entries)
    {
        if (entry.keyHash == keyHash)
        {
            return &entry;
        }
    }
    return nullptr;
}

etl::optional<TrustedVerdict> TrustCache::lookup(const etl::ivector<uint8_t>& publicKey) const
{
    const crypto::Sha256Digest keyHash = crypto::sha256(publicKey);
    for (const Entry& entry : entries)
    {
        if (entry.keyHash == keyHash)
        {
            return entry.verdict;
        }
    }
    return etl::optional<TrustedVerdict>();
}

etl::expected<void, error::Error> TrustCache::record(
    const etl::ivector<uint8_t>& publicKey,
    const Attestation& attestation,
    AttestationMode mode)
{
    Entry entry;
    entry.keyHash = crypto::sha256(publicKey);
    entry.verdict = TrustedVerdict(attestation, mode);

    Entry* existing = find(entry.keyHash);
    if (existing)
    {
        existing->verdict = entry.verdict;
    }
    else if (entries.full())
    {
        // Entries never expire, only clear() makes room
        LOG_WARN("Trust cache full (%u cards), verdict not recorded", static_cast<unsigned>(entries.size()));
        return etl::unexpected(error::Error::fromStorage(error::StorageError::CapacityExceeded));
    }
    else
    {
        entries.push_back(entry);
    }

    LOG_DEBUG("Trusted card recorded: %s at mode %s", attestation.toString().c_str(), modeName(mode).data());

    return persist();
}

etl::expected<void, error::Error> TrustCache::clear()
{
    entries.clear();

    if (!storage)
    {
        return {};
    }

    return storage->remove(STORAGE_KEY);
}

etl::expected<void, error::Error> TrustCache::serialize(Blob& out) const
{
    out.clear();

    TlvValue version;
    version.push_back(STORAGE_VERSION);
    auto versionResult = Tlv(TlvTag::StorageVersion, version).serialize(out);
    if (!versionResult)
    {
        return versionResult;
    }

    for (const Entry& entry : entries)
    {
        TlvBuilder builder;

        auto hash = builder.appendBytes(TlvTag::TrustedCardKeyHash, entry.keyHash);
        if (!hash)
        {
            return hash;
        }

        auto cardKey = builder.appendInt(TlvTag::CardKeyAttestation,
                                         static_cast<int64_t>(entry.verdict.attestation.cardKeyAttestation));
        if (!cardKey)
        {
            return cardKey;
        }

        auto walletKeys = builder.appendInt(TlvTag::WalletKeysAttestation,
                                            static_cast<int64_t>(entry.verdict.attestation.walletKeysAttestation));
        if (!walletKeys)
        {
            return walletKeys;
        }

        auto mode = builder.appendInt(TlvTag::AttestationMode, static_cast<int64_t>(entry.verdict.mode));
        if (!mode)
        {
            return mode;
        }

        TlvValue nested;
        auto nestedResult = builder.serialize(nested);
        if (!nestedResult)
        {
            return nestedResult;
        }

        auto recordResult = Tlv(TlvTag::TrustedCard, nested).serialize(out);
        if (!recordResult)
        {
            return recordResult;
        }
    }

    return {};
}

etl::expected<TrustCache::Entry, error::Error> TrustCache::parseEntry(const etl::ivector<uint8_t>& value)
{
    TlvMessage fields;
    if (!deserializeTlv(value, fields))
    {
        return corrupted();
    }

    TlvDecoder decoder(fields);
    Entry entry;

    auto hash = decoder.decodeBytes(TlvTag::TrustedCardKeyHash, entry.keyHash);
    if (!hash || entry.keyHash.size() != buffer::SHA256_SIZE)
    {
        return corrupted();
    }

    auto cardKey = decoder.decodeByte(TlvTag::CardKeyAttestation);
    auto walletKeys = decoder.decodeByte(TlvTag::WalletKeysAttestation);
    auto mode = decoder.decodeByte(TlvTag::AttestationMode);
    if (!cardKey || !walletKeys || !mode)
    {
        return corrupted();
    }

    if (!isValidAttestationStatus(cardKey.value()) ||
        !isValidAttestationStatus(walletKeys.value()) ||
        !isValidAttestationMode(mode.value()))
    {
        return corrupted();
    }

    entry.verdict = TrustedVerdict(
        Attestation(static_cast<AttestationStatus>(cardKey.value()), static_cast<AttestationStatus>(walletKeys.value())),
        static_cast<AttestationMode>(mode.value()));
    return entry;
}

etl::expected<void, error::Error> TrustCache::deserialize(const etl::ivector<uint8_t>& blob)
{
    entries.clear();

    size_t offset = 0;
    auto version = Tlv::parse(blob, offset);
    if (!version ||
        version.value().tag != TlvTag::StorageVersion ||
        version.value().value.size() != 1U ||
        version.value().value[0] != STORAGE_VERSION)
    {
        return corrupted();
    }

    while (offset < blob.size())
    {
        auto record = Tlv::parse(blob, offset);
        if (!record || record.value().tag != TlvTag::TrustedCard)
        {
            entries.clear();
            return corrupted();
        }

        auto entry = parseEntry(record.value().value);
        if (!entry)
        {
            entries.clear();
            return etl::unexpected(entry.error());
        }

        if (entries.full())
        {
            LOG_WARN("Stored trust cache holds more than %u cards", static_cast<unsigned>(entries.capacity()));
            entries.clear();
            return etl::unexpected(error::Error::fromStorage(error::StorageError::CapacityExceeded));
        }
        entries.push_back(entry.value());
    }

    return {};
}

etl::expected<void, error::Error> TrustCache::load()
{
    if (!storage)
    {
        return {};
    }

    entries.clear();

    Blob blob;
    auto present = storage->get(STORAGE_KEY, blob);
    if (!present)
    {
        if (present.error().getLayer() != error::ErrorLayer::Storage)
        {
            LOG_WARN("Storage read failed: %s", present.error().toString().c_str());
            return etl::unexpected(error::Error::fromStorage(error::StorageError::ReadFailed));
        }
        return etl::unexpected(present.error());
    }

    if (!present.value())
    {
        return {};
    }

    auto parsed = deserialize(blob);
    if (!parsed)
    {
        return parsed;
    }

    LOG_DEBUG("Trust cache loaded with %u entries", static_cast<unsigned>(entries.size()));
    return {};
}

etl::expected<void, error::Error> TrustCache::persist() const
{
    if (!storage)
    {
        return {};
    }

    Blob blob;
    auto serialized = serialize(blob);
    if (!serialized)
    {
        return etl::unexpected(error::Error::fromStorage(error::StorageError::WriteFailed));
    }

    auto written = storage->set(STORAGE_KEY, blob);
    if (!written && written.error().getLayer() != error::ErrorLayer::Storage)
    {
        LOG_WARN("Storage write failed: %s", written.error().toString().c_str());
        return etl::unexpected(error::Error::fromStorage(error::StorageError::WriteFailed));
    }

    return written;
}
