#include <gtest/gtest.h>
#include <algorithm>
#include "Tap/Attestation/TrustCache.h"
#include "support/Fakes.h"

using namespace tap;

namespace
{
    PublicKey makeKey(uint32_t seed)
    {
        PublicKey key;
        key.push_back(0x04);
        for (size_t i = 1; i < buffer::PUBLIC_KEY_MAX; ++i)
        {
            key.push_back(static_cast<uint8_t>((seed * 31U + i) & 0xFFU));
        }
        key[1] = static_cast<uint8_t>(seed & 0xFFU);
        key[2] = static_cast<uint8_t>((seed >> 8) & 0xFFU);
        return key;
    }

    const Attestation VERIFIED(AttestationStatus::Verified, AttestationStatus::NotAttested);
    const Attestation FULLY_VERIFIED(AttestationStatus::Verified, AttestationStatus::Verified);
}

TEST(TrustCacheTests, LookupMissReturnsNothing)
{
    TrustCache cache;
    EXPECT_FALSE(cache.lookup(makeKey(1)).has_value());
    EXPECT_EQ(cache.size(), 0U);
}

TEST(TrustCacheTests, RecordThenLookup)
{
    TrustCache cache;
    ASSERT_TRUE(cache.record(makeKey(1), VERIFIED, AttestationMode::Normal).has_value());

    auto verdict = cache.lookup(makeKey(1));
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict.value().attestation, VERIFIED);
    EXPECT_EQ(verdict.value().mode, AttestationMode::Normal);
    EXPECT_FALSE(cache.lookup(makeKey(2)).has_value());
}

TEST(TrustCacheTests, RecordReplacesExistingVerdict)
{
    TrustCache cache;
    ASSERT_TRUE(cache.record(makeKey(1), VERIFIED, AttestationMode::Normal).has_value());
    ASSERT_TRUE(cache.record(makeKey(1), FULLY_VERIFIED, AttestationMode::Full).has_value());

    EXPECT_EQ(cache.size(), 1U);
    auto verdict = cache.lookup(makeKey(1));
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict.value().attestation, FULLY_VERIFIED);
    EXPECT_EQ(verdict.value().mode, AttestationMode::Full);
}

TEST(TrustCacheTests, FullCacheRefusesNewCards)
{
    fake::MemoryStorage storage;
    TrustCache cache(&storage);
    for (uint32_t i = 0; i < buffer::TRUSTED_CARDS_MAX; ++i)
    {
        ASSERT_TRUE(cache.record(makeKey(i), VERIFIED, AttestationMode::Normal).has_value());
    }
    const size_t writes = storage.writes;

    // Known cards can still be upgraded
    ASSERT_TRUE(cache.record(makeKey(0), FULLY_VERIFIED, AttestationMode::Full).has_value());
    EXPECT_EQ(storage.writes, writes + 1U);

    auto result = cache.record(makeKey(1000), VERIFIED, AttestationMode::Normal);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::StorageError::CapacityExceeded));
    EXPECT_EQ(storage.writes, writes + 1U);

    EXPECT_EQ(cache.size(), buffer::TRUSTED_CARDS_MAX);
    EXPECT_FALSE(cache.lookup(makeKey(1000)).has_value());
    for (uint32_t i = 0; i < buffer::TRUSTED_CARDS_MAX; ++i)
    {
        EXPECT_TRUE(cache.lookup(makeKey(i)).has_value()) << "card " << i;
    }
    EXPECT_EQ(cache.lookup(makeKey(0)).value().mode, AttestationMode::Full);

    // Stored verdicts outlive the process
    TrustCache reloaded(&storage);
    EXPECT_EQ(reloaded.size(), buffer::TRUSTED_CARDS_MAX);
    EXPECT_TRUE(reloaded.lookup(makeKey(1)).has_value());

    ASSERT_TRUE(cache.clear().has_value());
    EXPECT_TRUE(cache.record(makeKey(1000), VERIFIED, AttestationMode::Normal).has_value());
}

TEST(TrustCacheTests, OversizedBlobIsRejected)
{
    TrustCache full;
    for (uint32_t i = 0; i < buffer::TRUSTED_CARDS_MAX; ++i)
    {
        ASSERT_TRUE(full.record(makeKey(i), VERIFIED, AttestationMode::Normal).has_value());
    }
    TrustCache one;
    ASSERT_TRUE(one.record(makeKey(1000), VERIFIED, AttestationMode::Normal).has_value());

    TrustCache::Blob blob;
    ASSERT_TRUE(full.serialize(blob).has_value());
    TrustCache::Blob extra;
    ASSERT_TRUE(one.serialize(extra).has_value());
    // Skip the version record of the second blob
    blob.insert(blob.end(), extra.begin() + 3, extra.end());

    TrustCache cache;
    auto result = cache.deserialize(blob);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::StorageError::CapacityExceeded));
    EXPECT_EQ(cache.size(), 0U);
}

TEST(TrustCacheTests, PersistsAndReloads)
{
    fake::MemoryStorage storage;
    {
        TrustCache cache(&storage);
        ASSERT_TRUE(cache.record(makeKey(1), VERIFIED, AttestationMode::Normal).has_value());
        ASSERT_TRUE(cache.record(makeKey(2), FULLY_VERIFIED, AttestationMode::Full).has_value());
    }
    EXPECT_EQ(storage.writes, 2U);
    EXPECT_EQ(storage.values.count(TrustCache::STORAGE_KEY), 1U);

    TrustCache reloaded(&storage);
    EXPECT_EQ(reloaded.size(), 2U);

    auto verdict = reloaded.lookup(makeKey(2));
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict.value().attestation, FULLY_VERIFIED);
    EXPECT_EQ(verdict.value().mode, AttestationMode::Full);
}

TEST(TrustCacheTests, BlobStoresKeyHashOnly)
{
    TrustCache cache;
    const PublicKey key = makeKey(7);
    ASSERT_TRUE(cache.record(key, VERIFIED, AttestationMode::Normal).has_value());

    TrustCache::Blob blob;
    ASSERT_TRUE(cache.serialize(blob).has_value());
    ASSERT_GE(blob.size(), 3U);
    EXPECT_EQ(blob[0], static_cast<uint8_t>(TlvTag::StorageVersion));
    EXPECT_EQ(blob[2], TrustCache::STORAGE_VERSION);

    const auto found = std::search(blob.begin(), blob.end(), key.begin() + 1, key.begin() + 17);
    EXPECT_EQ(found, blob.end());

    const crypto::Sha256Digest hash = crypto::sha256(key);
    EXPECT_NE(std::search(blob.begin(), blob.end(), hash.begin(), hash.end()), blob.end());
}

TEST(TrustCacheTests, CorruptedBlobLeavesCacheEmpty)
{
    TrustCache source;
    ASSERT_TRUE(source.record(makeKey(1), VERIFIED, AttestationMode::Normal).has_value());
    ASSERT_TRUE(source.record(makeKey(2), VERIFIED, AttestationMode::Normal).has_value());

    TrustCache::Blob blob;
    ASSERT_TRUE(source.serialize(blob).has_value());

    // Second entry gets an out-of-range status
    TrustCache::Blob damaged = blob;
    damaged[damaged.size() - 4U] = 0x09;

    TrustCache cache;
    auto result = cache.deserialize(damaged);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::StorageError::CorruptedData));
    EXPECT_EQ(cache.size(), 0U);

    TrustCache::Blob truncated = blob;
    truncated.resize(truncated.size() - 5U);
    result = cache.deserialize(truncated);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::StorageError::CorruptedData));

    ASSERT_TRUE(cache.deserialize(blob).has_value());
    EXPECT_EQ(cache.size(), 2U);
}

TEST(TrustCacheTests, UnknownVersionIsCorrupted)
{
    TrustCache::Blob blob;
    blob.push_back(static_cast<uint8_t>(TlvTag::StorageVersion));
    blob.push_back(0x01);
    blob.push_back(0x02);

    TrustCache cache;
    auto result = cache.deserialize(blob);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::StorageError::CorruptedData));
}

TEST(TrustCacheTests, CorruptedStorageStartsEmpty)
{
    fake::MemoryStorage storage;
    storage.values[TrustCache::STORAGE_KEY] = {0x01, 0x02, 0x03};

    TrustCache cache(&storage);
    EXPECT_EQ(cache.size(), 0U);

    // Recording still works and overwrites the bad blob
    ASSERT_TRUE(cache.record(makeKey(1), VERIFIED, AttestationMode::Normal).has_value());
    TrustCache reloaded(&storage);
    EXPECT_EQ(reloaded.size(), 1U);
}

TEST(TrustCacheTests, UnreadableStorageStartsEmpty)
{
    fake::MemoryStorage storage;
    storage.failReads = true;

    TrustCache cache(&storage);
    EXPECT_EQ(cache.size(), 0U);
}

TEST(TrustCacheTests, BackendFailuresAreStorageErrors)
{
    fake::MemoryStorage storage;
    TrustCache cache(&storage);
    ASSERT_TRUE(cache.record(makeKey(1), VERIFIED, AttestationMode::Normal).has_value());

    storage.failReads = true;
    storage.readError = error::Error::fromTransport(error::TransportError::Unknown);
    auto loaded = cache.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_TRUE(loaded.error().is(error::StorageError::ReadFailed));
    EXPECT_EQ(cache.size(), 0U);

    storage.failReads = false;
    ASSERT_TRUE(cache.load().has_value());
    EXPECT_TRUE(cache.lookup(makeKey(1)).has_value());

    storage.failWrites = true;
    storage.writeError = error::Error::fromTransport(error::TransportError::Unknown);
    auto recorded = cache.record(makeKey(2), VERIFIED, AttestationMode::Normal);
    ASSERT_FALSE(recorded.has_value());
    EXPECT_TRUE(recorded.error().is(error::StorageError::WriteFailed));
    // Kept in memory for this process
    EXPECT_TRUE(cache.lookup(makeKey(2)).has_value());

    storage.writeError = error::Error::fromStorage(error::StorageError::CapacityExceeded);
    recorded = cache.record(makeKey(3), VERIFIED, AttestationMode::Normal);
    ASSERT_FALSE(recorded.has_value());
    EXPECT_TRUE(recorded.error().is(error::StorageError::CapacityExceeded));
}

TEST(TrustCacheTests, ClearRemovesStoredBlob)
{
    fake::MemoryStorage storage;
    TrustCache cache(&storage);
    ASSERT_TRUE(cache.record(makeKey(1), VERIFIED, AttestationMode::Normal).has_value());

    ASSERT_TRUE(cache.clear().has_value());
    EXPECT_EQ(cache.size(), 0U);
    EXPECT_FALSE(cache.lookup(makeKey(1)).has_value());
    EXPECT_TRUE(storage.values.empty());
}
