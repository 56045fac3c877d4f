#include <gtest/gtest.h>
#include "Tap/Tlv/Tlv.h"
#include "Tap/Tlv/TlvTag.h"
#include "Error/Error.h"

using namespace tap;

namespace
{
    TlvValue filled(size_t length, uint8_t pattern)
    {
        TlvValue value;
        for (size_t i = 0; i < length; ++i)
        {
            value.push_back(static_cast<uint8_t>(pattern + i));
        }
        return value;
    }
}

TEST(TlvTests, SerializesShortRecord)
{
    TlvValue value;
    value.push_back(0xCA);
    value.push_back(0xFE);

    etl::vector<uint8_t, 16> out;
    auto result = Tlv(TlvTag::Salt, value).serialize(out);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(out.size(), 4U);
    EXPECT_EQ(out[0], 0x17);
    EXPECT_EQ(out[1], 0x02);
    EXPECT_EQ(out[2], 0xCA);
    EXPECT_EQ(out[3], 0xFE);
}

TEST(TlvTests, SerializesZeroLengthValue)
{
    TlvValue empty;
    etl::vector<uint8_t, 4> out;

    ASSERT_TRUE(Tlv(TlvTag::IssuerData, empty).serialize(out).has_value());
    ASSERT_EQ(out.size(), 2U);
    EXPECT_EQ(out[0], 0x32);
    EXPECT_EQ(out[1], 0x00);

    size_t offset = 0;
    auto parsed = Tlv::parse(out, offset);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().tag, TlvTag::IssuerData);
    EXPECT_TRUE(parsed.value().value.empty());
    EXPECT_EQ(offset, 2U);
}

TEST(TlvTests, LargestShortLengthUsesOneByte)
{
    const TlvValue value = filled(254, 0);
    etl::vector<uint8_t, 300> out;

    ASSERT_TRUE(Tlv(TlvTag::IssuerData, value).serialize(out).has_value());
    ASSERT_EQ(out.size(), 256U);
    EXPECT_EQ(out[1], 0xFE);
}

TEST(TlvTests, ExtendedLengthStartsAt255)
{
    const TlvValue value = filled(255, 0);
    etl::vector<uint8_t, 300> out;

    ASSERT_TRUE(Tlv(TlvTag::IssuerData, value).serialize(out).has_value());
    ASSERT_EQ(out.size(), 259U);
    EXPECT_EQ(out[1], 0xFF);
    EXPECT_EQ(out[2], 0x00);
    EXPECT_EQ(out[3], 0xFF);
    EXPECT_EQ(out[4], 0x00);
}

TEST(TlvTests, ExtendedLengthAt256RoundTrips)
{
    const TlvValue value = filled(256, 7);
    etl::vector<uint8_t, 300> out;

    ASSERT_TRUE(Tlv(TlvTag::IssuerData, value).serialize(out).has_value());
    EXPECT_EQ(out[1], 0xFF);
    EXPECT_EQ(out[2], 0x01);
    EXPECT_EQ(out[3], 0x00);

    size_t offset = 0;
    auto parsed = Tlv::parse(out, offset);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().value, value);
    EXPECT_EQ(offset, out.size());
}

TEST(TlvTests, SerializeReportsBufferOverflow)
{
    const TlvValue value = filled(10, 0);
    etl::vector<uint8_t, 8> out;

    auto result = Tlv(TlvTag::Salt, value).serialize(out);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::TlvError::BufferOverflow));
}

TEST(TlvTests, ParseRejectsTruncatedValue)
{
    etl::vector<uint8_t, 8> data;
    data.push_back(0x17);
    data.push_back(0x04);
    data.push_back(0x01);
    data.push_back(0x02);

    size_t offset = 0;
    auto parsed = Tlv::parse(data, offset);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_TRUE(parsed.error().is(error::TlvError::MalformedRecord));
    EXPECT_EQ(offset, 0U);
}

TEST(TlvTests, ParseRejectsTruncatedExtendedLength)
{
    etl::vector<uint8_t, 8> data;
    data.push_back(0x32);
    data.push_back(0xFF);
    data.push_back(0x01);

    size_t offset = 0;
    auto parsed = Tlv::parse(data, offset);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_TRUE(parsed.error().is(error::TlvError::MalformedRecord));
}

TEST(TlvTests, ParseRejectsLoneTagByte)
{
    etl::vector<uint8_t, 4> data;
    data.push_back(0x01);

    size_t offset = 0;
    EXPECT_FALSE(Tlv::parse(data, offset).has_value());
}

TEST(TlvTests, DeserializeKeepsRecordOrder)
{
    etl::vector<uint8_t, 32> data;
    const uint8_t bytes[] = {0x01, 0x02, 0xAA, 0xBB, 0x02, 0x01, 0x02, 0x16, 0x00};
    data.assign(bytes, bytes + sizeof(bytes));

    TlvMessage tlv;
    auto result = deserializeTlv(data, tlv);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(tlv.size(), 3U);
    EXPECT_EQ(tlv[0].tag, TlvTag::CardId);
    EXPECT_EQ(tlv[1].tag, TlvTag::Status);
    EXPECT_EQ(tlv[2].tag, TlvTag::Challenge);
    EXPECT_EQ(tlv[2].length(), 0U);

    etl::vector<uint8_t, 32> reencoded;
    ASSERT_TRUE(serializeTlv(tlv, reencoded).has_value());
    EXPECT_EQ(reencoded, data);
}

TEST(TlvTests, DeserializeKeepsUnknownTagsOpaque)
{
    etl::vector<uint8_t, 8> data;
    data.push_back(0x7E);
    data.push_back(0x01);
    data.push_back(0x42);

    TlvMessage tlv;
    ASSERT_TRUE(deserializeTlv(data, tlv).has_value());
    ASSERT_EQ(tlv.size(), 1U);
    EXPECT_EQ(nameOf(tlv[0].tag), etl::string_view("Unknown"));
    EXPECT_EQ(valueTypeOf(tlv[0].tag), TlvValueType::ByteArray);
}

TEST(TlvTests, DeserializeEmptyInputGivesEmptyMessage)
{
    etl::vector<uint8_t, 1> data;
    TlvMessage tlv;

    ASSERT_TRUE(deserializeTlv(data, tlv).has_value());
    EXPECT_TRUE(tlv.empty());
}

TEST(TlvTests, RegistryDescribesKnownTags)
{
    const TlvTagInfo* info = describeTag(TlvTag::BackupCardPublicKey);
    ASSERT_NE(info, nullptr);
    EXPECT_TRUE(info->multiple);
    EXPECT_EQ(info->type, TlvValueType::ByteArray);

    EXPECT_EQ(valueTypeOf(TlvTag::CardId), TlvValueType::HexString);
    EXPECT_EQ(valueTypeOf(TlvTag::ManufactureDateTime), TlvValueType::Date);
    EXPECT_EQ(nameOf(TlvTag::WalletSignature), etl::string_view("WalletSignature"));
    EXPECT_EQ(describeTag(static_cast<TlvTag>(0x7E)), nullptr);
}
