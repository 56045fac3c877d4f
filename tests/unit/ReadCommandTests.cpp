#include <gtest/gtest.h>
#include "Tap/Commands/ReadCommand.h"
#include "Tap/Commands/ReadWalletCommand.h"
#include "Tap/Session/CardSession.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "support/FakeCard.h"

using namespace tap;

namespace
{
    TlvMessage decodePayload(const CommandApdu& request)
    {
        TlvMessage tlv;
        EXPECT_TRUE(deserializeTlv(request.data, tlv).has_value());
        return tlv;
    }

    TlvBuilder minimalCardResponse()
    {
        TlvBuilder builder;
        builder.appendString(TlvTag::CardId, "CB79000000018201");
        builder.appendString(TlvTag::ManufacturerName, "TANGEM");
        builder.appendInt(TlvTag::Status, static_cast<int64_t>(CardStatus::Loaded));
        builder.appendString(TlvTag::FirmwareVersion, "4.52r");
        return builder;
    }
}

TEST(ReadCommandTests, BuildRequestCarriesPinAndMode)
{
    ReadCommand command;
    SessionEnvironment environment;

    auto request = command.buildRequest(environment);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request.value().ins, Instruction::Read);

    TlvMessage tlv = decodePayload(request.value());
    TlvDecoder decoder(tlv);

    CodeHash pin;
    ASSERT_TRUE(decoder.decodeBytes(TlvTag::Pin, pin).has_value());
    EXPECT_EQ(pin, SessionEnvironment::hashCode(DEFAULT_ACCESS_CODE));
    EXPECT_EQ(decoder.decodeInt(TlvTag::InteractionMode).value(), static_cast<uint64_t>(ReadMode::ReadCard));
    EXPECT_FALSE(decoder.contains(TlvTag::CardId));
    EXPECT_FALSE(decoder.contains(TlvTag::TerminalPublicKey));
}

TEST(ReadCommandTests, TerminalKeyFollowsConfiguration)
{
    TerminalKeys keys;
    keys.publicKey.assign(65, 0x04);

    SessionEnvironment linked;
    linked.terminalKeyPair = keys;

    ReadCommand command;
    auto request = command.buildRequest(linked);
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(TlvDecoder(decodePayload(request.value())).contains(TlvTag::TerminalPublicKey));

    SdkConfig config;
    config.linkedTerminal = false;
    SessionEnvironment unlinked(config);
    unlinked.terminalKeyPair = keys;

    request = command.buildRequest(unlinked);
    ASSERT_TRUE(request.has_value());
    EXPECT_FALSE(TlvDecoder(decodePayload(request.value())).contains(TlvTag::TerminalPublicKey));
}

TEST(ReadCommandTests, ParseMinimalResponse)
{
    ReadCommand command;
    SessionEnvironment environment;

    ASSERT_TRUE(command.parseResponse(minimalCardResponse().records(), environment).has_value());

    const Card& card = command.getCard();
    EXPECT_EQ(card.cardId, "CB79000000018201");
    EXPECT_TRUE(card.cardPublicKey.empty());
    EXPECT_EQ(card.settingsMask, 0U);
    EXPECT_FALSE(card.isActivated);
    EXPECT_FALSE(card.issuerPublicKey.has_value());
    EXPECT_TRUE(card.wallets.empty());
}

TEST(ReadCommandTests, ParseRejectsUnknownCardStatus)
{
    TlvBuilder builder;
    builder.appendString(TlvTag::CardId, "CB79000000018201");
    builder.appendString(TlvTag::ManufacturerName, "TANGEM");
    builder.appendInt(TlvTag::Status, 0x07);
    builder.appendString(TlvTag::FirmwareVersion, "4.52r");

    ReadCommand command;
    SessionEnvironment environment;
    auto result = command.parseResponse(builder.records(), environment);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::InvalidResponse));
}

TEST(ReadCommandTests, ParseRejectsMissingCardId)
{
    TlvBuilder builder;
    builder.appendString(TlvTag::ManufacturerName, "TANGEM");

    ReadCommand command;
    SessionEnvironment environment;
    auto result = command.parseResponse(builder.records(), environment);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::TlvError::MissingTag));
}

TEST(ReadCommandTests, ParseRejectsMalformedFirmware)
{
    TlvBuilder builder;
    builder.appendString(TlvTag::CardId, "CB79000000018201");
    builder.appendString(TlvTag::ManufacturerName, "TANGEM");
    builder.appendInt(TlvTag::Status, static_cast<int64_t>(CardStatus::Loaded));
    builder.appendString(TlvTag::FirmwareVersion, "release");

    ReadCommand command;
    SessionEnvironment environment;
    auto result = command.parseResponse(builder.records(), environment);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::TlvError::TypeMismatch));
}

TEST(ReadCommandTests, SingleWalletFirmwareReportsWalletInline)
{
    fake::FakeCard card;
    card.legacyWalletInline = true;
    card.addWallet(0).signedHashes = 12;
    CardSession session(card, SdkConfig());

    ASSERT_TRUE(session.preflightRead().has_value());
    ASSERT_EQ(session.card()->wallets.size(), 1U);

    const CardWallet& wallet = session.card()->wallets[0];
    EXPECT_EQ(wallet.index, 0U);
    EXPECT_EQ(wallet.status, WalletStatus::Loaded);
    EXPECT_EQ(wallet.publicKey, card.wallets[0].key.publicKey());
    EXPECT_EQ(wallet.curve, "secp256k1");
    EXPECT_EQ(wallet.totalSignedHashes.value(), 12U);
}

TEST(ReadCommandTests, InlineWalletWithoutCurveIsSecp256k1)
{
    fake::FakeCard card;
    card.legacyWalletInline = true;
    card.addWallet(0, "");
    CardSession session(card, SdkConfig());

    ASSERT_TRUE(session.preflightRead().has_value());
    ASSERT_EQ(session.card()->wallets.size(), 1U);
    EXPECT_EQ(session.card()->wallets[0].curve, "secp256k1");
}

TEST(ReadWalletCommandTests, ReadsWalletByIndex)
{
    fake::FakeCard card;
    fake::FakeWallet& stored = card.addWallet(3);
    stored.signedHashes = 42;
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    ReadWalletCommand command(3);
    ASSERT_TRUE(session.executeCommand(command).has_value());

    const CardWallet& wallet = command.getWallet();
    EXPECT_EQ(wallet.index, 3U);
    EXPECT_EQ(wallet.status, WalletStatus::Loaded);
    EXPECT_EQ(wallet.publicKey, card.wallets[0].key.publicKey());
    EXPECT_EQ(wallet.totalSignedHashes.value(), 42U);
    EXPECT_FALSE(wallet.remainingSignatures.has_value());

    TlvDecoder request(decodePayload(card.requests.back()));
    EXPECT_EQ(request.decodeInt(TlvTag::InteractionMode).value(), static_cast<uint64_t>(ReadMode::ReadWallet));
    EXPECT_EQ(request.decodeInt(TlvTag::WalletIndex).value(), 3U);
    EXPECT_TRUE(request.contains(TlvTag::CardId));

    ASSERT_TRUE(session.upsertWallet(wallet).has_value());
    EXPECT_NE(session.card()->findWallet(3), nullptr);
}

TEST(ReadWalletCommandTests, MissingWalletMapsToWalletNotFound)
{
    fake::FakeCard card;
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    ReadWalletCommand command(5);
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::WalletNotFound));
}

TEST(ReadWalletCommandTests, ParseRejectsOtherIndex)
{
    TlvBuilder builder;
    builder.appendInt(TlvTag::WalletIndex, 2);
    builder.appendInt(TlvTag::WalletStatus, static_cast<int64_t>(WalletStatus::Loaded));

    ReadWalletCommand command(1);
    SessionEnvironment environment;
    auto result = command.parseResponse(builder.records(), environment);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::InvalidResponse));
}

TEST(ReadWalletCommandTests, EmptyWalletHasNoKey)
{
    TlvBuilder builder;
    builder.appendInt(TlvTag::WalletIndex, 1);
    builder.appendInt(TlvTag::WalletStatus, static_cast<int64_t>(WalletStatus::Empty));

    ReadWalletCommand command(1);
    SessionEnvironment environment;
    ASSERT_TRUE(command.parseResponse(builder.records(), environment).has_value());
    EXPECT_EQ(command.getWallet().status, WalletStatus::Empty);
    EXPECT_TRUE(command.getWallet().publicKey.empty());
}
