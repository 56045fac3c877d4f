#include <gtest/gtest.h>
#include "Tap/Commands/AttestCardKeyCommand.h"
#include "Tap/Session/CardSession.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "support/FakeCard.h"
#include "support/Fakes.h"

using namespace tap;

namespace
{
    AttestCardKeyCommand::Challenge requestChallenge(const CommandApdu& request)
    {
        TlvMessage tlv;
        EXPECT_TRUE(deserializeTlv(request.data, tlv).has_value());
        AttestCardKeyCommand::Challenge challenge;
        EXPECT_TRUE(TlvDecoder(tlv).decodeBytes(TlvTag::Challenge, challenge).has_value());
        return challenge;
    }
}

TEST(AttestCardKeyCommandTests, VerifiesCardSignature)
{
    fake::FakeCard card;
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    AttestCardKeyCommand command;
    ASSERT_TRUE(session.executeCommand(command).has_value());

    EXPECT_EQ(command.getChallenge().size(), buffer::CHALLENGE_SIZE);
    EXPECT_EQ(command.getSalt().size(), buffer::CHALLENGE_SIZE);
    EXPECT_EQ(command.getCardSignature().size(), buffer::SIGNATURE_MAX);
    EXPECT_TRUE(command.getLinkedCardPublicKeys().empty());

    const CommandApdu& request = card.requests.back();
    EXPECT_EQ(request.ins, Instruction::AttestCardKey);
    EXPECT_EQ(requestChallenge(request), command.getChallenge());

    TlvMessage tlv;
    ASSERT_TRUE(deserializeTlv(request.data, tlv).has_value());
    TlvDecoder decoder(tlv);
    EXPECT_EQ(decoder.decodeInt(TlvTag::InteractionMode).value(), static_cast<uint64_t>(AttestCardKeyCommand::Mode::Full));
    EXPECT_TRUE(decoder.contains(TlvTag::CardId));
}

TEST(AttestCardKeyCommandTests, UsesGivenChallenge)
{
    fake::FakeCard card;
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    AttestCardKeyCommand::Challenge challenge(buffer::CHALLENGE_SIZE, 0x5A);
    AttestCardKeyCommand command(AttestCardKeyCommand::Mode::Default, challenge);
    ASSERT_TRUE(session.executeCommand(command).has_value());
    EXPECT_EQ(requestChallenge(card.requests.back()), challenge);
}

TEST(AttestCardKeyCommandTests, ForeignSignatureIsVerificationFailure)
{
    fake::FakeCard card;
    card.badCardSignature = true;
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    AttestCardKeyCommand command;
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isVerificationFailure());
}

TEST(AttestCardKeyCommandTests, FullModeNeedsRecentFirmware)
{
    fake::FakeCard card;
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());
    const size_t before = card.requests.size();

    AttestCardKeyCommand command(AttestCardKeyCommand::Mode::Full);
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::NotSupportedFirmwareVersion));
    EXPECT_EQ(card.requests.size(), before);
}

TEST(AttestCardKeyCommandTests, FullModeVerifiesLinkedCards)
{
    fake::FakeCard card;
    card.firmware = "6.33r";
    card.linkedCards.emplace_back();
    card.linkedCards.emplace_back();
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    AttestCardKeyCommand command(AttestCardKeyCommand::Mode::Full);
    ASSERT_TRUE(session.executeCommand(command).has_value());

    ASSERT_EQ(command.getLinkedCardPublicKeys().size(), 2U);
    EXPECT_EQ(command.getLinkedCardPublicKeys()[0], card.linkedCards[0].publicKey());
    EXPECT_EQ(command.getLinkedCardPublicKeys()[1], card.linkedCards[1].publicKey());
}

TEST(AttestCardKeyCommandTests, DefaultModeVerifiesLinkedCards)
{
    fake::FakeCard card;
    card.linkedCards.emplace_back();
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    AttestCardKeyCommand command;
    ASSERT_TRUE(session.executeCommand(command).has_value());

    ASSERT_EQ(command.getLinkedCardPublicKeys().size(), 1U);
    EXPECT_EQ(command.getLinkedCardPublicKeys()[0], card.linkedCards[0].publicKey());

    TlvMessage tlv;
    ASSERT_TRUE(deserializeTlv(card.requests.back().data, tlv).has_value());
    EXPECT_EQ(TlvDecoder(tlv).decodeInt(TlvTag::InteractionMode).value(),
              static_cast<uint64_t>(AttestCardKeyCommand::Mode::Full));
}

TEST(AttestCardKeyCommandTests, CardWithoutKeyNeedsPreflightRead)
{
    fake::FakeCard card;
    card.status = CardStatus::NotPersonalized;
    CardSession session(card, SdkConfig());
    ASSERT_TRUE(session.preflightRead().has_value());

    AttestCardKeyCommand command;
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::MissingPreflightRead));
}

TEST(AttestCardKeyCommandTests, ResendKeepsChallenge)
{
    fake::FakeCard card;
    fake::FakeRecovery recovery;
    recovery.code = "111111";
    CardSession session(card, SdkConfig(), &recovery);
    ASSERT_TRUE(session.preflightRead().has_value());

    card.accessCode = "111111";
    AttestCardKeyCommand command;
    ASSERT_TRUE(session.executeCommand(command).has_value());

    ASSERT_EQ(card.countRequests(Instruction::AttestCardKey), 2U);
    const size_t last = card.requests.size() - 1U;
    EXPECT_EQ(requestChallenge(card.requests[last - 1U]), requestChallenge(card.requests[last]));
}
