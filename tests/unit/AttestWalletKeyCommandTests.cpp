#include <gtest/gtest.h>
#include "Tap/Commands/AttestWalletKeyCommand.h"
#include "Tap/Commands/ReadWalletCommand.h"
#include "Tap/Session/CardSession.h"
#include "Tap/Tlv/TlvDecoder.h"
#include "support/FakeCard.h"
#include "support/Fakes.h"

using namespace tap;

namespace
{
    void readWallets(CardSession& session, const fake::FakeCard& card)
    {
        ASSERT_TRUE(session.preflightRead().has_value());
        for (const fake::FakeWallet& stored : card.wallets)
        {
            ReadWalletCommand read(stored.index);
            ASSERT_TRUE(session.executeCommand(read).has_value());
            ASSERT_TRUE(session.upsertWallet(read.getWallet()).has_value());
        }
    }
}

TEST(AttestWalletKeyCommandTests, VerifiesWalletSignature)
{
    fake::FakeCard card;
    card.addWallet(1).attestCounter = 9;
    CardSession session(card, SdkConfig());
    readWallets(session, card);

    AttestWalletKeyCommand command(card.wallets[0].key.publicKey());
    ASSERT_TRUE(session.executeCommand(command).has_value());
    ASSERT_TRUE(command.getCounter().has_value());
    EXPECT_EQ(command.getCounter().value(), 9U);

    TlvMessage tlv;
    ASSERT_TRUE(deserializeTlv(card.requests.back().data, tlv).has_value());
    TlvDecoder request(tlv);
    EXPECT_EQ(card.requests.back().ins, Instruction::AttestWalletKey);
    EXPECT_EQ(request.decodeInt(TlvTag::WalletIndex).value(), 1U);
    EXPECT_EQ(request.count(TlvTag::Challenge), 1U);
}

TEST(AttestWalletKeyCommandTests, CounterIsOptional)
{
    fake::FakeCard card;
    card.addWallet(0);
    CardSession session(card, SdkConfig());
    readWallets(session, card);

    AttestWalletKeyCommand command(card.wallets[0].key.publicKey());
    ASSERT_TRUE(session.executeCommand(command).has_value());
    EXPECT_FALSE(command.getCounter().has_value());
}

TEST(AttestWalletKeyCommandTests, ForeignSignatureIsVerificationFailure)
{
    fake::FakeCard card;
    card.addWallet(0).badSignature = true;
    CardSession session(card, SdkConfig());
    readWallets(session, card);

    AttestWalletKeyCommand command(card.wallets[0].key.publicKey());
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isVerificationFailure());
}

TEST(AttestWalletKeyCommandTests, UnknownKeyFailsBeforeIo)
{
    fake::FakeCard card;
    card.addWallet(0);
    CardSession session(card, SdkConfig());
    readWallets(session, card);
    const size_t before = card.requests.size();

    fake::KeyPair stranger;
    AttestWalletKeyCommand command(stranger.publicKey());
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::WalletNotFound));
    EXPECT_EQ(card.requests.size(), before);
}

TEST(AttestWalletKeyCommandTests, VerifiesWalletsOnEveryCurve)
{
    fake::FakeCard card;
    card.addWallet(0, "ed25519");
    card.addWallet(1, "secp256r1");
    card.addWallet(2, "secp256k1");
    CardSession session(card, SdkConfig());
    readWallets(session, card);

    for (const fake::FakeWallet& wallet : card.wallets)
    {
        AttestWalletKeyCommand command(wallet.key.publicKey());
        EXPECT_TRUE(session.executeCommand(command).has_value()) << wallet.curve.c_str();
    }
    EXPECT_EQ(card.countRequests(Instruction::AttestWalletKey), 3U);
}

TEST(AttestWalletKeyCommandTests, ForgedEd25519SignatureFails)
{
    fake::FakeCard card;
    card.addWallet(0, "ed25519").badSignature = true;
    CardSession session(card, SdkConfig());
    readWallets(session, card);

    // Signed by the card key instead of the wallet key
    AttestWalletKeyCommand command(card.wallets[0].key.publicKey());
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isVerificationFailure());
}

TEST(AttestWalletKeyCommandTests, UnknownCurveIsRejectedBeforeSending)
{
    fake::FakeCard card;
    card.addWallet(0);
    CardSession session(card, SdkConfig());
    readWallets(session, card);

    CardWallet wallet = session.card()->wallets[0];
    wallet.curve = "bls12381_G2";
    ASSERT_TRUE(session.upsertWallet(wallet).has_value());
    const size_t before = card.requests.size();

    AttestWalletKeyCommand command(wallet.publicKey);
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::UnsupportedCurve));
    EXPECT_EQ(card.requests.size(), before);
}

TEST(AttestWalletKeyCommandTests, WalletNotFoundStatusIsMapped)
{
    fake::FakeCard card;
    card.addWallet(0);
    CardSession session(card, SdkConfig());
    readWallets(session, card);
    card.queueStatusWord(0x6A88);

    AttestWalletKeyCommand command(card.wallets[0].key.publicKey());
    auto result = session.executeCommand(command);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(error::CommandError::WalletNotFound));
}
