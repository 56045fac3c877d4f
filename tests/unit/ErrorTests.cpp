#include <gtest/gtest.h>
#include "Error/Error.h"

using namespace error;

// Test: Error creation from different layers
TEST(ErrorTest, CreateFromTlv) {
    Error err = Error::fromTlv(TlvError::MissingTag);

    EXPECT_TRUE(err.is<TlvError>());
    EXPECT_FALSE(err.is<CommandError>());
    EXPECT_EQ(err.get<TlvError>(), TlvError::MissingTag);
    EXPECT_EQ(err.getLayer(), ErrorLayer::Tlv);
}

TEST(ErrorTest, CreateFromStatusWord) {
    Error err = Error::fromStatusWord(StatusWordError::InvalidAccessCode);

    EXPECT_TRUE(err.is<StatusWordError>());
    EXPECT_EQ(static_cast<uint16_t>(err.get<StatusWordError>()), 0x6AF1);
    EXPECT_EQ(err.getLayer(), ErrorLayer::StatusWord);
}

// Test: value comparison only matches within the same layer
TEST(ErrorTest, IsValue) {
    Error err = Error::fromCommand(CommandError::WalletNotFound);

    EXPECT_TRUE(err.is(CommandError::WalletNotFound));
    EXPECT_FALSE(err.is(CommandError::InvalidState));
    EXPECT_FALSE(err.is(StatusWordError::WalletNotFound));
}

TEST(ErrorTest, Classification) {
    EXPECT_TRUE(Error::fromAttestation(AttestationError::CardVerificationFailed).isVerificationFailure());
    EXPECT_FALSE(Error::fromAttestation(AttestationError::NetworkError).isVerificationFailure());

    EXPECT_TRUE(Error::fromAttestation(AttestationError::UserCancelled).isUserCancelled());
    EXPECT_FALSE(Error::fromCommand(CommandError::InvalidState).isUserCancelled());
}

TEST(ErrorTest, RecoverableStatusWords) {
    EXPECT_TRUE(Error::fromStatusWord(StatusWordError::InvalidAccessCode).isRecoverable());
    EXPECT_TRUE(Error::fromStatusWord(StatusWordError::InvalidPasscode).isRecoverable());
    EXPECT_TRUE(Error::fromStatusWord(StatusWordError::NeedEncryption).isRecoverable());

    EXPECT_FALSE(Error::fromStatusWord(StatusWordError::InvalidParams).isRecoverable());
    EXPECT_FALSE(Error::fromTransport(TransportError::TagLost).isRecoverable());
    EXPECT_FALSE(Error::fromEnvelope(EnvelopeError::DecryptionFailed).isRecoverable());
}

// Test: Error toString method
TEST(ErrorTest, ToString) {
    EXPECT_EQ(Error::fromTlv(TlvError::DuplicateTag).toString(), "TLV Error: DuplicateTag");
    EXPECT_EQ(Error::fromEnvelope(EnvelopeError::DecryptionFailed).toString(), "Envelope Error: DecryptionFailed");
    EXPECT_EQ(Error::fromCommand(CommandError::RetryLimitExceeded).toString(), "Command Error: RetryLimitExceeded");
    EXPECT_EQ(Error::fromStorage(StorageError::CorruptedData).toString(), "Storage Error: CorruptedData");
}

TEST(ErrorTest, LayerNames) {
    Error transport = Error::fromTransport(TransportError::Timeout);
    Error status = Error::fromStatusWord(StatusWordError::NeedPause);
    Error attestation = Error::fromAttestation(AttestationError::UnsupportedMode);

    EXPECT_NE(transport.toString().find("Transport"), etl::string<160>::npos);
    EXPECT_NE(status.toString().find("StatusWord"), etl::string<160>::npos);
    EXPECT_NE(attestation.toString().find("Attestation"), etl::string<160>::npos);
}
