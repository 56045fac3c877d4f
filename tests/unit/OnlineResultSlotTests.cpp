#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>
#include "Tap/Attestation/OnlineResultSlot.h"

using namespace tap;

namespace
{
    VerificationResult passed(const char* cardId)
    {
        VerificationRecord record;
        record.cardId = cardId;
        record.passed = true;
        return record;
    }

    VerificationResult networkError()
    {
        return etl::unexpected(error::Error::fromAttestation(error::AttestationError::NetworkError));
    }
}

TEST(OnlineResultSlotTests, SubscriberFiresOnPublish)
{
    OnlineResultSlot slot;
    const OnlineResultSlot::Token token = slot.arm();

    std::vector<VerificationResult> received;
    slot.subscribe([&received](const VerificationResult& result) { received.push_back(result); });
    EXPECT_TRUE(received.empty());

    EXPECT_TRUE(slot.publish(token, passed("CB79000000018201")));
    ASSERT_EQ(received.size(), 1U);
    ASSERT_TRUE(received[0].has_value());
    EXPECT_EQ(received[0].value().cardId, "CB79000000018201");
    EXPECT_TRUE(slot.hasResult());
}

TEST(OnlineResultSlotTests, LateSubscriberGetsStoredResult)
{
    OnlineResultSlot slot;
    const OnlineResultSlot::Token token = slot.arm();
    EXPECT_TRUE(slot.publish(token, networkError()));

    size_t calls = 0;
    slot.subscribe([&calls](const VerificationResult& result) {
        ++calls;
        EXPECT_FALSE(result.has_value());
        EXPECT_TRUE(result.error().is(error::AttestationError::NetworkError));
    });
    EXPECT_EQ(calls, 1U);
}

TEST(OnlineResultSlotTests, SecondResultIsRejected)
{
    OnlineResultSlot slot;
    const OnlineResultSlot::Token token = slot.arm();

    size_t calls = 0;
    slot.subscribe([&calls](const VerificationResult&) { ++calls; });

    EXPECT_TRUE(slot.publish(token, passed("A")));
    EXPECT_FALSE(slot.publish(token, passed("B")));
    EXPECT_EQ(calls, 1U);
}

TEST(OnlineResultSlotTests, StaleTokenIsDropped)
{
    OnlineResultSlot slot;
    const OnlineResultSlot::Token first = slot.arm();
    const OnlineResultSlot::Token second = slot.arm();
    EXPECT_NE(first, second);
    EXPECT_EQ(slot.currentToken(), second);

    std::vector<VerificationResult> received;
    slot.subscribe([&received](const VerificationResult& result) { received.push_back(result); });

    EXPECT_FALSE(slot.publish(first, passed("OLD")));
    EXPECT_TRUE(received.empty());
    EXPECT_FALSE(slot.hasResult());

    EXPECT_TRUE(slot.publish(second, passed("NEW")));
    ASSERT_EQ(received.size(), 1U);
    EXPECT_EQ(received[0].value().cardId, "NEW");
}

TEST(OnlineResultSlotTests, ArmDropsPendingResultAndSubscriber)
{
    OnlineResultSlot slot;
    const OnlineResultSlot::Token token = slot.arm();
    EXPECT_TRUE(slot.publish(token, passed("A")));

    size_t oldCalls = 0;
    slot.arm();
    EXPECT_FALSE(slot.hasResult());

    slot.subscribe([&oldCalls](const VerificationResult&) { ++oldCalls; });
    const OnlineResultSlot::Token next = slot.arm();

    EXPECT_TRUE(slot.publish(next, passed("B")));
    EXPECT_EQ(oldCalls, 0U);
}

TEST(OnlineResultSlotTests, ResetInvalidatesTokens)
{
    OnlineResultSlot slot;
    const OnlineResultSlot::Token token = slot.arm();

    size_t calls = 0;
    slot.subscribe([&calls](const VerificationResult&) { ++calls; });
    slot.reset();

    EXPECT_FALSE(slot.publish(token, passed("A")));
    EXPECT_EQ(calls, 0U);
}

TEST(OnlineResultSlotTests, PublisherIsBoundToItsToken)
{
    OnlineResultSlot slot;
    OnlineResultSlot::Publisher stale = slot.publisher(slot.arm());
    OnlineResultSlot::Publisher current = slot.publisher(slot.arm());

    std::vector<VerificationResult> received;
    slot.subscribe([&received](const VerificationResult& result) { received.push_back(result); });

    stale(passed("OLD"));
    EXPECT_TRUE(received.empty());

    current(passed("NEW"));
    ASSERT_EQ(received.size(), 1U);
    EXPECT_EQ(received[0].value().cardId, "NEW");
}

TEST(OnlineResultSlotTests, PublisherMayOutliveSlot)
{
    OnlineResultSlot::Publisher publisher;
    {
        auto slot = std::make_unique<OnlineResultSlot>();
        publisher = slot->publisher(slot->arm());
    }

    // Nothing to deliver to, nothing happens
    publisher(passed("A"));
    SUCCEED();
}

TEST(OnlineResultSlotTests, SubscriberMayRearmFromCallback)
{
    OnlineResultSlot slot;
    const OnlineResultSlot::Token token = slot.arm();

    OnlineResultSlot::Token rearmed = 0;
    slot.subscribe([&slot, &rearmed](const VerificationResult&) { rearmed = slot.arm(); });

    EXPECT_TRUE(slot.publish(token, passed("A")));
    EXPECT_EQ(rearmed, slot.currentToken());
    EXPECT_FALSE(slot.hasResult());
}

TEST(OnlineResultSlotTests, PublishFromWorkerThread)
{
    OnlineResultSlot slot;
    OnlineResultSlot::Publisher publisher = slot.publisher(slot.arm());

    std::thread worker([publisher]() { publisher(passed("THREAD")); });
    worker.join();

    etl::string<buffer::CARD_ID_TEXT_MAX> cardId;
    slot.subscribe([&cardId](const VerificationResult& result) { cardId = result.value().cardId; });
    EXPECT_EQ(cardId, "THREAD");
}
