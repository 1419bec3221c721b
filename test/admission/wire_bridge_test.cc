#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/admission/wire_bridge.h"

using namespace Subgate;
using ::testing::_;
using ::testing::InSequence;
using ::testing::StrictMock;

class MockWireSender : public IWireSubscriptionSender {
public:
    MOCK_METHOD(void, SendSubscribe, (const SubscriptionKey& key, Tier tier), (override));
    MOCK_METHOD(void, SendUnsubscribe, (const SubscriptionKey& key, Tier tier), (override));
};

SubscriptionKey MakeKey(const std::string& pair) {
    return SubscriptionKey{pair, "token", "sol"};
}

class SubscriptionKeyTest : public ::testing::Test {};

TEST_F(SubscriptionKeyTest, ParseValidKey) {
    auto key = ParseSubscriptionKey("p1|t1|eth");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->pair, "p1");
    EXPECT_EQ(key->token, "t1");
    EXPECT_EQ(key->chain, "eth");
    EXPECT_EQ(key->ToString(), "p1|t1|eth");
}

TEST_F(SubscriptionKeyTest, RejectMalformedKeys) {
    EXPECT_FALSE(ParseSubscriptionKey("").has_value());
    EXPECT_FALSE(ParseSubscriptionKey("p1|t1").has_value());
    EXPECT_FALSE(ParseSubscriptionKey("p1|t1|eth|extra").has_value());
    EXPECT_FALSE(ParseSubscriptionKey("p1||eth").has_value());
    EXPECT_FALSE(ParseSubscriptionKey("|t1|eth").has_value());
}

class WireSubscriptionBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        sender_ = std::make_shared<StrictMock<MockWireSender>>();
        bridge_ = std::make_unique<WireSubscriptionBridge>(controller_, sender_);
    }

    SubscriptionController controller_;
    std::shared_ptr<StrictMock<MockWireSender>> sender_;
    std::unique_ptr<WireSubscriptionBridge> bridge_;
};

TEST_F(WireSubscriptionBridgeTest, NullSenderThrows) {
    EXPECT_THROW({ WireSubscriptionBridge bridge(controller_, nullptr); }, std::invalid_argument);
}

TEST_F(WireSubscriptionBridgeTest, AdmitSubscribesAndRegisters) {
    EXPECT_CALL(*sender_, SendSubscribe(MakeKey("a"), Tier::kFast)).Times(1);

    EXPECT_TRUE(bridge_->AdmitFast("a|token|sol"));

    EXPECT_THAT(controller_.GetSubscriptionSnapshot().fast_keys, ::testing::ElementsAre("a|token|sol"));
    EXPECT_EQ(bridge_->subscribes_sent(), 1);
    EXPECT_EQ(bridge_->unsubscribes_sent(), 0);
}

TEST_F(WireSubscriptionBridgeTest, MalformedKeyIsNotAdmitted) {
    EXPECT_FALSE(bridge_->AdmitFast("not-a-key"));
    EXPECT_EQ(controller_.GetSubscriptionMetrics().counts.fast, 0);
}

TEST_F(WireSubscriptionBridgeTest, OverflowUnsubscribesOldest) {
    {
        InSequence seq;
        for (int i = 1; i <= 7; ++i) {
            if (i == 7) {
                // The slot is freed before the newcomer is subscribed
                EXPECT_CALL(*sender_, SendUnsubscribe(MakeKey("k1"), Tier::kFast));
            }
            EXPECT_CALL(*sender_, SendSubscribe(MakeKey("k" + std::to_string(i)), Tier::kFast));
        }
    }

    for (int i = 1; i <= 7; ++i) {
        EXPECT_TRUE(bridge_->AdmitFast("k" + std::to_string(i) + "|token|sol"));
    }
    EXPECT_EQ(bridge_->unsubscribes_sent(), 1);
}

TEST_F(WireSubscriptionBridgeTest, SlowEvictionsUseSlowTier) {
    controller_.UpdatePaneRenderedCount("trending", 1);
    {
        InSequence seq;
        EXPECT_CALL(*sender_, SendSubscribe(MakeKey("s1"), Tier::kSlow));
        EXPECT_CALL(*sender_, SendSubscribe(MakeKey("s2"), Tier::kSlow));
        EXPECT_CALL(*sender_, SendUnsubscribe(MakeKey("s1"), Tier::kSlow));
    }

    EXPECT_TRUE(bridge_->AdmitSlow("s1|token|sol"));
    controller_.UpdatePaneRenderedCount("trending", 2);
    EXPECT_TRUE(bridge_->AdmitSlow("s2|token|sol"));
    controller_.UpdatePaneRenderedCount("trending", 1);
}

TEST_F(WireSubscriptionBridgeTest, KeyEvictedByItsOwnAdmissionIsNeverSubscribed) {
    // Slow capacity is 0 until some rows are rendered
    EXPECT_FALSE(bridge_->AdmitSlow("s|token|sol"));

    EXPECT_EQ(controller_.GetSubscriptionMetrics().counts.slow, 0);
    EXPECT_EQ(bridge_->subscribes_sent(), 0);
    EXPECT_EQ(bridge_->unsubscribes_sent(), 0);
}

TEST_F(WireSubscriptionBridgeTest, RepeatedAdmissionSubscribesOnce) {
    EXPECT_CALL(*sender_, SendSubscribe(MakeKey("a"), Tier::kFast)).Times(1);

    EXPECT_TRUE(bridge_->AdmitFast("a|token|sol"));
    EXPECT_TRUE(bridge_->AdmitFast("a|token|sol"));
    EXPECT_EQ(bridge_->subscribes_sent(), 1);
}

TEST_F(WireSubscriptionBridgeTest, UpgradeMovesWireSubscriptionToFastTier) {
    controller_.UpdatePaneRenderedCount("trending", 5);
    {
        InSequence seq;
        EXPECT_CALL(*sender_, SendSubscribe(MakeKey("a"), Tier::kSlow));
        EXPECT_CALL(*sender_, SendSubscribe(MakeKey("a"), Tier::kFast));
        EXPECT_CALL(*sender_, SendUnsubscribe(MakeKey("a"), Tier::kSlow));
        EXPECT_CALL(*sender_, SendUnsubscribe(MakeKey("a"), Tier::kFast));
    }

    EXPECT_TRUE(bridge_->AdmitSlow("a|token|sol"));
    EXPECT_TRUE(bridge_->AdmitFast("a|token|sol"));
    EXPECT_FALSE(bridge_->IsSubscribed("a|token|sol", Tier::kSlow));
    EXPECT_TRUE(bridge_->IsSubscribed("a|token|sol", Tier::kFast));

    controller_.UpdatePaneVisibleCount("trending", 0);
    controller_.EngageSubscriptionLock(LockRequest::DenyAllKeys());
    controller_.ReleaseSubscriptionLock();

    auto metrics = controller_.GetSubscriptionMetrics();
    EXPECT_EQ(metrics.counts.fast, 0);
    EXPECT_EQ(metrics.counts.slow, 0);
    EXPECT_EQ(bridge_->subscribes_sent(), bridge_->unsubscribes_sent());
}

TEST_F(WireSubscriptionBridgeTest, SlowAdmissionOfFastKeySendsNothing) {
    controller_.UpdatePaneRenderedCount("trending", 5);
    EXPECT_CALL(*sender_, SendSubscribe(MakeKey("a"), Tier::kFast)).Times(1);

    EXPECT_TRUE(bridge_->AdmitFast("a|token|sol"));
    EXPECT_FALSE(bridge_->AdmitSlow("a|token|sol"));

    EXPECT_FALSE(bridge_->IsSubscribed("a|token|sol", Tier::kSlow));
    EXPECT_EQ(controller_.GetSubscriptionMetrics().counts.slow, 0);
}

TEST_F(WireSubscriptionBridgeTest, LockedFastAdmissionOfSlowKeySendsNothing) {
    controller_.UpdatePaneRenderedCount("trending", 5);
    EXPECT_CALL(*sender_, SendSubscribe(MakeKey("a"), Tier::kSlow)).Times(1);

    EXPECT_TRUE(bridge_->AdmitSlow("a|token|sol"));
    controller_.EngageSubscriptionLock(LockRequest::AllowOnly({"focus|token|sol"}));
    EXPECT_FALSE(bridge_->AdmitFast("a|token|sol"));

    EXPECT_TRUE(bridge_->IsSubscribed("a|token|sol", Tier::kSlow));
    EXPECT_FALSE(bridge_->IsSubscribed("a|token|sol", Tier::kFast));
}

TEST_F(WireSubscriptionBridgeTest, LockedFastAdmissionOutsideAllowListSendsNothing) {
    controller_.EngageSubscriptionLock(LockRequest::AllowOnly({"focus|token|sol"}));

    EXPECT_FALSE(bridge_->AdmitFast("other|token|sol"));

    EXPECT_EQ(bridge_->subscribes_sent(), 0);
    EXPECT_EQ(bridge_->unsubscribes_sent(), 0);
}

TEST_F(WireSubscriptionBridgeTest, DropUnsubscribes) {
    controller_.UpdatePaneRenderedCount("trending", 5);
    EXPECT_CALL(*sender_, SendSubscribe(MakeKey("a"), Tier::kFast));
    EXPECT_CALL(*sender_, SendUnsubscribe(MakeKey("a"), Tier::kFast));

    EXPECT_TRUE(bridge_->AdmitFast("a|token|sol"));
    EXPECT_TRUE(bridge_->Drop("a|token|sol", Tier::kFast));
    EXPECT_FALSE(bridge_->Drop("a|token|sol", Tier::kFast));
    EXPECT_FALSE(bridge_->Drop("b|token|sol", Tier::kSlow));
}

TEST_F(WireSubscriptionBridgeTest, LockUnsubscribesEvictedKeys) {
    EXPECT_CALL(*sender_, SendSubscribe(_, Tier::kFast)).Times(3);
    EXPECT_CALL(*sender_, SendUnsubscribe(MakeKey("a"), Tier::kFast));
    EXPECT_CALL(*sender_, SendUnsubscribe(MakeKey("c"), Tier::kFast));

    bridge_->AdmitFast("a|token|sol");
    bridge_->AdmitFast("b|token|sol");
    bridge_->AdmitFast("c|token|sol");
    controller_.EngageSubscriptionLock(LockRequest::AllowOnly({"b|token|sol"}));

    EXPECT_EQ(bridge_->unsubscribes_sent(), 2);
}

TEST_F(WireSubscriptionBridgeTest, DestroyedBridgeStopsListening) {
    EXPECT_CALL(*sender_, SendSubscribe(_, _)).Times(0);
    EXPECT_CALL(*sender_, SendUnsubscribe(_, _)).Times(0);

    bridge_.reset();
    controller_.RegisterSlowSubscription("s|token|sol");
    EXPECT_EQ(controller_.GetSubscriptionMetrics().counts.slow, 0);
}
