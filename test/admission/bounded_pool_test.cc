#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/admission/bounded_pool.h"

using namespace Subgate;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

std::vector<Key> MakeKeys(const std::string& prefix, int first, int last) {
    std::vector<Key> keys;
    for (int i = first; i <= last; ++i) {
        keys.push_back(prefix + std::to_string(i));
    }
    return keys;
}

} // namespace

class BoundedOrderedPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<BoundedOrderedPool>("fast", 3);
    }

    std::vector<Key> RegisterAll(const std::vector<Key>& keys) {
        std::vector<Key> evicted;
        for (const auto& key : keys) {
            auto batch = pool_->Register(key);
            evicted.insert(evicted.end(), batch.begin(), batch.end());
            EXPECT_LE(pool_->Size(), pool_->Capacity());
        }
        return evicted;
    }

    std::unique_ptr<BoundedOrderedPool> pool_;
};

TEST_F(BoundedOrderedPoolTest, RegisterWithinCapacityEvictsNothing) {
    EXPECT_THAT(RegisterAll({"a", "b", "c"}), IsEmpty());
    EXPECT_EQ(pool_->Size(), 3);
    EXPECT_THAT(pool_->Keys(), ElementsAre("a", "b", "c"));
}

TEST_F(BoundedOrderedPoolTest, OverflowEvictsOldestFirst) {
    RegisterAll({"a", "b", "c"});

    EXPECT_THAT(pool_->Register("d"), ElementsAre("a"));
    EXPECT_THAT(pool_->Register("e"), ElementsAre("b"));
    EXPECT_THAT(pool_->Keys(), ElementsAre("c", "d", "e"));
    EXPECT_FALSE(pool_->Contains("a"));
    EXPECT_TRUE(pool_->Contains("e"));
}

TEST_F(BoundedOrderedPoolTest, DuplicateRegisterDoesNotRefreshAge) {
    RegisterAll({"a", "b", "c"});

    EXPECT_THAT(pool_->Register("a"), IsEmpty());
    EXPECT_THAT(pool_->Keys(), ElementsAre("a", "b", "c"));

    // "a" is still the oldest
    EXPECT_THAT(pool_->Register("d"), ElementsAre("a"));
}

TEST_F(BoundedOrderedPoolTest, ZeroCapacityEvictsNewKeyImmediately) {
    BoundedOrderedPool pool("slow", 0);
    EXPECT_THAT(pool.Register("x"), ElementsAre("x"));
    EXPECT_EQ(pool.Size(), 0);
    EXPECT_FALSE(pool.Contains("x"));
}

TEST_F(BoundedOrderedPoolTest, ShrinkingCapacityTrimsOldest) {
    pool_->SetCapacity(10);
    RegisterAll(MakeKeys("k", 1, 6));

    EXPECT_THAT(pool_->SetCapacity(2), ElementsAre("k1", "k2", "k3", "k4"));
    EXPECT_THAT(pool_->Keys(), ElementsAre("k5", "k6"));
    EXPECT_EQ(pool_->Capacity(), 2);
}

TEST_F(BoundedOrderedPoolTest, GrowingCapacityAddsNothing) {
    RegisterAll({"a", "b"});
    EXPECT_THAT(pool_->SetCapacity(50), IsEmpty());
    EXPECT_EQ(pool_->Size(), 2);
}

TEST_F(BoundedOrderedPoolTest, FilterToKeepsAllowedInPoolOrder) {
    pool_->SetCapacity(10);
    RegisterAll(MakeKeys("k", 1, 6));

    auto evicted = pool_->FilterTo({"k5", "k2", "missing"});

    EXPECT_THAT(evicted, ElementsAre("k1", "k3", "k4", "k6"));
    EXPECT_THAT(pool_->Keys(), ElementsAre("k2", "k5"));
    EXPECT_FALSE(pool_->Contains("missing"));
}

TEST_F(BoundedOrderedPoolTest, FilterToEmptySetDropsEverything) {
    RegisterAll({"a", "b"});
    EXPECT_THAT(pool_->FilterTo({}), ElementsAre("a", "b"));
    EXPECT_EQ(pool_->Size(), 0);
}

TEST_F(BoundedOrderedPoolTest, RemoveIsSilentAndKeepsOrder) {
    RegisterAll({"a", "b", "c"});

    EXPECT_TRUE(pool_->Remove("b"));
    EXPECT_FALSE(pool_->Remove("b"));
    EXPECT_THAT(pool_->Keys(), ElementsAre("a", "c"));

    // Freed slot admits a new key without eviction
    EXPECT_THAT(pool_->Register("d"), IsEmpty());
    EXPECT_THAT(pool_->Keys(), ElementsAre("a", "c", "d"));
}

TEST_F(BoundedOrderedPoolTest, ClearKeepsCapacity) {
    RegisterAll({"a", "b"});
    pool_->Clear();
    EXPECT_EQ(pool_->Size(), 0);
    EXPECT_EQ(pool_->Capacity(), 3);
    EXPECT_THAT(pool_->Register("a"), IsEmpty());
}

TEST_F(BoundedOrderedPoolTest, SurvivorsKeepRelativeOrderUnderChurn) {
    pool_->SetCapacity(5);
    auto evicted = RegisterAll(MakeKeys("k", 1, 12));

    EXPECT_THAT(evicted, ElementsAre("k1", "k2", "k3", "k4", "k5", "k6", "k7"));
    EXPECT_THAT(pool_->Keys(), ElementsAre("k8", "k9", "k10", "k11", "k12"));
}
