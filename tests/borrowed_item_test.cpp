#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <utility>

#include "lazypool/pool_factory.hpp"

using namespace lazypool;

/**
 * @brief Single-slot pool whose values record their generation number
 */
class BorrowedItemTest : public ::testing::Test {
  protected:
    struct Session {
        int generation;
    };

    void SetUp() override {
        auto created =
            make_pool<Session>([this] { return Session{generated_.fetch_add(1) + 1}; }, 1);
        ASSERT_TRUE(created.is_ok());
        pool_ = std::move(created).value();
    }

    std::atomic<int> generated_{0};
    std::shared_ptr<Pool<Session>> pool_;
};

TEST_F(BorrowedItemTest, DiscardReplacesTheSlotOnReturn) {
    auto item = pool_->checkout();
    const Session* original = &item.get();
    EXPECT_EQ(original->generation, 1);
    EXPECT_EQ(generated_.load(), 1);

    item.discard();
    item.return_to_pool();

    // The replacement is queued but not generated yet
    EXPECT_EQ(pool_->available(), 1u);
    EXPECT_EQ(generated_.load(), 1);

    auto next = pool_->checkout();
    EXPECT_EQ(generated_.load(), 1);
    EXPECT_EQ(next->generation, 2);
    EXPECT_EQ(generated_.load(), 2);
    EXPECT_EQ(pool_->stats().total_generated, 2u);
}

TEST_F(BorrowedItemTest, GetAfterDiscardStillSeesOldValue) {
    auto item = pool_->checkout();
    const Session* before = &item.get();

    item.discard();
    EXPECT_TRUE(item.is_discarded());
    EXPECT_EQ(&item.get(), before);
    EXPECT_EQ(item->generation, 1);
    EXPECT_EQ(generated_.load(), 1);
}

TEST_F(BorrowedItemTest, DiscardIsIdempotent) {
    {
        auto item = pool_->checkout();
        (void)item.get();
        item.discard();
        item.discard();
    }

    EXPECT_EQ(pool_->available(), 1u);
    EXPECT_EQ(pool_->checkout()->generation, 2);
}

TEST_F(BorrowedItemTest, DiscardBeforeFirstReadGeneratesNothing) {
    {
        auto item = pool_->checkout();
        item.discard();
    }

    EXPECT_EQ(generated_.load(), 0);
    EXPECT_EQ(pool_->checkout()->generation, 1);
}

TEST_F(BorrowedItemTest, DiscardDestroysTheOldValue) {
    struct Tracked {
        std::shared_ptr<int> token;
    };
    auto witness = std::make_shared<int>(0);
    auto created = make_pool<Tracked>([witness] { return Tracked{witness}; }, 1);
    ASSERT_TRUE(created.is_ok());
    auto pool = std::move(created).value();

    auto item = pool->checkout();
    (void)item.get();
    // witness, the generator's copy, and the cached value
    EXPECT_EQ(witness.use_count(), 3);

    item.discard();
    item.return_to_pool();
    EXPECT_EQ(witness.use_count(), 2);
}

TEST_F(BorrowedItemTest, UseAfterReturnThrows) {
    auto item = pool_->checkout();
    (void)item.get();
    item.return_to_pool();

    EXPECT_FALSE(item.is_held());
    EXPECT_THROW((void)item.get(), std::logic_error);
    EXPECT_THROW(item.discard(), std::logic_error);
    EXPECT_THROW(item.return_to_pool(), std::logic_error);
    EXPECT_EQ(pool_->available(), 1u);
}

TEST_F(BorrowedItemTest, MoveTransfersOwnership) {
    auto item = pool_->checkout();
    item.discard();

    auto moved = std::move(item);
    EXPECT_TRUE(moved.is_held());
    EXPECT_TRUE(moved.is_discarded());
    EXPECT_THROW((void)item.get(), std::logic_error);
    EXPECT_EQ(pool_->available(), 0u);

    moved.return_to_pool();
    EXPECT_EQ(pool_->available(), 1u);
}

TEST_F(BorrowedItemTest, MoveAssignmentReturnsTheOverwrittenItem) {
    auto created = make_pool<int>([] { return 5; }, 2);
    ASSERT_TRUE(created.is_ok());
    auto pool = std::move(created).value();

    auto first = pool->checkout();
    auto second = pool->checkout();
    EXPECT_EQ(pool->available(), 0u);

    first = std::move(second);
    EXPECT_EQ(pool->available(), 1u);
    EXPECT_EQ(*first, 5);
}
