/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the worker pool adapters
 */

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

namespace kcenon::storage_transfer::test {

using adapters::pool_lane;

class ThreadPoolAdapterTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        if (GetParam()) {
            pool_ = adapters::transfer_pool_factory::create(2, "test_pool");
        } else {
            pool_ = std::make_shared<adapters::async_transfer_pool>();
        }
        ASSERT_NE(pool_, nullptr);
    }

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
};

TEST_P(ThreadPoolAdapterTest, RunsSubmittedTasks) {
    std::atomic<int> ran{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool_->submit([&ran] { ++ran; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(ran.load(), 8);
    EXPECT_TRUE(pool_->is_running());
    EXPECT_GT(pool_->worker_count(), 0u);
}

TEST_P(ThreadPoolAdapterTest, LaneCountsTrackOutstandingTasks) {
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::promise<void> started;

    auto task = pool_->submit_to_lane(
        [opened, &started] {
            started.set_value();
            opened.wait();
        },
        pool_lane::url_refresh);

    started.get_future().wait();
    EXPECT_EQ(pool_->pending_tasks(pool_lane::url_refresh), 1u);
    EXPECT_EQ(pool_->pending_tasks(pool_lane::upload), 0u);
    EXPECT_GE(pool_->pending_tasks(), 1u);

    gate.set_value();
    task.get();
    EXPECT_EQ(pool_->pending_tasks(pool_lane::url_refresh), 0u);
}

TEST_P(ThreadPoolAdapterTest, ExceptionsReachTheFuture) {
    auto task = pool_->submit_to_lane([] { throw std::runtime_error("boom"); },
                                      pool_lane::upload);
    EXPECT_THROW(task.get(), std::runtime_error);
    EXPECT_EQ(pool_->pending_tasks(pool_lane::upload), 0u);
}

INSTANTIATE_TEST_SUITE_P(Backends, ThreadPoolAdapterTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? "FactoryChoice" : "AsyncFallback";
                         });

TEST(LaneCounterTest, NeverGoesNegative) {
    adapters::lane_counter counter;
    counter.leave("upload");
    EXPECT_EQ(counter.total(), 0u);

    counter.enter("upload");
    counter.enter("batch");
    EXPECT_EQ(counter.count("upload"), 1u);
    EXPECT_EQ(counter.total(), 2u);

    counter.leave("upload");
    counter.leave("upload");
    EXPECT_EQ(counter.count("upload"), 0u);
    EXPECT_EQ(counter.total(), 1u);
}

}  // namespace kcenon::storage_transfer::test
