/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

// qmgr headers
#include "qmgr/pool.hpp"

// qmgr test helpers
#include "fakes/temp_dir.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <vector>

namespace qmgr::test {

using ::testing::ElementsAre;

// One worker held on a gate job so the queue can be filled deterministically.
class PoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateOpen = gate.get_future().share();
        ASSERT_TRUE(pool.start([this](const JobId& id, int) {
            if (id == "gate") {
                gateOpen.wait();
                return;
            }
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(id);
        }));
        ASSERT_TRUE(pool.submit("gate", 0));
        ASSERT_TRUE(eventually([this] { return pool.busyCount() == 1; }));
    }

    void TearDown() override {
        openGate();
        pool.stop();
    }

    void openGate() {
        if (!gateReleased) {
            gate.set_value();
            gateReleased = true;
        }
    }

    std::vector<JobId> ran() {
        std::lock_guard<std::mutex> lock(mutex);
        return order;
    }

    Pool pool{1};
    std::promise<void> gate;
    std::shared_future<void> gateOpen;
    bool gateReleased = false;

    std::mutex mutex;
    std::vector<JobId> order;
};

TEST_F(PoolTest, runsInEnqueueOrderWithIdTieBreak) {
    ASSERT_TRUE(pool.submit("c", 30));
    ASSERT_TRUE(pool.submit("b", 20));
    ASSERT_TRUE(pool.submit("a", 20));
    EXPECT_EQ(pool.queueSize(), 3u);

    openGate();
    ASSERT_TRUE(eventually([this] { return ran().size() == 3; }));
    EXPECT_THAT(ran(), ElementsAre("a", "b", "c"));
}

TEST_F(PoolTest, sameIdIsQueuedOnce) {
    ASSERT_TRUE(pool.submit("a", 10));
    EXPECT_FALSE(pool.submit("a", 11));
    EXPECT_EQ(pool.queueSize(), 1u);
}

TEST_F(PoolTest, removeTakesJobOutOfQueue) {
    ASSERT_TRUE(pool.submit("a", 10));
    ASSERT_TRUE(pool.submit("b", 11));

    EXPECT_TRUE(pool.remove("a"));
    EXPECT_FALSE(pool.remove("a"));
    EXPECT_FALSE(pool.remove("gate"));

    openGate();
    ASSERT_TRUE(eventually([this] { return ran().size() == 1; }));
    EXPECT_THAT(ran(), ElementsAre("b"));
}

TEST_F(PoolTest, closedPoolRefusesWork) {
    pool.close();
    EXPECT_FALSE(pool.isRunning());
    EXPECT_FALSE(pool.submit("late", 50));
}

TEST_F(PoolTest, stopDropsQueuedJobs) {
    ASSERT_TRUE(pool.submit("a", 10));
    openGate();
    pool.stop();
    EXPECT_EQ(pool.queueSize(), 0u);
    EXPECT_EQ(pool.busyCount(), 0);
}

TEST(pool_tests, rejectsInvalidConfiguration) {
    Pool empty(0);
    EXPECT_FALSE(empty.start([](const JobId&, int) {}));

    Pool noHandler(2);
    EXPECT_FALSE(noHandler.start(JobHandler{}));
}

TEST(pool_tests, workersRunConcurrently) {
    Pool pool(3);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    std::atomic<int> done{0};

    ASSERT_TRUE(pool.start([&](const JobId&, int) {
        int now = ++inside;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        --inside;
        ++done;
    }));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(pool.submit("job-" + std::to_string(i), i));
    }

    ASSERT_TRUE(eventually([&] { return done.load() == 3; }));
    EXPECT_EQ(peak.load(), 3);
    pool.stop();
}

}
