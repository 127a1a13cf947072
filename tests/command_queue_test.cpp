#include "test_inventory.hpp"

#include <vendcore/command_queue.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace vendcore;
using vendcore::test::make_inventory;

class CommandQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::warn);
    }

    MachineController machine{make_inventory(), "queue"};
    CommandQueue queue{machine};
};

TEST_F(CommandQueueTest, ExecutesInSubmissionOrder) {
    queue.start();

    auto coin = queue.submit({{"command", "insert_coin"}, {"amount", 1000}});
    auto select = queue.submit({{"command", "select_product"}, {"product", "cola"}});
    auto vend = queue.submit({{"command", "dispense"}});

    EXPECT_TRUE(coin.get().ok);
    EXPECT_TRUE(select.get().ok);
    auto receipt = vend.get();
    ASSERT_TRUE(receipt.ok);
    EXPECT_EQ(receipt.result["change"], 0);
    EXPECT_EQ(machine.state(), MachineState::Ready);
}

TEST_F(CommandQueueTest, RejectionsComeBackAsResponses) {
    queue.start();

    auto response = queue.submit({{"command", "dispense"}}).get();

    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.error, "invalid_command_for_state");
}

TEST_F(CommandQueueTest, RequestsQueuedBeforeStartRunOnceStarted) {
    auto pending = queue.submit({{"command", "insert_coin"}, {"amount", 50}});
    EXPECT_EQ(queue.pending(), 1u);
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);

    queue.start();

    EXPECT_EQ(pending.get().result["balance"], 50);
    EXPECT_EQ(queue.pending(), 0u);
}

TEST_F(CommandQueueTest, StopDrainsQueuedRequests) {
    queue.start();
    std::vector<std::future<Response>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(queue.submit({{"command", "insert_coin"}, {"amount", 2}}));
    }

    queue.stop();

    for (auto& future : futures) {
        EXPECT_TRUE(future.get().ok);
    }
    EXPECT_EQ(machine.balance(), 100);
    EXPECT_FALSE(queue.is_running());
}

TEST_F(CommandQueueTest, ManyProducersOneConsumer) {
    queue.start();

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([this]() {
            for (int i = 0; i < 25; ++i) {
                EXPECT_TRUE(queue.submit({{"command", "insert_coin"}, {"amount", 10}}).get().ok);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(machine.balance(), 1000);
    auto refund = queue.submit({{"command", "refund"}}).get();
    EXPECT_EQ(refund.result["returned"], 1000);
}

TEST_F(CommandQueueTest, SubmitAfterStopFailsImmediately) {
    queue.start();
    queue.stop();

    auto late = queue.submit({{"command", "insert_coin"}, {"amount", 100}});

    ASSERT_EQ(late.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
    EXPECT_THROW(late.get(), QueueStoppedError);
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_EQ(machine.balance(), 0);

    queue.start();
    EXPECT_TRUE(queue.submit({{"command", "insert_coin"}, {"amount", 100}}).get().ok);
}
