#include "test_inventory.hpp"

#include <vendcore/machine_controller.hpp>
#include <vendcore/protocol.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <new>

// Global allocator with a one-shot failure: when armed with n, the allocation
// after n successful ones throws std::bad_alloc and the counter disarms.
namespace {
std::atomic<long> allocations_until_failure{-1};
}

void* operator new(std::size_t size) {
    if (allocations_until_failure.load() >= 0 && allocations_until_failure.fetch_sub(1) == 0) {
        throw std::bad_alloc();
    }
    if (void* memory = std::malloc(size == 0 ? 1 : size)) {
        return memory;
    }
    throw std::bad_alloc();
}

void operator delete(void* memory) noexcept {
    std::free(memory);
}

void operator delete(void* memory, std::size_t) noexcept {
    std::free(memory);
}

using namespace vendcore;
using vendcore::test::make_inventory;
using vendcore::test::stock_of;

class AllocationFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::warn);
    }

    void TearDown() override {
        allocations_until_failure = -1;
    }

    // Leaves cola selected with 1620 inserted and exactly 64 log entries, so
    // the next command has to grow the log.
    static void prepare_full_log(MachineController& machine) {
        for (int i = 0; i < 62; ++i) {
            machine.insert_coin(10);
        }
        machine.insert_coin(1000);
        machine.select_product("cola");
    }

    static json snapshot(const MachineController& machine) {
        return json{{"status", machine.status()}, {"history", machine.recent_transactions(1000)}};
    }
};

TEST_F(AllocationFailureTest, LogGrowthFailureAbortsCommand) {
    MachineController machine{make_inventory(), "alloc"};
    prepare_full_log(machine);
    auto before = snapshot(machine);
    ASSERT_EQ(before["history"].size(), 64u);

    bool thrown = false;
    allocations_until_failure = 0;
    try {
        machine.insert_coin(5);
    } catch (const std::bad_alloc&) {
        thrown = true;
    }
    allocations_until_failure = -1;

    EXPECT_TRUE(thrown);
    EXPECT_EQ(snapshot(machine), before);
    EXPECT_EQ(machine.state(), MachineState::ProductSelected);
    EXPECT_EQ(machine.balance(), 1620);
}

TEST_F(AllocationFailureTest, EveryFailingAllocationInDispenseLeavesNoTrace) {
    int failures = 0;
    bool completed = false;

    for (long n = 0; n < 1000 && !completed; ++n) {
        MachineController machine{make_inventory(), "alloc"};
        prepare_full_log(machine);
        auto before = snapshot(machine);

        bool thrown = false;
        allocations_until_failure = n;
        try {
            machine.dispense();
        } catch (const std::bad_alloc&) {
            thrown = true;
        }
        allocations_until_failure = -1;

        if (thrown) {
            ++failures;
            EXPECT_EQ(snapshot(machine), before) << "allocation " << n << " left partial effects";
            EXPECT_EQ(machine.state(), MachineState::ProductSelected);
            continue;
        }

        completed = true;
        auto status = machine.status();
        EXPECT_EQ(status.state, MachineState::Ready);
        EXPECT_EQ(status.balance, 0);
        EXPECT_EQ(stock_of(status.inventory, "cola"), 4);
        EXPECT_EQ(machine.recent_transactions(1000).size(), 65u);
    }

    EXPECT_TRUE(completed);
    EXPECT_GT(failures, 0);
}
