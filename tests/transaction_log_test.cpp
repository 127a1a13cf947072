#include <vendcore/transaction_log.hpp>

#include <gtest/gtest.h>

using namespace vendcore;

namespace {

TransactionLogEntry entry(Amount amount) {
    TransactionLogEntry e;
    e.timestamp = std::chrono::system_clock::now();
    e.command = CommandKind::InsertCoin;
    e.resulting_state = MachineState::CoinInserted;
    e.amount = amount;
    e.detail = "amount=" + std::to_string(amount);
    return e;
}

} // namespace

TEST(TransactionLogTest, StartsEmpty) {
    TransactionLog log;

    EXPECT_TRUE(log.empty());
    EXPECT_TRUE(log.query_recent(5).empty());
}

TEST(TransactionLogTest, QueryRecentReturnsNewestLast) {
    TransactionLog log;
    for (Amount amount = 1; amount <= 5; ++amount) {
        log.reserve_next();
        log.append(entry(amount));
    }

    auto recent = log.query_recent(3);

    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].amount, 3);
    EXPECT_EQ(recent[1].amount, 4);
    EXPECT_EQ(recent[2].amount, 5);
}

TEST(TransactionLogTest, QueryIsNonDestructive) {
    TransactionLog log;
    log.reserve_next();
    log.append(entry(10));
    log.reserve_next();
    log.append(entry(20));

    auto first = log.query_recent(10);
    auto second = log.query_recent(10);

    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(second.size(), 2u);
    EXPECT_EQ(log.size(), 2u);
    EXPECT_EQ(second[0].detail, "amount=10");
}

TEST(TransactionLogTest, QueryZeroReturnsNothing) {
    TransactionLog log;
    log.reserve_next();
    log.append(entry(10));

    EXPECT_TRUE(log.query_recent(0).empty());
}

TEST(TransactionLogTest, CommandNameFollowsKind) {
    auto e = entry(1);
    e.command = CommandKind::Dispense;

    EXPECT_STREQ(e.command_name(), "dispense");
}

TEST(TransactionLogTest, AppendAfterReserveKeepsCapacity) {
    TransactionLog log;
    for (Amount amount = 1; amount <= 200; ++amount) {
        log.reserve_next();
        auto reserved = log.capacity();
        ASSERT_GT(reserved, log.size());

        log.append(entry(amount));

        EXPECT_EQ(log.capacity(), reserved) << "append reallocated at entry " << amount;
    }
    EXPECT_EQ(log.size(), 200u);
}
