#include <gtest/gtest.h>

#include "hough_ml/core/charge_table.hpp"
#include "hough_ml/core/errors.hpp"

#include <thread>
#include <vector>

using namespace hough_ml::core;

TEST(ChargeTableTest, KnownParticles) {
    ChargeTable table;
    EXPECT_DOUBLE_EQ(table.chargeFor(11), -1.0);
    EXPECT_DOUBLE_EQ(table.chargeFor(-11), 1.0);
    EXPECT_DOUBLE_EQ(table.chargeFor(211), 1.0);
    EXPECT_DOUBLE_EQ(table.chargeFor(2212), 1.0);
    EXPECT_DOUBLE_EQ(table.chargeFor(22), 0.0);
    EXPECT_NEAR(table.chargeFor(2), 2.0 / 3.0, 1e-12);
}

TEST(ChargeTableTest, NegativeIdFallsBackToAntiparticle) {
    ChargeTable table;
    table.registerCharge(4122, 1.0);
    EXPECT_DOUBLE_EQ(table.chargeFor(-4122), -1.0);
    EXPECT_TRUE(table.contains(-4122));
}

TEST(ChargeTableTest, UnknownIdUnderThrowPolicy) {
    ChargeTable table(UnknownChargePolicy::kThrow);
    EXPECT_FALSE(table.contains(999999));
    EXPECT_THROW(table.chargeFor(999999), LookupError);
    EXPECT_THROW(table.chargeFor(-999999), std::out_of_range);
}

TEST(ChargeTableTest, UnknownIdUnderDefaultPolicy) {
    ChargeTable table(UnknownChargePolicy::kUseDefault, 0.5);
    EXPECT_DOUBLE_EQ(table.chargeFor(999999), 0.5);
    EXPECT_DOUBLE_EQ(table.chargeFor(-999999), 0.5);
}

TEST(ChargeTableTest, ChargeOrNeverThrows) {
    ChargeTable table;
    EXPECT_DOUBLE_EQ(table.chargeOr(13, 7.0), -1.0);
    EXPECT_DOUBLE_EQ(table.chargeOr(999999, 7.0), 7.0);
}

TEST(ChargeTableTest, RegistrationOverridesLastWriteWins) {
    ChargeTable table;
    const std::size_t initial_size = table.size();

    table.registerCharge(211, 2.0);
    table.registerCharge(1000020040, 2.0);
    table.registerCharge(211, -5.0);

    EXPECT_DOUBLE_EQ(table.chargeFor(211), -5.0);
    EXPECT_DOUBLE_EQ(table.chargeFor(1000020040), 2.0);
    EXPECT_EQ(table.size(), initial_size + 1);

    auto registrations = table.registrations();
    ASSERT_EQ(registrations.size(), 3u);
    EXPECT_EQ(registrations[0], std::make_pair(211, 2.0));
    EXPECT_EQ(registrations[2], std::make_pair(211, -5.0));
}

TEST(ChargeTableTest, ConcurrentRegistrationAndLookup) {
    ChargeTable table;
    const int per_thread = 200;
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&table, t, per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                table.registerCharge(100000 + t * per_thread + i, 1.0);
                EXPECT_DOUBLE_EQ(table.chargeFor(11), -1.0);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(table.registrations().size(), 4u * per_thread);
    EXPECT_DOUBLE_EQ(table.chargeFor(100000 + 3 * per_thread + 7), 1.0);
}
