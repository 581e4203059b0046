// File: tests/performance/weight_vector_pool_test.cpp
#include "performance/weight_vector_pool.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace resonance;

class WeightVectorPoolTest : public ::testing::Test {
protected:
    WeightVectorPool pool_{8, 4};
};

TEST_F(WeightVectorPoolTest, InvalidConstructionRejected) {
    EXPECT_THROW(WeightVectorPool pool(0, 4), std::invalid_argument);
    EXPECT_THROW(WeightVectorPool pool(8, 0), std::invalid_argument);
}

TEST_F(WeightVectorPoolTest, RentAllocatesWhenEmpty) {
    WeightVector buffer = pool_.Rent();
    EXPECT_EQ(8u, buffer.size());
    EXPECT_EQ(1u, pool_.GetStats().allocations);
    EXPECT_EQ(0u, pool_.GetStats().reuses);
}

TEST_F(WeightVectorPoolTest, ReturnedBuffersAreReused) {
    for (int i = 0; i < 3; ++i) {
        pool_.ReturnBuffer(pool_.Rent());
    }
    // First rent allocated; the rest were served from the pool
    auto stats = pool_.GetStats();
    EXPECT_EQ(1u, stats.allocations);
    EXPECT_EQ(2u, stats.reuses);
    EXPECT_EQ(3u, stats.returns);
    EXPECT_EQ(1u, stats.available);
}

TEST_F(WeightVectorPoolTest, NoAllocationsAfterWarmup) {
    WeightVector a = pool_.Rent();
    WeightVector b = pool_.Rent();
    pool_.ReturnBuffer(std::move(a));
    pool_.ReturnBuffer(std::move(b));
    const uint64_t warm = pool_.GetStats().allocations;

    for (int i = 0; i < 100; ++i) {
        WeightVector x = pool_.Rent();
        WeightVector y = pool_.Rent();
        pool_.ReturnBuffer(std::move(y));
        pool_.ReturnBuffer(std::move(x));
    }
    EXPECT_EQ(warm, pool_.GetStats().allocations);
}

TEST_F(WeightVectorPoolTest, WrongDimensionRejected) {
    EXPECT_THROW(pool_.ReturnBuffer(WeightVector(3)), std::invalid_argument);
    EXPECT_EQ(0u, pool_.Available());
}

TEST_F(WeightVectorPoolTest, FullPoolDropsBuffer) {
    for (int i = 0; i < 5; ++i) {
        pool_.ReturnBuffer(WeightVector(8));
    }
    auto stats = pool_.GetStats();
    EXPECT_EQ(4u, stats.available);
    EXPECT_EQ(4u, stats.returns);
    EXPECT_EQ(1u, stats.drops);
}

TEST_F(WeightVectorPoolTest, RentZeroedClearsStaleContents) {
    WeightVector buffer = pool_.Rent();
    buffer.assign(8, 0.7);
    pool_.ReturnBuffer(std::move(buffer));

    WeightVector zeroed = pool_.RentZeroed();
    for (double v : zeroed) {
        EXPECT_DOUBLE_EQ(0.0, v);
    }
}

TEST_F(WeightVectorPoolTest, PrewarmIsBounded) {
    EXPECT_EQ(3u, pool_.Prewarm(3));
    EXPECT_EQ(1u, pool_.Prewarm(10));
    EXPECT_EQ(4u, pool_.Available());
    EXPECT_EQ(4u, pool_.GetStats().allocations);
}

TEST_F(WeightVectorPoolTest, LeaseReturnsOnDestruction) {
    {
        auto lease = pool_.RentLease();
        lease.Get()[0] = 1.0;
        EXPECT_EQ(0u, pool_.Available());
    }
    EXPECT_EQ(1u, pool_.Available());
}

TEST_F(WeightVectorPoolTest, ReleasedLeaseIsNotReturned) {
    WeightVector kept;
    {
        auto lease = pool_.RentLease();
        kept = lease.Release();
    }
    EXPECT_EQ(8u, kept.size());
    EXPECT_EQ(0u, pool_.Available());
}

TEST_F(WeightVectorPoolTest, ClearEmptiesPool) {
    pool_.Prewarm(4);
    pool_.Clear();
    EXPECT_EQ(0u, pool_.Available());
}
