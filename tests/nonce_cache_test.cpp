/*
 * Part of the MacAuth (MA) project.
 *
 * SPDX-FileCopyrightText: 2025 MacAuth contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of MacAuth (MA). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "macauth/nonce_cache.hpp"

using namespace std::chrono_literals;

namespace {

using macauth::NonceCache;
using Clock = NonceCache::clock;

TEST(NonceCache, DefaultTimeoutIsOneMinute) {
    NonceCache nc;
    EXPECT_EQ(nc.nonce_ttl(), NonceCache::duration(60s));
    EXPECT_EQ(nc.id_ttl(), NonceCache::duration(60s));
    EXPECT_FALSE(nc.max_size().has_value());
}

TEST(NonceCache, IdTimeoutDefaultsToNonceTimeout) {
    NonceCache nc(5s);
    EXPECT_EQ(nc.id_ttl(), NonceCache::duration(5s));
    NonceCache nc2(5s, 30s);
    EXPECT_EQ(nc2.id_ttl(), NonceCache::duration(30s));
}

TEST(NonceCache, SecondUseOfNonceIsRejected) {
    NonceCache nc;
    EXPECT_EQ(nc.len(), 0u);
    EXPECT_TRUE(nc.check_nonce("id", Clock::now(), "abc"));
    EXPECT_EQ(nc.len(), 1u);
    EXPECT_FALSE(nc.check_nonce("id", Clock::now(), "abc"));
    EXPECT_TRUE(nc.check_nonce("id", Clock::now(), "xyz"));
    EXPECT_EQ(nc.len(), 2u);
}

TEST(NonceCache, NoncesAreTrackedPerId) {
    NonceCache nc;
    EXPECT_TRUE(nc.check_nonce("alice", Clock::now(), "abc"));
    EXPECT_TRUE(nc.check_nonce("bob", Clock::now(), "abc"));
    EXPECT_FALSE(nc.check_nonce("bob", Clock::now(), "abc"));
    EXPECT_EQ(nc.len(), 2u);
}

TEST(NonceCache, RejectsTimestampsOutsideWindow) {
    NonceCache nc(60s);
    ASSERT_TRUE(nc.check_nonce("id", Clock::now(), "first"));
    EXPECT_FALSE(nc.check_nonce("id", Clock::now() - 1000s, "past"));
    EXPECT_FALSE(nc.check_nonce("id", Clock::now() + 1000s, "future"));
    EXPECT_FALSE(nc.check_nonce("id", Clock::now() - 61s, "past2"));
    EXPECT_FALSE(nc.check_nonce("id", Clock::now() + 61s, "future2"));
    // Rejected before the nonce store was touched.
    EXPECT_EQ(nc.len(), 1u);
}

TEST(NonceCache, AcceptsTimestampsJustInsideWindow) {
    NonceCache nc(60s);
    ASSERT_TRUE(nc.check_nonce("id", Clock::now(), "first"));
    EXPECT_TRUE(nc.check_nonce("id", Clock::now() - 55s, "past"));
    EXPECT_TRUE(nc.check_nonce("id", Clock::now() + 55s, "future"));
}

TEST(NonceCache, TimestampsAtClockLimitsAreRejected) {
    NonceCache nc(60s);
    ASSERT_TRUE(nc.check_nonce("id", Clock::now(), "first"));
    EXPECT_FALSE(nc.check_nonce("id", NonceCache::time_point::max(), "max"));
    EXPECT_FALSE(nc.check_nonce("id", NonceCache::time_point::min(), "min"));
    EXPECT_EQ(nc.len(), 1u);
}

TEST(NonceCache, LargeSkewDoesNotWrapAround) {
    NonceCache nc(60s);
    // Skew of roughly now - 1970, then a timestamp at the far end of the clock.
    ASSERT_TRUE(nc.check_nonce("epoch", NonceCache::time_point{}, "a"));
    EXPECT_FALSE(nc.check_nonce("epoch", NonceCache::time_point::max(), "b"));
    EXPECT_TRUE(nc.check_nonce("epoch", NonceCache::time_point{} + 10s, "c"));
}

TEST(NonceCache, UnrepresentableSkewIsRejected) {
    NonceCache nc(60s);
    EXPECT_FALSE(nc.check_nonce("ancient", NonceCache::time_point::min(), "a"));
    EXPECT_EQ(nc.len(), 0u);
}

class NonceCacheSkew : public ::testing::TestWithParam<int> {};

TEST_P(NonceCacheSkew, SteadyClockOffsetIsTolerated) {
    const auto offset = std::chrono::seconds(GetParam());
    NonceCache nc(60s);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(nc.check_nonce("client", Clock::now() + offset, "n" + std::to_string(i)));
    }
    // Same client, but a request stamped well before its own "now".
    EXPECT_FALSE(nc.check_nonce("client", Clock::now() + offset - 100s, "late"));
    EXPECT_FALSE(nc.check_nonce("client", Clock::now() + offset, "n0"));
}

INSTANTIATE_TEST_SUITE_P(Offsets, NonceCacheSkew, ::testing::Values(7, -13, 1000, -1000));

TEST(NonceCache, SkewIsRemeasuredAfterIdExpires) {
    NonceCache nc(60s, 200ms);
    ASSERT_TRUE(nc.check_nonce("client", Clock::now() + 1000s, "a"));
    // Client fixed its clock, but the old skew still applies.
    EXPECT_FALSE(nc.check_nonce("client", Clock::now(), "b"));
    std::this_thread::sleep_for(300ms);
    EXPECT_TRUE(nc.check_nonce("client", Clock::now(), "b"));
}

TEST(NonceCache, NonceBecomesFreshAgainAfterTtl) {
    NonceCache nc(200ms, 10s);
    ASSERT_TRUE(nc.check_nonce("id", Clock::now(), "abc"));
    EXPECT_FALSE(nc.check_nonce("id", Clock::now(), "abc"));
    std::this_thread::sleep_for(250ms);
    EXPECT_TRUE(nc.check_nonce("id", Clock::now(), "abc"));
}

TEST(NonceCache, LenCountsOnlyLiveNonces) {
    NonceCache nc(200ms, 10s);
    ASSERT_TRUE(nc.check_nonce("a", Clock::now(), "1"));
    ASSERT_TRUE(nc.check_nonce("a", Clock::now(), "2"));
    ASSERT_TRUE(nc.check_nonce("b", Clock::now(), "1"));
    EXPECT_EQ(nc.len(), 3u);
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(nc.len(), 0u);
}

TEST(NonceCache, MaxSizeBoundsNoncesPerId) {
    NonceCache nc(60s, std::nullopt, 3);
    const auto base = Clock::now();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(nc.check_nonce("id", base + std::chrono::milliseconds(i),
                                   "n" + std::to_string(i)));
    }
    EXPECT_EQ(nc.len(), 3u);
    // Evicted before expiry: the oldest nonce is accepted again.
    EXPECT_TRUE(nc.check_nonce("id", base, "n0"));
    EXPECT_FALSE(nc.check_nonce("id", base, "n4"));
}

TEST(NonceCache, ConcurrentReplaysHaveOneWinner) {
    NonceCache nc;
    const auto ts = Clock::now();
    std::atomic<int> fresh{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            if (nc.check_nonce("id", ts, "same")) ++fresh;
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(fresh.load(), 1);
    EXPECT_EQ(nc.len(), 1u);
}

TEST(NonceCache, ConcurrentFirstRequestsShareOneIdEntry) {
    NonceCache nc;
    std::atomic<int> fresh{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            if (nc.check_nonce("newcomer", Clock::now(), "n" + std::to_string(t))) ++fresh;
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(fresh.load(), 8);
    EXPECT_EQ(nc.len(), 8u);
}

} // namespace
