//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_backoff.cpp
// Purpose: Tests for ExponentialBackoff
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>

#include "mcpgw/Backoff.h"

using mcpgw::ExponentialBackoff;
using std::chrono::milliseconds;

TEST(ExponentialBackoffTest, GrowsGeometricallyUpToCeiling) {
    ExponentialBackoff b(ExponentialBackoff::Policy{100, 2.0, 1000});
    EXPECT_EQ(b.Next(), milliseconds(100));
    EXPECT_EQ(b.Next(), milliseconds(200));
    EXPECT_EQ(b.Next(), milliseconds(400));
    EXPECT_EQ(b.Next(), milliseconds(800));
    EXPECT_EQ(b.Next(), milliseconds(1000));
    EXPECT_EQ(b.Next(), milliseconds(1000));
    EXPECT_EQ(b.Attempts(), 6u);
}

TEST(ExponentialBackoffTest, NeverDecreasesOrExceedsCeilingOverLongOutage) {
    ExponentialBackoff b(ExponentialBackoff::Policy{5000, 2.0, 300000});
    milliseconds prev{0};
    for (int i = 0; i < 500; ++i) {
        auto d = b.Next();
        EXPECT_GE(d, prev);
        EXPECT_LE(d, milliseconds(300000));
        prev = d;
    }
    EXPECT_EQ(prev, milliseconds(300000));
}

TEST(ExponentialBackoffTest, PeekDoesNotAdvanceAndResetRestarts) {
    ExponentialBackoff b(ExponentialBackoff::Policy{50, 3.0, 10000});
    EXPECT_EQ(b.Peek(), milliseconds(50));
    EXPECT_EQ(b.Peek(), milliseconds(50));
    b.Next();
    b.Next();
    EXPECT_EQ(b.Peek(), milliseconds(450));
    b.Reset();
    EXPECT_EQ(b.Attempts(), 0u);
    EXPECT_EQ(b.Next(), milliseconds(50));
}

TEST(ExponentialBackoffTest, SanitizesInvalidPolicy) {
    ExponentialBackoff b(ExponentialBackoff::Policy{0, 0.5, 0});
    EXPECT_EQ(b.GetPolicy().initialMs, 1u);
    EXPECT_DOUBLE_EQ(b.GetPolicy().multiplier, 1.0);
    EXPECT_EQ(b.GetPolicy().maxMs, 1u);
    EXPECT_EQ(b.Next(), milliseconds(1));
    EXPECT_EQ(b.Next(), milliseconds(1));
}

TEST(ExponentialBackoffTest, DefaultPolicyStartsAtFiveSeconds) {
    ExponentialBackoff b;
    EXPECT_EQ(b.Next(), milliseconds(5000));
    EXPECT_EQ(b.Next(), milliseconds(10000));
}
