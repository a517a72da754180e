/**
 * @file TimingTests.cpp
 *
 * This module contains the unit tests of the Swim::Timing class and the
 * Swim::SteadyClock class.
 *
 * © 2018-2020 by Richard Walters
 */

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <Swim/Timing.hpp>
#include <thread>

namespace {

    struct FixedClock
        : public Timekeeping::Clock
    {
        double currentTime = 0.0;

        virtual double GetCurrentTime() override {
            return currentTime;
        }
    };

}

TEST(TimingTests, PeriodsComeFromConfiguration) {
    // Arrange
    Swim::IServer::ServerConfiguration configuration;
    configuration.protocolPeriod = 2.0;
    configuration.pingTimeout = 0.25;
    configuration.gossipInterval = 0.5;
    const auto clock = std::make_shared< FixedClock >();

    // Act
    Swim::Timing timing(configuration, clock);

    // Assert
    EXPECT_DOUBLE_EQ(2.0, timing.GetProtocolPeriod());
    EXPECT_DOUBLE_EQ(0.25, timing.GetPingTimeout());
    EXPECT_DOUBLE_EQ(0.5, timing.GetGossipInterval());
}

TEST(TimingTests, NextBoundariesAreRelativeToNow) {
    // Arrange
    Swim::IServer::ServerConfiguration configuration;
    configuration.protocolPeriod = 2.0;
    configuration.pingTimeout = 0.25;
    configuration.gossipInterval = 0.5;
    const auto clock = std::make_shared< FixedClock >();
    clock->currentTime = 10.0;
    Swim::Timing timing(configuration, clock);

    // Act
    const auto nextProtocolPeriod = timing.NextProtocolPeriod();
    const auto nextPingTimeout = timing.NextPingTimeout();
    const auto nextGossipRound = timing.NextGossipRound();

    // Assert
    EXPECT_DOUBLE_EQ(12.0, nextProtocolPeriod);
    EXPECT_DOUBLE_EQ(10.25, nextPingTimeout);
    EXPECT_DOUBLE_EQ(10.5, nextGossipRound);
}

TEST(TimingTests, HasPassed) {
    // Arrange
    Swim::IServer::ServerConfiguration configuration;
    configuration.protocolPeriod = 1.0;
    const auto clock = std::make_shared< FixedClock >();
    Swim::Timing timing(configuration, clock);
    const auto boundary = timing.NextProtocolPeriod();

    // Act
    const auto passedBefore = timing.HasPassed(boundary);
    clock->currentTime = 0.999;
    const auto passedJustBefore = timing.HasPassed(boundary);
    clock->currentTime = 1.0;
    const auto passedAt = timing.HasPassed(boundary);

    // Assert
    EXPECT_FALSE(passedBefore);
    EXPECT_FALSE(passedJustBefore);
    EXPECT_TRUE(passedAt);
}

TEST(TimingTests, SteadyClockIsMonotonic) {
    // Arrange
    Swim::SteadyClock clock;

    // Act
    const auto before = clock.GetCurrentTime();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    const auto after = clock.GetCurrentTime();

    // Assert
    EXPECT_GE(after - before, 0.009);
}
