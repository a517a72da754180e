#pragma once

/**
 * @file Common.hpp
 *
 * This module declares the base fixture used to test the Swim::Server class.
 * The fixture is subclassed to test various aspects of the class, including:
 * - FailureDetection: probing members and escalating suspicion
 * - Gossip: spreading rumors among members
 * - Elections: selecting a leader for a service group
 *
 * © 2019-2020 by Richard Walters
 */

#include "../../../src/Message.hpp"

#include <condition_variable>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <string>
#include <Swim/Server.hpp>
#include <Timekeeping/Clock.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <utility>
#include <vector>

namespace ServerTests {

    /**
     * This is a fake time-keeper which is used to test the server.
     */
    struct MockTimeKeeper
        : public Timekeeping::Clock
    {
        // Properties

        double currentTime = 0.0;

        // Timekeeping::Clock

        virtual double GetCurrentTime() override;
    };

    /**
     * This holds a message the server asked to send.
     */
    struct MessageInfo {
        Swim::Member receiver;
        Swim::IServer::Channel channel = Swim::IServer::Channel::Swim;
        Swim::Message message;
    };

    struct Common
        : public ::testing::Test
    {
        // Properties

        std::vector< std::string > diagnosticMessages;
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;
        std::vector< Swim::Rumor::ElectionDetails > electionChanges;
        std::condition_variable eventReceived;
        Swim::IServer::EventsUnsubscribeDelegate eventsUnsubscribeDelegate;
        std::vector< std::pair< Swim::Member, Swim::Health > > healthChanges;
        std::vector< MessageInfo > messagesSent;
        std::shared_ptr< MockTimeKeeper > mockTimeKeeper = std::make_shared< MockTimeKeeper >();
        std::mutex mutex;
        std::vector< Swim::Member > peers;
        std::shared_ptr< Timekeeping::Scheduler > scheduler = std::make_shared< Timekeeping::Scheduler >();
        Swim::Server server;
        Swim::IServer::ServerConfiguration serverConfiguration;

        // Methods

        /**
         * Wait up to a second for the given condition to become true.
         * The condition is checked while holding the fixture mutex, each
         * time the server publishes an event.
         *
         * @param[in] condition
         *     This is the condition to wait for.
         *
         * @return
         *     An indication of whether or not the condition became true
         *     is returned.
         */
        bool AwaitCondition(std::function< bool() > condition);

        /**
         * Wait up to a second for the given server counter to reach the
         * given value.
         */
        bool AwaitCount(
            std::function< size_t() > counter,
            size_t count
        );

        bool AwaitMessagesSent(
            Swim::Message::Type type,
            size_t numMessages
        );
        std::vector< MessageInfo > MessagesSentOfType(Swim::Message::Type type);
        size_t NumMessagesSentOfType(Swim::Message::Type type);
        size_t GetStatistic(const std::string& name);
        Swim::Member MakePeer(size_t index);
        void AddPeers(
            size_t numPeers,
            Swim::Health health = Swim::Health::Alive
        );
        void MobilizeServer();
        void ReceiveMessage(const Swim::Message& message);
        void ReceiveGossip(
            const Swim::Member& from,
            const std::vector< Swim::Rumor >& rumors
        );
        void AdvanceTime(double seconds);
        bool AdvanceProtocolPeriods(size_t numPeriods);
        bool AdvanceGossipRounds(size_t numRounds);
        Swim::Rumor::ElectionDetails GetStoredElection(const std::string& serviceGroup);
        void SetServerDelegates();

        // ::testing::Test

        virtual void SetUp() override;
        virtual void TearDown() override;
    };

}
