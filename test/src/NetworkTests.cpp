/**
 * @file NetworkTests.cpp
 *
 * This module contains tests which run several Swim::Server instances
 * together, connected by an in-process message switch, in real time.
 *
 * © 2019-2020 by Richard Walters
 */

#include "../../src/Message.hpp"

#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <stddef.h>
#include <string>
#include <StringExtensions/StringExtensions.hpp>
#include <Swim/Server.hpp>
#include <Swim/Timing.hpp>
#include <thread>
#include <Timekeeping/Scheduler.hpp>
#include <vector>

namespace {

    /**
     * This is how long to wait for the network to settle into an expected
     * state before giving up, in seconds.
     */
    constexpr double SETTLE_TIMEOUT = 10.0;

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct NetworkTests
    : public ::testing::Test
{
    // Properties

    std::shared_ptr< Timekeeping::Scheduler > scheduler = std::make_shared< Timekeeping::Scheduler >();
    std::vector< std::shared_ptr< Swim::Server > > servers;
    std::map< std::string, std::shared_ptr< Swim::Server > > serversById;
    std::vector< Swim::IServer::EventsUnsubscribeDelegate > eventsUnsubscribeDelegates;

    // Methods

    /**
     * Construct and mobilize the given number of servers.  Every server
     * after the first is seeded with the first one only.
     */
    void StartNetwork(size_t numServers) {
        Swim::IServer::ServerConfiguration serverConfiguration;
        serverConfiguration.protocolPeriod = 0.05;
        serverConfiguration.pingTimeout = 0.015;
        serverConfiguration.gossipInterval = 0.025;
        serverConfiguration.suspicionPeriods = 3;
        serverConfiguration.gossipFanout = 3;
        serverConfiguration.rumorHeatRounds = 3;
        serverConfiguration.antiEntropyRounds = 10;
        serverConfiguration.electionTimeoutRounds = 10;
        for (size_t i = 0; i < numServers; ++i) {
            const auto server = std::make_shared< Swim::Server >(
                StringExtensions::sprintf("node%zu", i)
            );
            servers.push_back(server);
            serversById[server->GetMemberId()] = server;
        }
        for (size_t i = 0; i < numServers; ++i) {
            const auto& server = servers[i];
            eventsUnsubscribeDelegates.push_back(
                server->SubscribeToEvents(
                    [this](const Swim::IServer::Event& baseEvent){
                        if (baseEvent.type != Swim::IServer::Event::Type::SendMessage) {
                            return;
                        }
                        const auto& event = static_cast< const Swim::IServer::SendMessageEvent& >(baseEvent);
                        const auto serversByIdEntry = serversById.find(event.receiver.id);
                        if (serversByIdEntry == serversById.end()) {
                            return;
                        }
                        serversByIdEntry->second->ReceiveMessage(event.serializedMessage);
                    }
                )
            );
            serverConfiguration.address = StringExtensions::sprintf("10.0.0.%zu", i + 1);
            serverConfiguration.swimPort = 9638;
            serverConfiguration.gossipPort = 9639;
            server->Mobilize(scheduler, serverConfiguration);
        }
        const auto seed = servers[0]->GetSelf();
        for (size_t i = 1; i < numServers; ++i) {
            (void)servers[i]->InsertMember(seed, Swim::Health::Alive);
        }
    }

    /**
     * Poll the given condition until it holds or the network had plenty
     * of time to settle.
     */
    bool AwaitUntil(std::function< bool() > condition) {
        const auto deadline = (
            std::chrono::steady_clock::now()
            + std::chrono::milliseconds((int)(SETTLE_TIMEOUT * 1000.0))
        );
        while (!condition()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    /**
     * Return the server with the given index.  An index with no server
     * behind it is a mistake in the test, reported with
     * std::out_of_range.
     */
    Swim::Server& At(size_t index) {
        return *servers.at(index);
    }

    bool Sees(
        size_t observer,
        size_t subject,
        Swim::Health health
    ) {
        Swim::Health observedHealth;
        return (
            At(observer).HealthOf(At(subject).GetMemberId(), observedHealth)
            && (observedHealth == health)
        );
    }

    bool AllAlive() {
        for (size_t observer = 0; observer < servers.size(); ++observer) {
            for (size_t subject = 0; subject < servers.size(); ++subject) {
                if (!Sees(observer, subject, Swim::Health::Alive)) {
                    return false;
                }
            }
        }
        return true;
    }

    void Partition(size_t first, size_t second) {
        servers[first]->AddToBlacklist(servers[second]->GetMemberId());
        servers[second]->AddToBlacklist(servers[first]->GetMemberId());
    }

    void Heal(size_t first, size_t second) {
        servers[first]->RemoveFromBlacklist(servers[second]->GetMemberId());
        servers[second]->RemoveFromBlacklist(servers[first]->GetMemberId());
    }

    bool GetElection(
        size_t observer,
        const std::string& serviceGroup,
        Swim::Rumor::ElectionDetails& election
    ) {
        Swim::Rumor rumor;
        if (
            !servers[observer]->GetRumorStore().Get(
                serviceGroup,
                Swim::Rumor::Kind::Election,
                rumor
            )
        ) {
            return false;
        }
        election = rumor.election;
        return true;
    }

    // ::testing::Test

    virtual void SetUp() override {
        scheduler->SetClock(std::make_shared< Swim::SteadyClock >());
    }

    virtual void TearDown() override {
        for (const auto& server: servers) {
            server->Demobilize();
        }
        for (const auto& eventsUnsubscribeDelegate: eventsUnsubscribeDelegates) {
            eventsUnsubscribeDelegate();
        }
        serversById.clear();
        servers.clear();
    }
};

TEST_F(NetworkTests, Members_Discover_Each_Other_Through_Seed) {
    // Arrange
    StartNetwork(5);

    // Act
    const auto converged = AwaitUntil([this]{ return AllAlive(); });

    // Assert
    EXPECT_TRUE(converged);
    for (const auto& server: servers) {
        EXPECT_EQ(5, server->GetMembershipList().GetSize());
        EXPECT_LT(0, server->GetSwimRounds());
        EXPECT_LT(0, server->GetGossipRounds());
    }
}

TEST_F(NetworkTests, Partitioned_Members_Confirm_Each_Other_Then_Heal) {
    // Arrange
    StartNetwork(5);
    ASSERT_TRUE(AwaitUntil([this]{ return AllAlive(); }));

    // Act
    Partition(0, 1);
    const auto partitionDetected = AwaitUntil(
        [this]{
            return (
                Sees(0, 1, Swim::Health::Confirmed)
                && Sees(1, 0, Swim::Health::Confirmed)
                && Sees(0, 2, Swim::Health::Alive)
            );
        }
    );
    const auto othersStillSeeBoth = AwaitUntil(
        [this]{
            for (size_t observer = 2; observer < servers.size(); ++observer) {
                if (
                    !Sees(observer, 0, Swim::Health::Alive)
                    || !Sees(observer, 1, Swim::Health::Alive)
                ) {
                    return false;
                }
            }
            return true;
        }
    );
    Heal(0, 1);
    const auto healed = AwaitUntil(
        [this]{
            return (
                Sees(0, 1, Swim::Health::Alive)
                && Sees(1, 0, Swim::Health::Alive)
            );
        }
    );

    // Assert
    EXPECT_TRUE(partitionDetected);
    EXPECT_TRUE(othersStillSeeBoth);
    EXPECT_TRUE(healed);
}

TEST_F(NetworkTests, Most_Suitable_Candidate_Elected_Everywhere) {
    // Arrange
    StartNetwork(3);
    ASSERT_TRUE(AwaitUntil([this]{ return AllAlive(); }));

    // Act
    servers[0]->StartElection("redis", 10, 1);
    servers[1]->StartElection("redis", 20, 1);
    const auto agreed = AwaitUntil(
        [this]{
            Swim::Rumor::ElectionDetails first;
            if (!GetElection(0, "redis", first)) {
                return false;
            }
            if (first.status != Swim::ElectionStatus::Finished) {
                return false;
            }
            for (size_t i = 1; i < servers.size(); ++i) {
                Swim::Rumor::ElectionDetails other;
                if (
                    !GetElection(i, "redis", other)
                    || (other.memberId != first.memberId)
                    || (other.term != first.term)
                    || (other.status != first.status)
                    || (other.votes != first.votes)
                ) {
                    return false;
                }
            }
            return true;
        }
    );

    // Assert
    ASSERT_TRUE(agreed);
    Swim::Rumor::ElectionDetails election;
    ASSERT_TRUE(GetElection(2, "redis", election));
    EXPECT_EQ(servers[1]->GetMemberId(), election.memberId);
    EXPECT_EQ(20, election.suitability);
    EXPECT_EQ(1, election.term);
    EXPECT_EQ(
        std::set< std::string >({
            servers[0]->GetMemberId(),
            servers[1]->GetMemberId(),
            servers[2]->GetMemberId(),
        }),
        election.votes
    );
}

TEST_F(NetworkTests, Suspected_Member_Refutes_Suspicion) {
    // Arrange
    StartNetwork(3);
    ASSERT_TRUE(AwaitUntil([this]{ return AllAlive(); }));
    const auto suspect = servers[0]->GetSelf();

    // Act
    Swim::Message gossip;
    gossip.type = Swim::Message::Type::Gossip;
    gossip.from = servers[2]->GetSelf();
    gossip.rumors.push_back(Swim::Rumor::MakeMember(suspect, Swim::Health::Suspect));
    servers[1]->ReceiveMessage(gossip.Serialize());
    const auto refuted = AwaitUntil(
        [this, suspect]{
            Swim::MembershipList::Entry entry;
            return (
                servers[1]->GetMembershipList().Find(suspect.id, entry)
                && (entry.health == Swim::Health::Alive)
                && (entry.member.incarnation > suspect.incarnation)
            );
        }
    );

    // Assert
    EXPECT_TRUE(refuted);
    EXPECT_LT(suspect.incarnation, servers[0]->GetSelf().incarnation);
}

TEST_F(NetworkTests, Paused_Member_Detected_And_Recovers_When_Resumed) {
    // Arrange
    StartNetwork(3);
    ASSERT_TRUE(AwaitUntil([this]{ return AllAlive(); }));

    // Act
    servers[2]->Pause();
    const auto swimRoundsWhenPaused = servers[2]->GetSwimRounds();
    const auto detected = AwaitUntil(
        [this]{
            return (
                Sees(0, 2, Swim::Health::Confirmed)
                && Sees(1, 2, Swim::Health::Confirmed)
            );
        }
    );
    const auto swimRoundsWhileDetecting = servers[2]->GetSwimRounds();
    servers[2]->Resume();
    const auto recovered = AwaitUntil([this]{ return AllAlive(); });

    // Assert
    EXPECT_TRUE(detected);
    EXPECT_LE(swimRoundsWhileDetecting, swimRoundsWhenPaused + 1);
    EXPECT_TRUE(recovered);
}

TEST_F(NetworkTests, Departure_Spreads_To_Every_Member) {
    // Arrange
    StartNetwork(4);
    ASSERT_TRUE(AwaitUntil([this]{ return AllAlive(); }));

    // Act
    servers[3]->Depart();
    const auto spread = AwaitUntil(
        [this]{
            for (size_t observer = 0; observer < servers.size(); ++observer) {
                if (!Sees(observer, 3, Swim::Health::Departed)) {
                    return false;
                }
            }
            return true;
        }
    );

    // Assert
    EXPECT_TRUE(spread);
}

TEST_F(NetworkTests, Unknown_Member_Index_Rejected) {
    // Arrange
    StartNetwork(2);

    // Act
    // Assert
    EXPECT_THROW(At(2), std::out_of_range);
    EXPECT_THROW(Sees(0, 5, Swim::Health::Alive), std::out_of_range);
    EXPECT_THROW(
        At(0).GetMembershipList().GetMember("no-such-member"),
        std::out_of_range
    );
}
