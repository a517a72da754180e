/**
 * @file Elections.cpp
 *
 * This module contains the unit tests of the Swim::Server class that have
 * to do with electing a leader for a service group.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Common.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <Swim/Server.hpp>

namespace ServerTests {

    /**
     * This is the test fixture for these tests, providing common
     * setup and teardown for each test.
     */
    struct ServerTests_Elections
        : public Common
    {
        // Methods

        Swim::Rumor::ElectionDetails MakeElection(
            const std::string& memberId,
            uint64_t suitability,
            uint64_t term,
            const std::set< std::string >& votes,
            Swim::ElectionStatus status = Swim::ElectionStatus::Running
        ) {
            Swim::Rumor::ElectionDetails election;
            election.memberId = memberId;
            election.serviceGroup = "redis";
            election.suitability = suitability;
            election.term = term;
            election.votes = votes;
            election.status = status;
            return election;
        }

        void RegisterService(const std::string& memberId) {
            Swim::Rumor::ServiceDetails service;
            service.memberId = memberId;
            service.serviceGroup = "redis";
            service.port = 6379;
            ReceiveGossip(
                MakePeer(1),
                {Swim::Rumor::MakeService(service)}
            );
        }

        // ::testing::Test

        virtual void SetUp() override {
            Common::SetUp();
            serverConfiguration.protocolPeriod = 1000.0;
            serverConfiguration.gossipInterval = 1.0;
        }
    };

    TEST_F(ServerTests_Elections, Lone_Candidate_Wins_Immediately) {
        // Arrange
        MobilizeServer();

        // Act
        server.StartElection("redis", 10, 1);

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(server.GetMemberId(), election.memberId);
        EXPECT_EQ(1, election.term);
        EXPECT_EQ(10, election.suitability);
        EXPECT_EQ(Swim::ElectionStatus::Finished, election.status);
        EXPECT_EQ(std::set< std::string >({server.GetMemberId()}), election.votes);
        EXPECT_TRUE(
            AwaitCondition(
                [this]{
                    return (
                        !electionChanges.empty()
                        && (electionChanges.back().status == Swim::ElectionStatus::Finished)
                    );
                }
            )
        );
    }

    TEST_F(ServerTests_Elections, Candidate_Waits_For_Quorum) {
        // Arrange
        AddPeers(2);
        MobilizeServer();

        // Act
        server.StartElection("redis", 10, 1);

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(server.GetMemberId(), election.memberId);
        EXPECT_EQ(Swim::ElectionStatus::Running, election.status);
    }

    TEST_F(ServerTests_Elections, Peer_Vote_Completes_Quorum) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);

        // Act
        ReceiveGossip(
            peers[0],
            {
                Swim::Rumor::MakeElection(
                    MakeElection(server.GetMemberId(), 10, 1, {server.GetMemberId(), "peer1"})
                )
            }
        );

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(Swim::ElectionStatus::Finished, election.status);
        EXPECT_EQ(
            std::set< std::string >({server.GetMemberId(), "peer1"}),
            election.votes
        );
    }

    TEST_F(ServerTests_Elections, Vote_Given_To_Better_Candidate) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);

        // Act
        ReceiveGossip(
            peers[0],
            {Swim::Rumor::MakeElection(MakeElection("peer1", 20, 1, {"peer1"}))}
        );
        ASSERT_TRUE(AdvanceGossipRounds(1));

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ("peer1", election.memberId);
        EXPECT_EQ(20, election.suitability);
        EXPECT_EQ(Swim::ElectionStatus::Running, election.status);
        EXPECT_EQ(
            std::set< std::string >({server.GetMemberId(), "peer1"}),
            election.votes
        );
        ASSERT_TRUE(AwaitMessagesSent(Swim::Message::Type::Gossip, 1));
        bool voteSpread = false;
        for (const auto& rumor: MessagesSentOfType(Swim::Message::Type::Gossip)[0].message.rumors) {
            if (
                (rumor.kind == Swim::Rumor::Kind::Election)
                && (rumor.election.votes.count(server.GetMemberId()) == 1)
            ) {
                voteSpread = true;
            }
        }
        EXPECT_TRUE(voteSpread);
    }

    TEST_F(ServerTests_Elections, Worse_Candidate_Does_Not_Replace_Better_One) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);

        // Act
        ReceiveGossip(
            peers[0],
            {Swim::Rumor::MakeElection(MakeElection("peer1", 5, 1, {"peer1"}))}
        );

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(server.GetMemberId(), election.memberId);
        EXPECT_EQ(10, election.suitability);
    }

    TEST_F(ServerTests_Elections, Higher_Term_Replaces_Election) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);

        // Act
        ReceiveGossip(
            peers[0],
            {Swim::Rumor::MakeElection(MakeElection("peer1", 5, 2, {"peer1"}))}
        );

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ("peer1", election.memberId);
        EXPECT_EQ(2, election.term);
    }

    TEST_F(ServerTests_Elections, No_Quorum_After_Election_Timeout) {
        // Arrange
        serverConfiguration.electionTimeoutRounds = 2;
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);

        // Act
        ASSERT_TRUE(AdvanceGossipRounds(2));
        const auto statusBeforeTimeout = GetStoredElection("redis").status;
        ASSERT_TRUE(AdvanceGossipRounds(1));

        // Assert
        EXPECT_EQ(Swim::ElectionStatus::Running, statusBeforeTimeout);
        EXPECT_EQ(Swim::ElectionStatus::NoQuorum, GetStoredElection("redis").status);
    }

    TEST_F(ServerTests_Elections, Unreachable_Members_Count_Toward_Quorum_Of_Known_Members) {
        // Arrange
        serverConfiguration.quorumRule = Swim::IServer::QuorumRule::KnownMembers;
        AddPeers(4, Swim::Health::Confirmed);
        MobilizeServer();

        // Act
        server.StartElection("redis", 10, 1);

        // Assert
        EXPECT_EQ(Swim::ElectionStatus::Running, GetStoredElection("redis").status);
    }

    TEST_F(ServerTests_Elections, Only_Alive_Members_Count_Toward_Quorum_Of_Live_Members) {
        // Arrange
        serverConfiguration.quorumRule = Swim::IServer::QuorumRule::LiveMembers;
        AddPeers(4, Swim::Health::Confirmed);
        MobilizeServer();

        // Act
        server.StartElection("redis", 10, 1);

        // Assert
        EXPECT_EQ(Swim::ElectionStatus::Finished, GetStoredElection("redis").status);
    }

    TEST_F(ServerTests_Elections, Departed_Members_Never_Count_Toward_Quorum) {
        // Arrange
        AddPeers(4, Swim::Health::Departed);
        MobilizeServer();

        // Act
        server.StartElection("redis", 10, 1);

        // Assert
        EXPECT_EQ(Swim::ElectionStatus::Finished, GetStoredElection("redis").status);
    }

    TEST_F(ServerTests_Elections, Electorate_Limited_To_Service_Group_Members) {
        // Arrange
        AddPeers(4);
        MobilizeServer();
        Swim::Rumor::ServiceDetails service;
        service.serviceGroup = "redis";
        service.port = 6379;
        server.InsertService(service);
        RegisterService("peer1");
        server.StartElection("redis", 10, 1);

        // Act
        ReceiveGossip(
            peers[1],
            {
                Swim::Rumor::MakeElection(
                    MakeElection(server.GetMemberId(), 10, 1, {server.GetMemberId(), "peer2"})
                )
            }
        );
        const auto statusWithOutsiderVote = GetStoredElection("redis").status;
        ReceiveGossip(
            peers[0],
            {
                Swim::Rumor::MakeElection(
                    MakeElection(server.GetMemberId(), 10, 1, {server.GetMemberId(), "peer1"})
                )
            }
        );

        // Assert
        EXPECT_EQ(Swim::ElectionStatus::Running, statusWithOutsiderVote);
        EXPECT_EQ(Swim::ElectionStatus::Finished, GetStoredElection("redis").status);
    }

    TEST_F(ServerTests_Elections, Outsider_Does_Not_Vote) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        RegisterService("peer1");
        RegisterService("peer2");

        // Act
        ReceiveGossip(
            peers[0],
            {Swim::Rumor::MakeElection(MakeElection("peer1", 20, 1, {"peer1"}))}
        );

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(std::set< std::string >({"peer1"}), election.votes);
    }

    TEST_F(ServerTests_Elections, New_Term_Started_When_Leader_Confirmed_Dead) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);
        ReceiveGossip(
            peers[0],
            {
                Swim::Rumor::MakeElection(
                    MakeElection(
                        "peer1",
                        20,
                        1,
                        {"peer1", "peer2"},
                        Swim::ElectionStatus::Finished
                    )
                )
            }
        );
        ASSERT_EQ("peer1", GetStoredElection("redis").memberId);

        // Act
        ReceiveGossip(
            peers[1],
            {Swim::Rumor::MakeMember(peers[0], Swim::Health::Confirmed)}
        );
        ASSERT_TRUE(AdvanceGossipRounds(1));

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(server.GetMemberId(), election.memberId);
        EXPECT_EQ(2, election.term);
        EXPECT_EQ(10, election.suitability);
        EXPECT_EQ(Swim::ElectionStatus::Running, election.status);
    }

    TEST_F(ServerTests_Elections, New_Term_Started_When_Running_Candidate_Confirmed_Dead) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);
        ReceiveGossip(
            peers[0],
            {Swim::Rumor::MakeElection(MakeElection("peer1", 20, 1, {"peer1"}))}
        );
        ASSERT_EQ("peer1", GetStoredElection("redis").memberId);
        ASSERT_EQ(Swim::ElectionStatus::Running, GetStoredElection("redis").status);

        // Act
        ReceiveGossip(
            peers[1],
            {Swim::Rumor::MakeMember(peers[0], Swim::Health::Confirmed)}
        );
        ASSERT_TRUE(AdvanceGossipRounds(1));

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(server.GetMemberId(), election.memberId);
        EXPECT_EQ(2, election.term);
        EXPECT_EQ(10, election.suitability);
        EXPECT_EQ(Swim::ElectionStatus::Running, election.status);
        EXPECT_EQ(std::set< std::string >({server.GetMemberId()}), election.votes);
    }

    TEST_F(ServerTests_Elections, New_Term_Started_When_Candidate_Without_Quorum_Departs) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        server.StartElection("redis", 10, 1);
        ReceiveGossip(
            peers[0],
            {
                Swim::Rumor::MakeElection(
                    MakeElection(
                        "peer1",
                        20,
                        1,
                        {"peer1"},
                        Swim::ElectionStatus::NoQuorum
                    )
                )
            }
        );
        ASSERT_EQ(Swim::ElectionStatus::NoQuorum, GetStoredElection("redis").status);

        // Act
        ReceiveGossip(
            peers[1],
            {Swim::Rumor::MakeMember(peers[0], Swim::Health::Departed)}
        );
        ASSERT_TRUE(AdvanceGossipRounds(1));

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ(server.GetMemberId(), election.memberId);
        EXPECT_EQ(2, election.term);
    }

    TEST_F(ServerTests_Elections, Bystander_Settles_Election_Of_Dead_Candidate) {
        // Arrange
        AddPeers(2);
        MobilizeServer();
        ReceiveGossip(
            peers[0],
            {Swim::Rumor::MakeElection(MakeElection("peer1", 20, 1, {"peer1"}))}
        );
        ASSERT_EQ(Swim::ElectionStatus::Running, GetStoredElection("redis").status);

        // Act
        ReceiveGossip(
            peers[1],
            {Swim::Rumor::MakeMember(peers[0], Swim::Health::Confirmed)}
        );
        ASSERT_TRUE(AdvanceGossipRounds(1));

        // Assert
        const auto election = GetStoredElection("redis");
        EXPECT_EQ("peer1", election.memberId);
        EXPECT_EQ(1, election.term);
        EXPECT_EQ(Swim::ElectionStatus::NoQuorum, election.status);
        EXPECT_TRUE(
            AwaitCondition(
                [this]{
                    return (
                        !electionChanges.empty()
                        && (electionChanges.back().status == Swim::ElectionStatus::NoQuorum)
                    );
                }
            )
        );
    }

    TEST_F(ServerTests_Elections, Departed_Server_Does_Not_Stand) {
        // Arrange
        MobilizeServer();
        server.Depart();

        // Act
        server.StartElection("redis", 10, 1);

        // Assert
        Swim::Rumor rumor;
        EXPECT_FALSE(
            server.GetRumorStore().Get(
                "redis",
                Swim::Rumor::Kind::Election,
                rumor
            )
        );
    }

}
