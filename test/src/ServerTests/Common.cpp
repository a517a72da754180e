/**
 * @file Common.cpp
 *
 * This module provides the implementation of the base fixture used to test the
 * Swim::Server class.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Common.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <Json/Value.hpp>
#include <stddef.h>
#include <StringExtensions/StringExtensions.hpp>
#include <thread>
#include <vector>

namespace ServerTests {

    double MockTimeKeeper::GetCurrentTime() {
        return currentTime;
    }

    bool Common::AwaitCondition(std::function< bool() > condition) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        return eventReceived.wait_for(
            lock,
            std::chrono::seconds(1),
            condition
        );
    }

    bool Common::AwaitCount(
        std::function< size_t() > counter,
        size_t count
    ) {
        const auto deadline = (
            std::chrono::steady_clock::now()
            + std::chrono::seconds(1)
        );
        while (counter() < count) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    bool Common::AwaitMessagesSent(
        Swim::Message::Type type,
        size_t numMessages
    ) {
        return AwaitCondition(
            [this, type, numMessages]{
                size_t numSent = 0;
                for (const auto& messageInfo: messagesSent) {
                    if (messageInfo.message.type == type) {
                        ++numSent;
                    }
                }
                return (numSent >= numMessages);
            }
        );
    }

    std::vector< MessageInfo > Common::MessagesSentOfType(Swim::Message::Type type) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        std::vector< MessageInfo > messagesOfType;
        for (const auto& messageInfo: messagesSent) {
            if (messageInfo.message.type == type) {
                messagesOfType.push_back(messageInfo);
            }
        }
        return messagesOfType;
    }

    size_t Common::NumMessagesSentOfType(Swim::Message::Type type) {
        return MessagesSentOfType(type).size();
    }

    size_t Common::GetStatistic(const std::string& name) {
        return (size_t)server.GetStatistics()[name];
    }

    Swim::Member Common::MakePeer(size_t index) {
        Swim::Member peer;
        peer.id = StringExtensions::sprintf("peer%zu", index);
        peer.address = StringExtensions::sprintf("10.0.0.%zu", index);
        peer.swimPort = 9638;
        peer.gossipPort = 9639;
        return peer;
    }

    void Common::AddPeers(
        size_t numPeers,
        Swim::Health health
    ) {
        for (size_t i = 0; i < numPeers; ++i) {
            const auto peer = MakePeer(peers.size() + 1);
            peers.push_back(peer);
            (void)server.InsertMember(peer, health);
        }
    }

    void Common::MobilizeServer() {
        server.Mobilize(
            scheduler,
            serverConfiguration
        );
    }

    void Common::ReceiveMessage(const Swim::Message& message) {
        server.ReceiveMessage(message.Serialize());
    }

    void Common::ReceiveGossip(
        const Swim::Member& from,
        const std::vector< Swim::Rumor >& rumors
    ) {
        Swim::Message message;
        message.type = Swim::Message::Type::Gossip;
        message.from = from;
        message.rumors = rumors;
        ReceiveMessage(message);
    }

    void Common::AdvanceTime(double seconds) {
        mockTimeKeeper->currentTime += seconds;
        scheduler->WakeUp();
    }

    bool Common::AdvanceProtocolPeriods(size_t numPeriods) {
        for (size_t i = 0; i < numPeriods; ++i) {
            const auto swimRounds = server.GetSwimRounds();
            AdvanceTime(serverConfiguration.protocolPeriod);
            if (
                !AwaitCount(
                    [this]{ return server.GetSwimRounds(); },
                    swimRounds + 1
                )
            ) {
                return false;
            }
        }
        return true;
    }

    bool Common::AdvanceGossipRounds(size_t numRounds) {
        for (size_t i = 0; i < numRounds; ++i) {
            const auto gossipRounds = server.GetGossipRounds();
            AdvanceTime(serverConfiguration.gossipInterval);
            if (
                !AwaitCount(
                    [this]{ return server.GetGossipRounds(); },
                    gossipRounds + 1
                )
            ) {
                return false;
            }
        }
        return true;
    }

    Swim::Rumor::ElectionDetails Common::GetStoredElection(const std::string& serviceGroup) {
        Swim::Rumor::ElectionDetails election;
        server.GetRumorStore().With(
            serviceGroup,
            Swim::Rumor::Kind::Election,
            [&election](const Swim::Rumor* rumor){
                if (rumor != nullptr) {
                    election = rumor->election;
                }
            }
        );
        return election;
    }

    void Common::SetServerDelegates() {
        scheduler->SetClock(mockTimeKeeper);
        diagnosticsUnsubscribeDelegate = server.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                std::lock_guard< decltype(mutex) > lock(mutex);
                diagnosticMessages.push_back(
                    StringExtensions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            0
        );
        eventsUnsubscribeDelegate = server.SubscribeToEvents(
            [this](
                const Swim::IServer::Event& baseEvent
            ){
                std::lock_guard< decltype(mutex) > lock(mutex);
                switch (baseEvent.type) {
                    case Swim::IServer::Event::Type::SendMessage: {
                        const auto& event = static_cast< const Swim::IServer::SendMessageEvent& >(baseEvent);
                        MessageInfo messageInfo;
                        messageInfo.receiver = event.receiver;
                        messageInfo.channel = event.channel;
                        messageInfo.message = Swim::Message(event.serializedMessage);
                        messagesSent.push_back(std::move(messageInfo));
                    } break;

                    case Swim::IServer::Event::Type::HealthChange: {
                        const auto& event = static_cast< const Swim::IServer::HealthChangeEvent& >(baseEvent);
                        healthChanges.emplace_back(event.member, event.health);
                    } break;

                    case Swim::IServer::Event::Type::ElectionChange: {
                        const auto& event = static_cast< const Swim::IServer::ElectionChangeEvent& >(baseEvent);
                        electionChanges.push_back(event.election);
                    } break;

                    default: break;
                }
                eventReceived.notify_all();
            }
        );
    }

    void Common::SetUp() {
        SetServerDelegates();
        serverConfiguration.address = "10.0.0.100";
        serverConfiguration.swimPort = 9638;
        serverConfiguration.gossipPort = 9639;
        serverConfiguration.protocolPeriod = 1.0;
        serverConfiguration.pingTimeout = 0.3;
        serverConfiguration.pingReqTargets = 3;
        serverConfiguration.suspicionPeriods = 3;
        serverConfiguration.gossipInterval = 1000.0;
        serverConfiguration.gossipFanout = 3;
        serverConfiguration.rumorHeatRounds = 3;
        serverConfiguration.antiEntropyRounds = 0;
        serverConfiguration.electionTimeoutRounds = 3;
    }

    void Common::TearDown() {
        server.Demobilize();
        eventsUnsubscribeDelegate();
        diagnosticsUnsubscribeDelegate();
    }

}
