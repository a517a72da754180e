/**
 * @file ServerImpl.cpp
 *
 * This module contains the implementation of the Swim::Server::Impl
 * structure methods which are shared by the failure detector, the gossip
 * disseminator and the election engine.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ServerImpl.hpp"
#include "Utilities.hpp"

#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Swim {

    Server::Impl::Impl(const std::string& name)
        : diagnosticsSender("Swim::Server")
        , name(name)
        , selfId(GenerateMemberId())
    {
        self.id = selfId;
        self.address = serverConfiguration.address;
        self.swimPort = serverConfiguration.swimPort;
        self.gossipPort = serverConfiguration.gossipPort;
        (void)membershipList.Upsert(self, Health::Alive);
        (void)rumorStore.Insert(Rumor::MakeMember(self, Health::Alive));
    }

    Member Server::Impl::GetSelf() {
        std::lock_guard< decltype(selfMutex) > lock(selfMutex);
        return self;
    }

    bool Server::Impl::IsBlacklisted(const std::string& memberId) {
        std::lock_guard< decltype(blacklistMutex) > lock(blacklistMutex);
        return (blacklist.find(memberId) != blacklist.end());
    }

    bool Server::Impl::IsCurrent(size_t thisGeneration) const {
        return (
            mobilized
            && (generation == thisGeneration)
        );
    }

    void Server::Impl::QueueMessageToBeSent(
        const Message& message,
        const Member& receiver,
        IServer::Channel channel
    ) {
        if (IsBlacklisted(receiver.id)) {
            ++messagesDropped;
            diagnosticsSender.SendDiagnosticInformationFormatted(
                0,
                "Not sending %s to blacklisted member %s",
                MessageTypeToString(message.type).c_str(),
                receiver.id.c_str()
            );
            return;
        }
        const auto sendMessageEvent = std::make_shared< SendMessageEvent >();
        sendMessageEvent->serializedMessage = message.Serialize();
        sendMessageEvent->receiver = receiver;
        sendMessageEvent->channel = channel;
        ++messagesSent;
        AddToEventQueue(std::move(sendMessageEvent));
    }

    void Server::Impl::AddToEventQueue(
        std::shared_ptr< IServer::Event >&& event
    ) {
        std::lock_guard< decltype(eventQueueMutex) > lock(eventQueueMutex);
        eventQueue.Add(std::move(event));
        eventQueueWorkerWakeCondition.notify_one();
    }

    void Server::Impl::ProcessEventQueue(
        std::unique_lock< decltype(eventQueueMutex) >& lock
    ) {
        auto eventSubscribersSample = eventSubscribers;
        lock.unlock();
        while (!eventQueue.IsEmpty()) {
            const auto event = eventQueue.Remove();
            for (auto eventSubscriber: eventSubscribersSample) {
                eventSubscriber.second(*event);
            }
        }
        lock.lock();
    }

    void Server::Impl::EventQueueWorker() {
        std::unique_lock< decltype(eventQueueMutex) > lock(eventQueueMutex);
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Event queue worker thread started"
        );
        while (!stopEventQueueWorker) {
            eventQueueWorkerWakeCondition.wait(
                lock,
                [this]{
                    return (
                        stopEventQueueWorker
                        || !eventQueue.IsEmpty()
                    );
                }
            );
            ProcessEventQueue(lock);
        }
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Event queue worker thread stopping"
        );
    }

    bool Server::Impl::MergeMemberRumor(const Rumor& rumor) {
        const auto& member = rumor.member.member;
        if (member.id == selfId) {
            return MergeSelfRumor(rumor);
        }
        if (IsBlacklisted(member.id)) {
            return false;
        }
        return ApplyMemberRumor(rumor);
    }

    bool Server::Impl::ApplyMemberRumor(const Rumor& rumor) {
        const auto& member = rumor.member.member;
        const auto health = rumor.member.health;
        Health oldHealth;
        const auto known = membershipList.HealthOf(member.id, oldHealth);
        if (!membershipList.Upsert(member, health)) {
            return false;
        }
        (void)rumorStore.Insert(rumor);
        if (
            !known
            || (oldHealth != health)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                2,
                "Member %s is now %s (incarnation %zu)",
                member.id.c_str(),
                HealthToString(health).c_str(),
                (size_t)member.incarnation
            );
            const auto healthChangeEvent = std::make_shared< HealthChangeEvent >();
            healthChangeEvent->member = member;
            healthChangeEvent->health = health;
            AddToEventQueue(std::move(healthChangeEvent));
        }
        if (health == Health::Departed) {
            TombstoneServicesOf(member.id);
        }
        return true;
    }

    bool Server::Impl::MergeSelfRumor(const Rumor& rumor) {
        const auto& incoming = rumor.member.member;
        const auto health = rumor.member.health;
        if (health == Health::Departed) {
            return false;
        }
        std::lock_guard< decltype(selfMutex) > lock(selfMutex);
        if (departed) {
            return false;
        }
        if (
            (incoming.incarnation < self.incarnation)
            || (
                (incoming.incarnation == self.incarnation)
                && (health == Health::Alive)
            )
        ) {
            return false;
        }
        self.incarnation = incoming.incarnation + 1;
        diagnosticsSender.SendDiagnosticInformationFormatted(
            2,
            "Refuting %s rumor about self at incarnation %zu (now %zu)",
            HealthToString(health).c_str(),
            (size_t)incoming.incarnation,
            (size_t)self.incarnation
        );
        (void)membershipList.Upsert(self, Health::Alive);
        (void)rumorStore.Insert(Rumor::MakeMember(self, Health::Alive));
        return true;
    }

    bool Server::Impl::MergeServiceRumor(const Rumor& rumor) {
        const auto& service = rumor.service;
        if (service.memberId == selfId) {
            std::lock_guard< decltype(selfMutex) > lock(selfMutex);
            auto ownServicesEntry = ownServices.find(service.serviceGroup);
            if (
                !departed
                && (ownServicesEntry != ownServices.end())
            ) {
                auto& ownService = ownServicesEntry->second;
                if (
                    (service.incarnation > ownService.incarnation)
                    || (
                        (service.incarnation == ownService.incarnation)
                        && service.tombstone
                    )
                ) {
                    ownService.incarnation = service.incarnation + 1;
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        2,
                        "Re-asserting registration in %s (incarnation %zu)",
                        service.serviceGroup.c_str(),
                        (size_t)ownService.incarnation
                    );
                    return rumorStore.Insert(Rumor::MakeService(ownService));
                }
            }
        }
        return rumorStore.Insert(rumor);
    }

    bool Server::Impl::MergeElectionRumor(const Rumor& rumor) {
        std::lock_guard< decltype(electionMutex) > lock(electionMutex);
        if (!InsertElection(rumor.election)) {
            return false;
        }
        UpdateElection(rumor.election.serviceGroup);
        return true;
    }

    void Server::Impl::MergeRumor(const Rumor& rumor) {
        switch (rumor.kind) {
            case Rumor::Kind::Member: {
                (void)MergeMemberRumor(rumor);
            } break;

            case Rumor::Kind::Service: {
                (void)MergeServiceRumor(rumor);
            } break;

            case Rumor::Kind::Election: {
                (void)MergeElectionRumor(rumor);
            } break;

            default: {
                diagnosticsSender.SendDiagnosticInformationString(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Ignoring rumor of unknown kind"
                );
            } break;
        }
    }

    void Server::Impl::TombstoneServicesOf(const std::string& memberId) {
        std::vector< Rumor > tombstones;
        rumorStore.Each(
            Rumor::Kind::Service,
            [memberId, &tombstones](const Rumor& rumor){
                if (
                    (rumor.service.memberId == memberId)
                    && !rumor.service.tombstone
                ) {
                    auto tombstone = rumor;
                    ++tombstone.service.incarnation;
                    tombstone.service.tombstone = true;
                    tombstones.push_back(std::move(tombstone));
                }
            }
        );
        for (const auto& tombstone: tombstones) {
            (void)rumorStore.Insert(tombstone);
        }
    }

    void Server::Impl::MergeMessageMembership(const Message& message) {
        (void)MergeMemberRumor(Rumor::MakeMember(message.from, Health::Alive));
        for (const auto& rumor: message.rumors) {
            if (rumor.kind == Rumor::Kind::Member) {
                (void)MergeMemberRumor(rumor);
            }
        }
    }

}
