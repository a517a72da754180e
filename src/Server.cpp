/**
 * @file Server.cpp
 *
 * This module contains the implementation of the Swim::Server class.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Message.hpp"
#include "ServerImpl.hpp"
#include "Utilities.hpp"

#include <algorithm>
#include <mutex>
#include <Swim/Server.hpp>
#include <SystemAbstractions/CryptoRandom.hpp>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <thread>

namespace Swim {

    Server::~Server() noexcept {
        if (impl_ != nullptr) {
            Demobilize();
        }
    }
    Server::Server(Server&&) noexcept = default;
    Server& Server::operator=(Server&&) noexcept = default;

    Server::Server(const std::string& name)
        : impl_(new Impl(name))
    {
        SystemAbstractions::CryptoRandom jim;
        int seed;
        jim.Generate(&seed, sizeof(seed));
        impl_->probeRng.seed(seed);
        jim.Generate(&seed, sizeof(seed));
        impl_->gossipRng.seed(seed);
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Server::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    std::string Server::GetName() const {
        return impl_->name;
    }

    std::string Server::GetMemberId() const {
        return impl_->selfId;
    }

    Member Server::GetSelf() const {
        return impl_->GetSelf();
    }

    auto Server::SubscribeToEvents(EventDelegate eventDelegate) -> EventsUnsubscribeDelegate {
        std::lock_guard< decltype(impl_->eventQueueMutex) > lock(impl_->eventQueueMutex);
        const auto eventSubscriberId = impl_->nextEventSubscriberId++;
        impl_->eventSubscribers[eventSubscriberId] = eventDelegate;
        const std::weak_ptr< Impl > implWeak = impl_;
        return [implWeak, eventSubscriberId]{
            const auto impl = implWeak.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->eventQueueMutex) > lock(impl->eventQueueMutex);
            impl->eventSubscribers.erase(eventSubscriberId);
        };
    }

    void Server::Mobilize(
        std::shared_ptr< Timekeeping::Scheduler > scheduler,
        const ServerConfiguration& serverConfiguration
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->mobilized) {
            return;
        }
        std::lock_guard< decltype(impl_->probeMutex) > probeLock(impl_->probeMutex);
        std::lock_guard< decltype(impl_->gossipMutex) > gossipLock(impl_->gossipMutex);
        std::lock_guard< decltype(impl_->electionMutex) > electionLock(impl_->electionMutex);
        ++impl_->generation;
        impl_->serverConfiguration = serverConfiguration;
        impl_->scheduler = scheduler;
        impl_->timing = std::make_shared< Timing >(
            serverConfiguration,
            scheduler->GetClock()
        );
        impl_->rumorStore.SetHeatRounds(serverConfiguration.rumorHeatRounds);
        {
            std::lock_guard< decltype(impl_->selfMutex) > selfLock(impl_->selfMutex);
            auto& self = impl_->self;
            if (
                !impl_->departed
                && (
                    (self.address != serverConfiguration.address)
                    || (self.swimPort != serverConfiguration.swimPort)
                    || (self.gossipPort != serverConfiguration.gossipPort)
                )
            ) {
                self.address = serverConfiguration.address;
                self.swimPort = serverConfiguration.swimPort;
                self.gossipPort = serverConfiguration.gossipPort;
                ++self.incarnation;
                (void)impl_->membershipList.Upsert(self, Health::Alive);
                (void)impl_->rumorStore.Insert(Rumor::MakeMember(self, Health::Alive));
            }
        }
        impl_->probe = ProbeInfo();
        impl_->suspicions.clear();
        {
            std::lock_guard< decltype(impl_->eventQueueMutex) > eventQueueLock(impl_->eventQueueMutex);
            impl_->stopEventQueueWorker = false;
        }
        impl_->eventQueueWorker = std::thread(&Impl::EventQueueWorker, impl_.get());
        impl_->mobilized = true;
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Mobilized as %s (%s) at %s:%d/%d",
            impl_->selfId.c_str(),
            impl_->name.c_str(),
            serverConfiguration.address.c_str(),
            serverConfiguration.swimPort,
            serverConfiguration.gossipPort
        );
        if (!impl_->departed) {
            impl_->StartProbe();
        }
        impl_->ScheduleProbePeriod();
        impl_->ScheduleGossipRound();
    }

    void Server::Demobilize() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->mobilized) {
            return;
        }
        {
            std::lock_guard< decltype(impl_->probeMutex) > probeLock(impl_->probeMutex);
            std::lock_guard< decltype(impl_->gossipMutex) > gossipLock(impl_->gossipMutex);
            std::lock_guard< decltype(impl_->electionMutex) > electionLock(impl_->electionMutex);
            impl_->mobilized = false;
            if (impl_->probePeriodToken != 0) {
                impl_->scheduler->Cancel(impl_->probePeriodToken);
                impl_->probePeriodToken = 0;
            }
            if (impl_->probe.pingTimeoutToken != 0) {
                impl_->scheduler->Cancel(impl_->probe.pingTimeoutToken);
                impl_->probe.pingTimeoutToken = 0;
            }
            if (impl_->gossipRoundToken != 0) {
                impl_->scheduler->Cancel(impl_->gossipRoundToken);
                impl_->gossipRoundToken = 0;
            }
            impl_->probe = ProbeInfo();
            impl_->scheduler = nullptr;
            impl_->timing = nullptr;
        }
        if (impl_->eventQueueWorker.joinable()) {
            std::unique_lock< decltype(impl_->eventQueueMutex) > eventQueueLock(impl_->eventQueueMutex);
            impl_->stopEventQueueWorker = true;
            impl_->eventQueueWorkerWakeCondition.notify_one();
            eventQueueLock.unlock();
            impl_->eventQueueWorker.join();
        }
        impl_->diagnosticsSender.SendDiagnosticInformationString(
            3,
            "Demobilized"
        );
    }

    void Server::ReceiveMessage(const std::string& serializedMessage) {
        if (
            !impl_->mobilized
            || impl_->paused
        ) {
            ++impl_->messagesDropped;
            return;
        }
        Message message(serializedMessage);
        if (message.type == Message::Type::Unknown) {
            ++impl_->messagesDropped;
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Dropping malformed message (%zu bytes)",
                serializedMessage.length()
            );
            return;
        }
        if (
            message.from.id.empty()
            || (message.from.id == impl_->selfId)
            || impl_->IsBlacklisted(message.from.id)
        ) {
            ++impl_->messagesDropped;
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Dropping %s from '%s'",
                MessageTypeToString(message.type).c_str(),
                message.from.id.c_str()
            );
            return;
        }
        ++impl_->messagesReceived;
        switch (message.type) {
            case Message::Type::Ping:
            case Message::Type::Ack:
            case Message::Type::PingReq: {
                std::lock_guard< decltype(impl_->probeMutex) > probeLock(impl_->probeMutex);
                if (!impl_->mobilized) {
                    return;
                }
                switch (message.type) {
                    case Message::Type::Ping: {
                        impl_->OnReceivePing(std::move(message));
                    } break;

                    case Message::Type::Ack: {
                        impl_->OnReceiveAck(std::move(message));
                    } break;

                    default: {
                        impl_->OnReceivePingReq(std::move(message));
                    } break;
                }
            } break;

            case Message::Type::Gossip: {
                impl_->OnReceiveGossip(std::move(message));
            } break;

            default: {
            } break;
        }
    }

    bool Server::InsertMember(
        const Member& member,
        Health health
    ) {
        if (member.id == impl_->selfId) {
            return false;
        }
        return impl_->ApplyMemberRumor(Rumor::MakeMember(member, health));
    }

    void Server::AddToBlacklist(const std::string& memberId) {
        std::lock_guard< decltype(impl_->blacklistMutex) > lock(impl_->blacklistMutex);
        if (impl_->blacklist.insert(memberId).second) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                2,
                "Blacklisted %s",
                memberId.c_str()
            );
        }
    }

    void Server::RemoveFromBlacklist(const std::string& memberId) {
        std::lock_guard< decltype(impl_->blacklistMutex) > lock(impl_->blacklistMutex);
        if (impl_->blacklist.erase(memberId) > 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                2,
                "No longer blacklisting %s",
                memberId.c_str()
            );
        }
    }

    bool Server::IsBlacklisted(const std::string& memberId) {
        return impl_->IsBlacklisted(memberId);
    }

    bool Server::HealthOf(
        const std::string& memberId,
        Health& health
    ) {
        return impl_->membershipList.HealthOf(memberId, health);
    }

    const MembershipList& Server::GetMembershipList() {
        return impl_->membershipList;
    }

    size_t Server::GetSwimRounds() {
        return impl_->swimRounds;
    }

    size_t Server::GetGossipRounds() {
        return impl_->gossipRounds;
    }

    void Server::Pause() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->paused) {
            return;
        }
        impl_->paused = true;
        impl_->diagnosticsSender.SendDiagnosticInformationString(
            3,
            "Paused"
        );
    }

    void Server::Resume() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->paused) {
            return;
        }
        impl_->paused = false;
        impl_->diagnosticsSender.SendDiagnosticInformationString(
            3,
            "Resumed"
        );
        if (!impl_->mobilized) {
            return;
        }
        {
            std::lock_guard< decltype(impl_->probeMutex) > probeLock(impl_->probeMutex);
            if (impl_->probe.pingTimeoutToken != 0) {
                impl_->scheduler->Cancel(impl_->probe.pingTimeoutToken);
            }
            impl_->probe = ProbeInfo();
            if (!impl_->departed) {
                impl_->StartProbe();
            }
            impl_->ScheduleProbePeriod();
        }
        {
            std::lock_guard< decltype(impl_->gossipMutex) > gossipLock(impl_->gossipMutex);
            impl_->ScheduleGossipRound();
        }
    }

    bool Server::IsPaused() {
        return impl_->paused;
    }

    void Server::Depart() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        Member self;
        {
            std::lock_guard< decltype(impl_->selfMutex) > selfLock(impl_->selfMutex);
            if (impl_->departed) {
                return;
            }
            impl_->departed = true;
            ++impl_->self.incarnation;
            self = impl_->self;
            (void)impl_->membershipList.Upsert(self, Health::Departed);
            (void)impl_->rumorStore.Insert(Rumor::MakeMember(self, Health::Departed));
            for (const auto& ownServicesEntry: impl_->ownServices) {
                auto tombstone = ownServicesEntry.second;
                ++tombstone.incarnation;
                tombstone.tombstone = true;
                (void)impl_->rumorStore.Insert(Rumor::MakeService(tombstone));
            }
            impl_->ownServices.clear();
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Departed at incarnation %zu",
            (size_t)self.incarnation
        );
        const auto healthChangeEvent = std::make_shared< HealthChangeEvent >();
        healthChangeEvent->member = self;
        healthChangeEvent->health = Health::Departed;
        impl_->AddToEventQueue(std::move(healthChangeEvent));
    }

    void Server::StartElection(
        const std::string& serviceGroup,
        uint64_t suitability,
        uint64_t term
    ) {
        impl_->StartElection(serviceGroup, suitability, term);
    }

    void Server::InsertService(Rumor::ServiceDetails service) {
        std::lock_guard< decltype(impl_->selfMutex) > lock(impl_->selfMutex);
        if (impl_->departed) {
            return;
        }
        service.memberId = impl_->selfId;
        service.tombstone = false;
        Rumor stored;
        if (
            impl_->rumorStore.Get(
                ServiceKey(service.serviceGroup, service.memberId),
                Rumor::Kind::Service,
                stored
            )
        ) {
            service.incarnation = std::max(
                service.incarnation,
                stored.service.incarnation + 1
            );
        }
        impl_->ownServices[service.serviceGroup] = service;
        (void)impl_->rumorStore.Insert(Rumor::MakeService(service));
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Registered in %s at %s:%u (incarnation %zu)",
            service.serviceGroup.c_str(),
            service.ip.c_str(),
            service.port,
            (size_t)service.incarnation
        );
    }

    void Server::RemoveService(const std::string& serviceGroup) {
        std::lock_guard< decltype(impl_->selfMutex) > lock(impl_->selfMutex);
        const auto ownServicesEntry = impl_->ownServices.find(serviceGroup);
        if (ownServicesEntry == impl_->ownServices.end()) {
            return;
        }
        auto tombstone = ownServicesEntry->second;
        impl_->ownServices.erase(ownServicesEntry);
        ++tombstone.incarnation;
        tombstone.tombstone = true;
        (void)impl_->rumorStore.Insert(Rumor::MakeService(tombstone));
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Withdrew from %s (incarnation %zu)",
            serviceGroup.c_str(),
            (size_t)tombstone.incarnation
        );
    }

    const RumorStore& Server::GetRumorStore() {
        return impl_->rumorStore;
    }

    Json::Value Server::GetStatistics() {
        return Json::Object({
            {"swimRounds", (size_t)impl_->swimRounds},
            {"gossipRounds", (size_t)impl_->gossipRounds},
            {"members", impl_->membershipList.GetSize()},
            {"rumors", impl_->rumorStore.GetSize()},
            {"messagesSent", (size_t)impl_->messagesSent},
            {"messagesReceived", (size_t)impl_->messagesReceived},
            {"messagesDropped", (size_t)impl_->messagesDropped},
            {"probesAcknowledged", (size_t)impl_->probesAcknowledged},
            {"probesFailed", (size_t)impl_->probesFailed},
        });
    }

}
