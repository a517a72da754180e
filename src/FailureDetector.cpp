/**
 * @file FailureDetector.cpp
 *
 * This module contains the methods of the Swim::Server::Impl structure
 * which make up the failure detector: the protocol period, direct and
 * indirect probes, and the escalation of suspicion.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ServerImpl.hpp"
#include "Utilities.hpp"

namespace Swim {

    void Server::Impl::ScheduleProbePeriod() {
        if (probePeriodToken) {
            scheduler->Cancel(probePeriodToken);
        }
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const size_t thisGeneration = generation;
        probePeriodToken = scheduler->Schedule(
            [weakImpl, thisGeneration]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->probeMutex) > lock(impl->probeMutex);
                if (!impl->IsCurrent(thisGeneration)) {
                    return;
                }
                impl->probePeriodToken = 0;
                if (impl->paused) {
                    return;
                }
                impl->OnProbePeriodEnd();
            },
            timing->NextProtocolPeriod()
        );
    }

    void Server::Impl::OnProbePeriodEnd() {
        if (probe.pingTimeoutToken) {
            scheduler->Cancel(probe.pingTimeoutToken);
            probe.pingTimeoutToken = 0;
        }
        if (probe.active) {
            if (probe.acknowledged) {
                ++probesAcknowledged;
            } else {
                ++probesFailed;
                MembershipList::Entry entry;
                if (
                    membershipList.Find(probe.target.id, entry)
                    && (entry.health == Health::Alive)
                ) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        2,
                        "Probe %u of %s went unanswered%s",
                        probe.seq,
                        entry.member.id.c_str(),
                        (probe.indirect ? " (including indirect probes)" : "")
                    );
                    (void)ApplyMemberRumor(
                        Rumor::MakeMember(entry.member, Health::Suspect)
                    );
                }
            }
            probe.active = false;
        }
        EscalateSuspicions();
        if (!departed) {
            StartProbe();
        }
        ScheduleProbePeriod();
        ++swimRounds;
    }

    void Server::Impl::StartProbe() {
        probe = ProbeInfo();
        const auto candidates = membershipList.Each(
            [this](const MembershipList::Entry& entry){
                return (
                    (entry.member.id != selfId)
                    && (
                        (entry.health != Health::Departed)
                        || entry.member.persistent
                    )
                );
            }
        );
        if (candidates.empty()) {
            return;
        }
        const auto target = PickRandom(candidates, 1, probeRng)[0].member;
        probe.active = true;
        probe.target = target;
        probe.seq = ++lastSeq;
        probe.timeSent = scheduler->GetClock()->GetCurrentTime();
        Message ping;
        ping.type = Message::Type::Ping;
        ping.from = GetSelf();
        ping.seq = probe.seq;
        ping.rumors = GetPiggybackRumors(target.id);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Probe %u: Ping -> %s",
            probe.seq,
            target.id.c_str()
        );
        QueueMessageToBeSent(ping, target, IServer::Channel::Swim);
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const size_t thisGeneration = generation;
        const auto seq = probe.seq;
        probe.pingTimeoutToken = scheduler->Schedule(
            [weakImpl, thisGeneration, seq]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->probeMutex) > lock(impl->probeMutex);
                if (!impl->IsCurrent(thisGeneration)) {
                    return;
                }
                if (impl->probe.seq == seq) {
                    impl->probe.pingTimeoutToken = 0;
                }
                if (impl->paused) {
                    return;
                }
                impl->OnPingTimeout(seq);
            },
            timing->NextPingTimeout()
        );
    }

    void Server::Impl::OnPingTimeout(unsigned int seq) {
        if (
            !probe.active
            || (probe.seq != seq)
            || probe.acknowledged
        ) {
            return;
        }
        probe.indirect = true;
        const auto& targetId = probe.target.id;
        auto relays = membershipList.Each(
            [this, targetId](const MembershipList::Entry& entry){
                return (
                    (entry.member.id != selfId)
                    && (entry.member.id != targetId)
                    && (entry.health == Health::Alive)
                );
            }
        );
        relays.erase(
            std::remove_if(
                relays.begin(),
                relays.end(),
                [this](const MembershipList::Entry& entry){
                    return IsBlacklisted(entry.member.id);
                }
            ),
            relays.end()
        );
        relays = PickRandom(relays, serverConfiguration.pingReqTargets, probeRng);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Probe %u: no Ack from %s; asking %zu member(s) to probe it",
            seq,
            targetId.c_str(),
            relays.size()
        );
        if (relays.empty()) {
            return;
        }
        Message pingReq;
        pingReq.type = Message::Type::PingReq;
        pingReq.from = GetSelf();
        pingReq.seq = seq;
        pingReq.target = probe.target;
        pingReq.rumors = GetPiggybackRumors(targetId);
        for (const auto& relay: relays) {
            QueueMessageToBeSent(pingReq, relay.member, IServer::Channel::Swim);
        }
    }

    void Server::Impl::EscalateSuspicions() {
        const auto suspects = membershipList.Each(
            [](const MembershipList::Entry& entry){
                return (entry.health == Health::Suspect);
            }
        );
        const size_t now = swimRounds;
        decltype(suspicions) stillSuspected;
        for (const auto& suspect: suspects) {
            const auto& member = suspect.member;
            SuspicionInfo suspicion;
            const auto suspicionsEntry = suspicions.find(member.id);
            if (
                (suspicionsEntry == suspicions.end())
                || (suspicionsEntry->second.incarnation != member.incarnation)
            ) {
                suspicion.incarnation = member.incarnation;
                suspicion.since = now;
            } else {
                suspicion = suspicionsEntry->second;
            }
            if (now - suspicion.since >= serverConfiguration.suspicionPeriods) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    3,
                    "Member %s suspected for %zu periods; confirming",
                    member.id.c_str(),
                    now - suspicion.since
                );
                (void)ApplyMemberRumor(
                    Rumor::MakeMember(member, Health::Confirmed)
                );
            } else {
                stillSuspected[member.id] = suspicion;
            }
        }
        suspicions.swap(stillSuspected);
    }

    std::vector< Rumor > Server::Impl::GetPiggybackRumors(const std::string& about) {
        std::vector< Rumor > rumors;
        for (const auto& rumor: rumorStore.GetHotRumors()) {
            if (rumors.size() >= serverConfiguration.piggybackLimit) {
                break;
            }
            if (
                (rumor.kind == Rumor::Kind::Member)
                && (rumor.member.member.id != about)
            ) {
                rumors.push_back(rumor);
            }
        }
        MembershipList::Entry entry;
        if (
            !about.empty()
            && membershipList.Find(about, entry)
        ) {
            rumors.push_back(Rumor::MakeMember(entry.member, entry.health));
        }
        return rumors;
    }

    void Server::Impl::OnReceivePing(Message&& message) {
        MergeMessageMembership(message);
        Message ack;
        ack.type = Message::Type::Ack;
        ack.from = GetSelf();
        ack.forwardTo = message.forwardTo;
        ack.seq = message.seq;
        ack.rumors = GetPiggybackRumors(message.from.id);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Ping %u from %s; sending Ack%s",
            message.seq,
            message.from.id.c_str(),
            (message.IsForwarded() ? " to be forwarded" : "")
        );
        QueueMessageToBeSent(ack, message.from, IServer::Channel::Swim);
    }

    void Server::Impl::OnReceiveAck(Message&& message) {
        MergeMessageMembership(message);
        if (
            message.IsForwarded()
            && (message.forwardTo.id != selfId)
        ) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Forwarding Ack %u from %s to %s",
                message.seq,
                message.from.id.c_str(),
                message.forwardTo.id.c_str()
            );
            QueueMessageToBeSent(message, message.forwardTo, IServer::Channel::Swim);
            return;
        }
        if (
            !probe.active
            || probe.acknowledged
            || (message.seq != probe.seq)
            || (message.from.id != probe.target.id)
        ) {
            return;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Probe %u: Ack from %s%s",
            message.seq,
            message.from.id.c_str(),
            (message.IsForwarded() ? " (indirect)" : "")
        );
        probe.acknowledged = true;
        if (probe.pingTimeoutToken) {
            scheduler->Cancel(probe.pingTimeoutToken);
            probe.pingTimeoutToken = 0;
        }
    }

    void Server::Impl::OnReceivePingReq(Message&& message) {
        MergeMessageMembership(message);
        Message ping;
        ping.type = Message::Type::Ping;
        ping.from = GetSelf();
        ping.forwardTo = message.from;
        ping.seq = message.seq;
        ping.rumors = GetPiggybackRumors(message.target.id);
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "PingReq %u from %s; pinging %s",
            message.seq,
            message.from.id.c_str(),
            message.target.id.c_str()
        );
        QueueMessageToBeSent(ping, message.target, IServer::Channel::Swim);
    }

}
