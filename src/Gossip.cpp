/**
 * @file Gossip.cpp
 *
 * This module contains the methods of the Swim::Server::Impl structure
 * which make up the gossip disseminator.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ServerImpl.hpp"
#include "Utilities.hpp"

namespace Swim {

    void Server::Impl::ScheduleGossipRound() {
        if (gossipRoundToken) {
            scheduler->Cancel(gossipRoundToken);
        }
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        const size_t thisGeneration = generation;
        gossipRoundToken = scheduler->Schedule(
            [weakImpl, thisGeneration]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->gossipMutex) > lock(impl->gossipMutex);
                if (!impl->IsCurrent(thisGeneration)) {
                    return;
                }
                impl->gossipRoundToken = 0;
                if (impl->paused) {
                    return;
                }
                impl->OnGossipRound();
            },
            timing->NextGossipRound()
        );
    }

    void Server::Impl::OnGossipRound() {
        UpdateElections();
        const size_t round = gossipRounds;
        const auto antiEntropyRounds = serverConfiguration.antiEntropyRounds;
        const bool antiEntropy = (
            (antiEntropyRounds > 0)
            && ((round + 1) % antiEntropyRounds == 0)
        );
        Message gossip;
        gossip.type = Message::Type::Gossip;
        gossip.rumors = (
            antiEntropy
            ? rumorStore.GetAllRumors()
            : rumorStore.GetHotRumors()
        );
        if (!gossip.rumors.empty()) {
            auto peers = membershipList.Each(
                [this](const MembershipList::Entry& entry){
                    return (
                        (entry.member.id != selfId)
                        && (entry.health == Health::Alive)
                    );
                }
            );
            peers.erase(
                std::remove_if(
                    peers.begin(),
                    peers.end(),
                    [this](const MembershipList::Entry& entry){
                        return IsBlacklisted(entry.member.id);
                    }
                ),
                peers.end()
            );
            peers = PickRandom(peers, serverConfiguration.gossipFanout, gossipRng);
            if (!peers.empty()) {
                gossip.from = GetSelf();
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    1,
                    "Gossip round %zu: pushing %zu %s rumor(s) to %zu member(s)",
                    round,
                    gossip.rumors.size(),
                    (antiEntropy ? "known" : "hot"),
                    peers.size()
                );
                for (const auto& peer: peers) {
                    QueueMessageToBeSent(gossip, peer.member, IServer::Channel::Gossip);
                }
            }
        }
        rumorStore.CoolDown();
        ScheduleGossipRound();
        ++gossipRounds;
    }

    void Server::Impl::OnReceiveGossip(Message&& message) {
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Gossip from %s carrying %zu rumor(s)",
            message.from.id.c_str(),
            message.rumors.size()
        );
        (void)MergeMemberRumor(Rumor::MakeMember(message.from, Health::Alive));
        for (const auto& rumor: message.rumors) {
            MergeRumor(rumor);
        }
    }

}
