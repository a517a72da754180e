/**
 * @file Elections.cpp
 *
 * This module contains the methods of the Swim::Server::Impl structure
 * which make up the election engine for service groups.
 *
 * © 2018-2020 by Richard Walters
 */

#include "ServerImpl.hpp"
#include "Utilities.hpp"

namespace Swim {

    std::set< std::string > Server::Impl::GetElectorate(const std::string& serviceGroup) {
        std::set< std::string > electorate;
        rumorStore.Each(
            Rumor::Kind::Service,
            [serviceGroup, &electorate](const Rumor& rumor){
                if (
                    (rumor.service.serviceGroup == serviceGroup)
                    && !rumor.service.tombstone
                ) {
                    (void)electorate.insert(rumor.service.memberId);
                }
            }
        );
        if (electorate.empty()) {
            for (const auto& entry: membershipList.Each()) {
                (void)electorate.insert(entry.member.id);
            }
        }
        return electorate;
    }

    size_t Server::Impl::GetQuorum(const std::set< std::string >& electorate) {
        size_t counted = 0;
        for (const auto& memberId: electorate) {
            Health health;
            if (!membershipList.HealthOf(memberId, health)) {
                continue;
            }
            switch (serverConfiguration.quorumRule) {
                case IServer::QuorumRule::LiveMembers: {
                    if (health == Health::Alive) {
                        ++counted;
                    }
                } break;

                case IServer::QuorumRule::KnownMembers:
                default: {
                    if (health != Health::Departed) {
                        ++counted;
                    }
                } break;
            }
        }
        return counted / 2 + 1;
    }

    bool Server::Impl::InsertElection(const Rumor::ElectionDetails& election) {
        std::lock_guard< decltype(electionMutex) > lock(electionMutex);
        if (!rumorStore.Insert(Rumor::MakeElection(election))) {
            return false;
        }
        Rumor stored;
        if (!rumorStore.Get(election.serviceGroup, Rumor::Kind::Election, stored)) {
            return false;
        }
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Election for %s (term %zu): candidate %s (suitability %zu) %s with votes %s",
            stored.election.serviceGroup.c_str(),
            (size_t)stored.election.term,
            stored.election.memberId.c_str(),
            (size_t)stored.election.suitability,
            ElectionStatusToString(stored.election.status).c_str(),
            FormatSet(stored.election.votes).c_str()
        );
        const auto electionChangeEvent = std::make_shared< ElectionChangeEvent >();
        electionChangeEvent->election = stored.election;
        AddToEventQueue(std::move(electionChangeEvent));
        return true;
    }

    void Server::Impl::UpdateElection(const std::string& serviceGroup) {
        std::lock_guard< decltype(electionMutex) > lock(electionMutex);
        if (departed) {
            return;
        }
        Rumor stored;
        if (!rumorStore.Get(serviceGroup, Rumor::Kind::Election, stored)) {
            return;
        }
        auto election = stored.election;

        // Stand again if the candidate is gone, whatever became of its
        // election.  Without a suitability to stand with, settle a
        // running election as NoQuorum instead.
        Health candidateHealth;
        if (
            (election.memberId != selfId)
            && membershipList.HealthOf(election.memberId, candidateHealth)
            && (
                (candidateHealth == Health::Confirmed)
                || (candidateHealth == Health::Departed)
            )
        ) {
            const auto suitabilitiesEntry = suitabilities.find(serviceGroup);
            if (suitabilitiesEntry != suitabilities.end()) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    3,
                    "Candidate %s of %s (%s) is %s; starting term %zu",
                    election.memberId.c_str(),
                    serviceGroup.c_str(),
                    ElectionStatusToString(election.status).c_str(),
                    HealthToString(candidateHealth).c_str(),
                    (size_t)(election.term + 1)
                );
                StartElection(serviceGroup, suitabilitiesEntry->second, election.term + 1);
            } else if (election.status == ElectionStatus::Running) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    3,
                    "Candidate %s of %s is %s; election has no quorum",
                    election.memberId.c_str(),
                    serviceGroup.c_str(),
                    HealthToString(candidateHealth).c_str()
                );
                election.status = ElectionStatus::NoQuorum;
                (void)InsertElection(election);
            }
            return;
        }

        const auto electorate = GetElectorate(serviceGroup);
        bool changed = false;
        if (
            (electorate.find(selfId) != electorate.end())
            && (election.votes.find(selfId) == election.votes.end())
        ) {
            (void)election.votes.insert(selfId);
            changed = true;
        }
        if (election.memberId == selfId) {
            auto candidaciesEntry = candidacies.find(serviceGroup);
            if (
                (candidaciesEntry == candidacies.end())
                || (candidaciesEntry->second.term != election.term)
            ) {
                CandidacyInfo candidacy;
                candidacy.term = election.term;
                candidacy.since = gossipRounds;
                candidacies[serviceGroup] = candidacy;
                candidaciesEntry = candidacies.find(serviceGroup);
            }
            if (election.status != ElectionStatus::Finished) {
                size_t votes = 0;
                for (const auto& voter: election.votes) {
                    if (electorate.find(voter) != electorate.end()) {
                        ++votes;
                    }
                }
                const size_t roundsRunning = gossipRounds - candidaciesEntry->second.since;
                if (votes >= GetQuorum(electorate)) {
                    election.status = ElectionStatus::Finished;
                    changed = true;
                } else if (
                    (election.status == ElectionStatus::Running)
                    && (roundsRunning >= serverConfiguration.electionTimeoutRounds)
                ) {
                    election.status = ElectionStatus::NoQuorum;
                    changed = true;
                }
            }
        }
        if (changed) {
            (void)InsertElection(election);
        }
    }

    void Server::Impl::UpdateElections() {
        std::lock_guard< decltype(electionMutex) > lock(electionMutex);
        std::vector< std::string > serviceGroups;
        rumorStore.Each(
            Rumor::Kind::Election,
            [&serviceGroups](const Rumor& rumor){
                serviceGroups.push_back(rumor.election.serviceGroup);
            }
        );
        for (const auto& serviceGroup: serviceGroups) {
            UpdateElection(serviceGroup);
        }
    }

    void Server::Impl::StartElection(
        const std::string& serviceGroup,
        uint64_t suitability,
        uint64_t term
    ) {
        std::lock_guard< decltype(electionMutex) > lock(electionMutex);
        if (departed) {
            return;
        }
        suitabilities[serviceGroup] = suitability;
        Rumor::ElectionDetails election;
        election.memberId = selfId;
        election.serviceGroup = serviceGroup;
        election.term = term;
        election.suitability = suitability;
        election.status = ElectionStatus::Running;
        (void)election.votes.insert(selfId);
        CandidacyInfo candidacy;
        candidacy.term = term;
        candidacy.since = gossipRounds;
        candidacies[serviceGroup] = candidacy;
        diagnosticsSender.SendDiagnosticInformationFormatted(
            3,
            "Standing for election in %s (term %zu, suitability %zu)",
            serviceGroup.c_str(),
            (size_t)term,
            (size_t)suitability
        );
        (void)InsertElection(election);
        UpdateElection(serviceGroup);
    }

}
