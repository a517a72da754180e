/**
 * @file Rumor.cpp
 *
 * This module contains the implementation of the Swim::Rumor structure
 * methods, and the merge rules of each kind of rumor.
 *
 * © 2018-2020 by Richard Walters
 */

#include <algorithm>
#include <Json/Value.hpp>
#include <Serialization/SerializedBoolean.hpp>
#include <Serialization/SerializedInteger.hpp>
#include <Serialization/SerializedString.hpp>
#include <Serialization/SerializedUnsignedInteger.hpp>
#include <Swim/Rumor.hpp>
#include <SystemAbstractions/IFile.hpp>

namespace {

    constexpr int CURRENT_SERIALIZATION_VERSION = 1;

    /**
     * Merge two membership rumors about the same member.
     */
    bool MergeMember(
        Swim::Rumor::MemberDetails& stored,
        const Swim::Rumor::MemberDetails& incoming
    ) {
        if (
            !Swim::Supersedes(
                incoming.member.incarnation,
                incoming.health,
                stored.member.incarnation,
                stored.health
            )
        ) {
            return false;
        }
        stored = incoming;
        return true;
    }

    /**
     * Merge two registrations of the same member in the same service group.
     * A higher incarnation wins; at equal incarnations a tombstone wins.
     */
    bool MergeService(
        Swim::Rumor::ServiceDetails& stored,
        const Swim::Rumor::ServiceDetails& incoming
    ) {
        if (incoming.incarnation != stored.incarnation) {
            if (incoming.incarnation < stored.incarnation) {
                return false;
            }
        } else if (
            !incoming.tombstone
            || stored.tombstone
        ) {
            return false;
        }
        stored = incoming;
        return true;
    }

    /**
     * Merge two states of the election for the same service group.  A later
     * term wins, then the better candidate.  For the same candidate, the
     * further status and the union of the votes are kept.
     */
    bool MergeElection(
        Swim::Rumor::ElectionDetails& stored,
        const Swim::Rumor::ElectionDetails& incoming
    ) {
        if (incoming.term != stored.term) {
            if (incoming.term < stored.term) {
                return false;
            }
            stored = incoming;
            return true;
        }
        if (Swim::IsBetterCandidate(incoming, stored)) {
            stored = incoming;
            return true;
        }
        if (Swim::IsBetterCandidate(stored, incoming)) {
            return false;
        }
        bool changed = false;
        if ((int)incoming.status > (int)stored.status) {
            stored.status = incoming.status;
            changed = true;
        }
        for (const auto& vote: incoming.votes) {
            if (stored.votes.insert(vote).second) {
                changed = true;
            }
        }
        return changed;
    }

    bool SerializeString(
        SystemAbstractions::IFile* buffer,
        const std::string& value
    ) {
        Serialization::SerializedString stringField(value);
        return stringField.Serialize(buffer);
    }

    bool DeserializeString(
        SystemAbstractions::IFile* buffer,
        std::string& value
    ) {
        Serialization::SerializedString stringField;
        if (!stringField.Deserialize(buffer)) {
            return false;
        }
        value = stringField;
        return true;
    }

    bool SerializeUnsigned(
        SystemAbstractions::IFile* buffer,
        uint64_t value
    ) {
        Serialization::SerializedUnsignedInteger unsignedField(value);
        return unsignedField.Serialize(buffer);
    }

    template< typename T > bool DeserializeUnsigned(
        SystemAbstractions::IFile* buffer,
        T& value
    ) {
        Serialization::SerializedUnsignedInteger unsignedField;
        if (!unsignedField.Deserialize(buffer)) {
            return false;
        }
        value = (T)(uintmax_t)unsignedField;
        return true;
    }

}

namespace Swim {

    std::string Rumor::GetKey() const {
        switch (kind) {
            case Kind::Member: return member.member.id;
            case Kind::Service: return ServiceKey(service.serviceGroup, service.memberId);
            case Kind::Election: return election.serviceGroup;
            default: return "";
        }
    }

    Json::Value Rumor::Encode() const {
        auto json = Json::Object({
            {"kind", KindToString(kind)},
            {"key", GetKey()},
        });
        switch (kind) {
            case Kind::Member: {
                json["member"] = (Json::Value)member.member;
                json["health"] = HealthToString(member.health);
            } break;

            case Kind::Service: {
                auto exposes = Json::Array({});
                for (const auto port: service.exposes) {
                    exposes.Add((int)port);
                }
                json["memberId"] = service.memberId;
                json["serviceGroup"] = service.serviceGroup;
                json["incarnation"] = (size_t)service.incarnation;
                json["ip"] = service.ip;
                json["hostname"] = service.hostname;
                json["port"] = (int)service.port;
                json["exposes"] = std::move(exposes);
                json["tombstone"] = service.tombstone;
            } break;

            case Kind::Election: {
                auto votes = Json::Array({});
                for (const auto& vote: election.votes) {
                    votes.Add(vote);
                }
                json["memberId"] = election.memberId;
                json["serviceGroup"] = election.serviceGroup;
                json["term"] = (size_t)election.term;
                json["suitability"] = (size_t)election.suitability;
                json["status"] = ElectionStatusToString(election.status);
                json["votes"] = std::move(votes);
            } break;

            default: break;
        }
        return json;
    }

    bool Rumor::Serialize(SystemAbstractions::IFile* buffer) const {
        Serialization::SerializedInteger intField(CURRENT_SERIALIZATION_VERSION);
        if (!intField.Serialize(buffer)) {
            return false;
        }
        intField = (int)kind;
        if (!intField.Serialize(buffer)) {
            return false;
        }
        switch (kind) {
            case Kind::Member: {
                if (!member.member.Serialize(buffer)) {
                    return false;
                }
                intField = (int)member.health;
                if (!intField.Serialize(buffer)) {
                    return false;
                }
            } break;

            case Kind::Service: {
                if (
                    !SerializeString(buffer, service.memberId)
                    || !SerializeString(buffer, service.serviceGroup)
                    || !SerializeUnsigned(buffer, service.incarnation)
                    || !SerializeString(buffer, service.ip)
                    || !SerializeString(buffer, service.hostname)
                    || !SerializeUnsigned(buffer, service.port)
                    || !SerializeUnsigned(buffer, service.exposes.size())
                ) {
                    return false;
                }
                for (const auto port: service.exposes) {
                    if (!SerializeUnsigned(buffer, port)) {
                        return false;
                    }
                }
                Serialization::SerializedBoolean boolField(service.tombstone);
                if (!boolField.Serialize(buffer)) {
                    return false;
                }
            } break;

            case Kind::Election: {
                if (
                    !SerializeString(buffer, election.memberId)
                    || !SerializeString(buffer, election.serviceGroup)
                    || !SerializeUnsigned(buffer, election.term)
                    || !SerializeUnsigned(buffer, election.suitability)
                ) {
                    return false;
                }
                intField = (int)election.status;
                if (!intField.Serialize(buffer)) {
                    return false;
                }
                if (!SerializeUnsigned(buffer, election.votes.size())) {
                    return false;
                }
                for (const auto& vote: election.votes) {
                    if (!SerializeString(buffer, vote)) {
                        return false;
                    }
                }
            } break;

            default: return false;
        }
        return true;
    }

    bool Rumor::Deserialize(SystemAbstractions::IFile* buffer) {
        Serialization::SerializedInteger intField;
        if (!intField.Deserialize(buffer)) {
            return false;
        }
        if ((int)intField > CURRENT_SERIALIZATION_VERSION) {
            return false;
        }
        if (!intField.Deserialize(buffer)) {
            return false;
        }
        kind = (Kind)(int)intField;
        switch (kind) {
            case Kind::Member: {
                if (!member.member.Deserialize(buffer)) {
                    return false;
                }
                if (!intField.Deserialize(buffer)) {
                    return false;
                }
                const auto health = (int)intField;
                if (
                    (health < (int)Health::Alive)
                    || (health > (int)Health::Departed)
                ) {
                    return false;
                }
                member.health = (Health)health;
            } break;

            case Kind::Service: {
                size_t numExposes = 0;
                if (
                    !DeserializeString(buffer, service.memberId)
                    || !DeserializeString(buffer, service.serviceGroup)
                    || !DeserializeUnsigned(buffer, service.incarnation)
                    || !DeserializeString(buffer, service.ip)
                    || !DeserializeString(buffer, service.hostname)
                    || !DeserializeUnsigned(buffer, service.port)
                    || !DeserializeUnsigned(buffer, numExposes)
                ) {
                    return false;
                }
                service.exposes.clear();
                for (size_t i = 0; i < numExposes; ++i) {
                    unsigned int port = 0;
                    if (!DeserializeUnsigned(buffer, port)) {
                        return false;
                    }
                    service.exposes.push_back(port);
                }
                Serialization::SerializedBoolean boolField;
                if (!boolField.Deserialize(buffer)) {
                    return false;
                }
                service.tombstone = boolField;
            } break;

            case Kind::Election: {
                if (
                    !DeserializeString(buffer, election.memberId)
                    || !DeserializeString(buffer, election.serviceGroup)
                    || !DeserializeUnsigned(buffer, election.term)
                    || !DeserializeUnsigned(buffer, election.suitability)
                ) {
                    return false;
                }
                if (!intField.Deserialize(buffer)) {
                    return false;
                }
                const auto status = (int)intField;
                if (
                    (status < (int)ElectionStatus::Running)
                    || (status > (int)ElectionStatus::Finished)
                ) {
                    return false;
                }
                election.status = (ElectionStatus)status;
                size_t numVotes = 0;
                if (!DeserializeUnsigned(buffer, numVotes)) {
                    return false;
                }
                election.votes.clear();
                for (size_t i = 0; i < numVotes; ++i) {
                    std::string vote;
                    if (!DeserializeString(buffer, vote)) {
                        return false;
                    }
                    (void)election.votes.insert(std::move(vote));
                }
            } break;

            default: return false;
        }
        return true;
    }

    bool Rumor::operator==(const Rumor& other) const {
        if (kind != other.kind) {
            return false;
        }
        switch (kind) {
            case Kind::Member: {
                return (
                    (member.member == other.member.member)
                    && (member.health == other.member.health)
                );
            }

            case Kind::Service: {
                return (
                    (service.memberId == other.service.memberId)
                    && (service.serviceGroup == other.service.serviceGroup)
                    && (service.incarnation == other.service.incarnation)
                    && (service.ip == other.service.ip)
                    && (service.hostname == other.service.hostname)
                    && (service.port == other.service.port)
                    && (service.exposes == other.service.exposes)
                    && (service.tombstone == other.service.tombstone)
                );
            }

            case Kind::Election: {
                return (
                    (election.memberId == other.election.memberId)
                    && (election.serviceGroup == other.election.serviceGroup)
                    && (election.term == other.election.term)
                    && (election.suitability == other.election.suitability)
                    && (election.status == other.election.status)
                    && (election.votes == other.election.votes)
                );
            }

            default: return true;
        }
    }

    bool Rumor::operator!=(const Rumor& other) const {
        return !(*this == other);
    }

    Rumor Rumor::MakeMember(const Swim::Member& member, Health health) {
        Rumor rumor;
        rumor.kind = Kind::Member;
        rumor.member.member = member;
        rumor.member.health = health;
        return rumor;
    }

    Rumor Rumor::MakeService(const ServiceDetails& service) {
        Rumor rumor;
        rumor.kind = Kind::Service;
        rumor.service = service;
        return rumor;
    }

    Rumor Rumor::MakeElection(const ElectionDetails& election) {
        Rumor rumor;
        rumor.kind = Kind::Election;
        rumor.election = election;
        return rumor;
    }

    std::string ServiceKey(
        const std::string& serviceGroup,
        const std::string& memberId
    ) {
        return serviceGroup + "/" + memberId;
    }

    bool IsBetterCandidate(
        const Rumor::ElectionDetails& left,
        const Rumor::ElectionDetails& right
    ) {
        if (left.suitability != right.suitability) {
            return (left.suitability > right.suitability);
        }
        return (left.memberId < right.memberId);
    }

    bool MergeRumor(
        Rumor& stored,
        const Rumor& incoming
    ) {
        if (stored.kind != incoming.kind) {
            return false;
        }
        switch (stored.kind) {
            case Rumor::Kind::Member: return MergeMember(stored.member, incoming.member);
            case Rumor::Kind::Service: return MergeService(stored.service, incoming.service);
            case Rumor::Kind::Election: return MergeElection(stored.election, incoming.election);
            default: return false;
        }
    }

    std::string KindToString(Rumor::Kind kind) {
        switch (kind) {
            case Rumor::Kind::Member: return "member";
            case Rumor::Kind::Service: return "service";
            case Rumor::Kind::Election: return "election";
            default: return "???";
        }
    }

    bool KindFromString(const std::string& kindAsString, Rumor::Kind& kind) {
        if (kindAsString == "member") {
            kind = Rumor::Kind::Member;
        } else if (kindAsString == "service") {
            kind = Rumor::Kind::Service;
        } else if (kindAsString == "election") {
            kind = Rumor::Kind::Election;
        } else {
            return false;
        }
        return true;
    }

    std::string ElectionStatusToString(ElectionStatus status) {
        switch (status) {
            case ElectionStatus::Running: return "Running";
            case ElectionStatus::NoQuorum: return "NoQuorum";
            case ElectionStatus::Finished: return "Finished";
            default: return "???";
        }
    }

    void PrintTo(
        Rumor::Kind kind,
        std::ostream* os
    ) {
        *os << KindToString(kind);
    }

    void PrintTo(
        ElectionStatus status,
        std::ostream* os
    ) {
        *os << ElectionStatusToString(status);
    }

    void PrintTo(
        const Rumor& rumor,
        std::ostream* os
    ) {
        *os << rumor.Encode().ToEncoding();
    }

}
