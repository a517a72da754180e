#ifndef SWIM_RUMOR_HPP
#define SWIM_RUMOR_HPP

/**
 * @file Rumor.hpp
 *
 * This module declares the Swim::Rumor structure.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Member.hpp"

#include <Json/Value.hpp>
#include <ostream>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

namespace SystemAbstractions {
    class IFile;
}

namespace Swim {

    /**
     * This is used to indicate how far an election for a service group has
     * progressed.  Values are declared in order of increasing precedence.
     */
    enum class ElectionStatus {
        /**
         * Votes are still being collected.
         */
        Running,

        /**
         * The candidate could not gather a quorum of votes in time.
         */
        NoQuorum,

        /**
         * A quorum of the group voted for the candidate.
         */
        Finished,
    };

    /**
     * This is a single versioned unit of state spread by gossip.  The kind
     * determines which of the detail structures is in use, and which rule
     * is used to merge two rumors with the same key.
     */
    struct Rumor {
        // Types

        /**
         * These are the kinds of rumors spread between servers.
         */
        enum class Kind {
            /**
             * This is the default kind, used for uninitialized rumors.
             */
            Unknown,

            /**
             * This identifies the rumor as carrying the health of a member.
             */
            Member,

            /**
             * This identifies the rumor as carrying the registration of a
             * member in a service group.
             */
            Service,

            /**
             * This identifies the rumor as carrying the state of an election
             * for a service group.
             */
            Election,
        };

        /**
         * This holds rumor properties for Member kind rumors.
         */
        struct MemberDetails {
            /**
             * This is the identity of the member.
             */
            Swim::Member member;

            /**
             * This is the health of the member at the member's incarnation.
             */
            Health health = Health::Alive;
        };

        /**
         * This holds rumor properties for Service kind rumors.
         */
        struct ServiceDetails {
            /**
             * This is the unique identifier of the member providing
             * the service.
             */
            std::string memberId;

            /**
             * This is the name of the service group.
             */
            std::string serviceGroup;

            /**
             * This is incremented whenever the registration changes.
             */
            uint64_t incarnation = 0;

            /**
             * This is the IP address at which the service is provided.
             */
            std::string ip;

            /**
             * This is the host name at which the service is provided.
             */
            std::string hostname;

            /**
             * This is the main port of the service.
             */
            unsigned int port = 0;

            /**
             * These are the ports exposed by the service.
             */
            std::vector< unsigned int > exposes;

            /**
             * This indicates that the member no longer provides the service.
             */
            bool tombstone = false;
        };

        /**
         * This holds rumor properties for Election kind rumors.
         */
        struct ElectionDetails {
            /**
             * This is the unique identifier of the candidate member.
             */
            std::string memberId;

            /**
             * This is the name of the service group holding the election.
             */
            std::string serviceGroup;

            /**
             * This is the generation of the election, incremented whenever
             * a new election is needed for the group.
             */
            uint64_t term = 0;

            /**
             * This measures how suitable the candidate is to lead the group.
             * Higher values are better.
             */
            uint64_t suitability = 0;

            /**
             * This is how far the election has progressed.
             */
            ElectionStatus status = ElectionStatus::Running;

            /**
             * These are the unique identifiers of the members who voted for
             * the candidate.
             */
            std::set< std::string > votes;
        };

        // Properties

        /**
         * This indicates which kind of rumor this is.
         */
        Kind kind = Kind::Unknown;

        /**
         * This is used if the kind is Kind::Member.
         */
        MemberDetails member;

        /**
         * This is used if the kind is Kind::Service.
         */
        ServiceDetails service;

        /**
         * This is used if the kind is Kind::Election.
         */
        ElectionDetails election;

        // Methods

        /**
         * Return the key which identifies the rumor within its kind.
         *
         * @return
         *     The key of the rumor is returned.
         */
        std::string GetKey() const;

        /**
         * Return a JSON rendering of the rumor, for diagnostics.
         *
         * @return
         *     A JSON rendering of the rumor is returned.
         */
        Json::Value Encode() const;

        /**
         * Write the rumor to the given buffer.
         *
         * @param[in,out] buffer
         *     This is the buffer to which to write the rumor.
         *
         * @return
         *     An indication of whether or not the rumor was written
         *     successfully is returned.
         */
        bool Serialize(SystemAbstractions::IFile* buffer) const;

        /**
         * Read the rumor from the given buffer.
         *
         * @param[in,out] buffer
         *     This is the buffer from which to read the rumor.
         *
         * @return
         *     An indication of whether or not the rumor was read
         *     successfully is returned.
         */
        bool Deserialize(SystemAbstractions::IFile* buffer);

        bool operator==(const Rumor& other) const;
        bool operator!=(const Rumor& other) const;

        // Factories

        static Rumor MakeMember(const Swim::Member& member, Health health);
        static Rumor MakeService(const ServiceDetails& service);
        static Rumor MakeElection(const ElectionDetails& election);
    };

    /**
     * Build the key under which the registration of the given member in the
     * given service group is stored.
     *
     * @param[in] serviceGroup
     *     This is the name of the service group.
     *
     * @param[in] memberId
     *     This is the unique identifier of the member.
     *
     * @return
     *     The key of the service rumor is returned.
     */
    std::string ServiceKey(
        const std::string& serviceGroup,
        const std::string& memberId
    );

    /**
     * Determine whether the first candidate is better suited to win an
     * election than the second.  Higher suitability wins, with ties broken
     * in favor of the lower member identifier.
     *
     * @param[in] left
     *     This is the first election to compare.
     *
     * @param[in] right
     *     This is the second election to compare.
     *
     * @return
     *     An indication of whether or not the first candidate beats the
     *     second is returned.
     */
    bool IsBetterCandidate(
        const Rumor::ElectionDetails& left,
        const Rumor::ElectionDetails& right
    );

    /**
     * Merge the incoming rumor into the stored one, using the merge rule of
     * the rumor kind.  The result does not depend on the order in which
     * rumors are merged, and merging the same rumor twice has no further
     * effect.
     *
     * @param[in,out] stored
     *     This is the rumor currently held, which is updated in place.
     *
     * @param[in] incoming
     *     This is the rumor received.  It must have the same kind and key
     *     as the stored rumor.
     *
     * @return
     *     An indication of whether or not the stored rumor changed
     *     is returned.
     */
    bool MergeRumor(
        Rumor& stored,
        const Rumor& incoming
    );

    std::string KindToString(Rumor::Kind kind);
    bool KindFromString(const std::string& kindAsString, Rumor::Kind& kind);
    std::string ElectionStatusToString(ElectionStatus status);

    void PrintTo(
        Rumor::Kind kind,
        std::ostream* os
    );

    void PrintTo(
        ElectionStatus status,
        std::ostream* os
    );

    void PrintTo(
        const Rumor& rumor,
        std::ostream* os
    );

}

#endif /* SWIM_RUMOR_HPP */
