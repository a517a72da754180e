#ifndef SWIM_I_SERVER_HPP
#define SWIM_I_SERVER_HPP

/**
 * @file IServer.hpp
 *
 * This module declares the Swim::IServer interface.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Member.hpp"
#include "MembershipList.hpp"
#include "Rumor.hpp"
#include "RumorStore.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <memory>
#include <ostream>
#include <stddef.h>
#include <string>

namespace Timekeeping {
    class Scheduler;
}

namespace Swim {

    /**
     * This is the interface to the Server component, which represents one
     * member of a gossip network.
     */
    class IServer {
        // Types
    public:
        /**
         * This selects which members are counted when deciding whether an
         * election candidate has gathered a quorum of votes.
         */
        enum class QuorumRule {
            /**
             * A majority of the electorate which has not departed is needed,
             * whether or not those members are currently reachable.
             */
            KnownMembers,

            /**
             * A majority of the electorate currently considered alive
             * is needed.
             */
            LiveMembers,
        };

        /**
         * This identifies the port on the receiver to which a message
         * should be delivered.
         */
        enum class Channel {
            /**
             * Probe messages (Ping, Ack, PingReq) use the receiver's
             * swim port.
             */
            Swim,

            /**
             * Gossip messages use the receiver's gossip port.
             */
            Gossip,
        };

        /**
         * This holds the properties which make up the configuration for
         * the server.
         */
        struct ServerConfiguration {
            /**
             * This is the network address other members use to reach
             * this server.
             */
            std::string address = "127.0.0.1";

            /**
             * This is the port on which the server receives probe messages.
             */
            int swimPort = 9638;

            /**
             * This is the port on which the server receives gossip messages.
             */
            int gossipPort = 9638;

            /**
             * This is the length of one failure detector protocol period,
             * in seconds.  One member is probed per period.
             */
            double protocolPeriod = 1.0;

            /**
             * This is how long to wait for the direct acknowledgment of a
             * probe before asking other members to probe indirectly,
             * in seconds.
             */
            double pingTimeout = 0.3;

            /**
             * This is the number of members asked to probe indirectly when
             * a direct probe goes unanswered.
             */
            size_t pingReqTargets = 3;

            /**
             * This is the number of protocol periods a member may stay
             * suspect before it is confirmed dead.
             */
            size_t suspicionPeriods = 3;

            /**
             * This is the length of one gossip round, in seconds.
             */
            double gossipInterval = 0.5;

            /**
             * This is the number of members to which rumors are pushed in
             * each gossip round.
             */
            size_t gossipFanout = 5;

            /**
             * This is the number of gossip rounds for which a changed rumor
             * keeps being pushed.
             */
            size_t rumorHeatRounds = 3;

            /**
             * Every this many gossip rounds, every stored rumor is pushed
             * rather than only the hot ones.  Zero disables this.
             */
            size_t antiEntropyRounds = 10;

            /**
             * This is the maximum number of membership rumors piggybacked
             * on each probe message.
             */
            size_t piggybackLimit = 8;

            /**
             * This is the number of gossip rounds a candidate waits for a
             * quorum before declaring that the election has no quorum.
             */
            size_t electionTimeoutRounds = 10;

            /**
             * This selects which members are counted toward the quorum of
             * an election.
             */
            QuorumRule quorumRule = QuorumRule::KnownMembers;

            /**
             * This is the default constructor.
             */
            ServerConfiguration() = default;

            /**
             * This constructs the configuration from its JSON encoding.
             * Items missing from the encoding keep their default values.
             *
             * @param[in] json
             *     This is the JSON encoding of the configuration.
             */
            ServerConfiguration(const Json::Value& json);

            /**
             * This method returns a JSON value which can be used to
             * construct a new configuration with the exact same contents
             * as this configuration.
             *
             * @return
             *     The JSON encoding of the configuration is returned.
             */
            operator Json::Value() const;
        };

        /**
         * This is the base type of any event published by the server.
         * All events will subclass this type and set the appropriate value
         * for the type field.
         */
        struct Event {
            /**
             * This is used to identify the subclass of the concrete event.
             */
            const enum class Type {
                /**
                 * This indicates the event is a request that a message be sent
                 * to another member of the network.
                 */
                SendMessage,

                /**
                 * This indicates the event announces that the health of a
                 * member, as seen by the server, changed.
                 */
                HealthChange,

                /**
                 * This indicates the event announces that the state of an
                 * election, as stored by the server, changed.
                 */
                ElectionChange,
            } type;

            /**
             * This is the constructor of the event.
             *
             * @param[in] type
             *     This is used to identify the subclass of the concrete event.
             */
            explicit Event(Type type) : type(type) {}
        };

        /**
         * This is an event published by the server.  It requests that a
         * message be sent to another member of the network.
         */
        struct SendMessageEvent : public Event {
            /**
             * This is the serialized message to send.
             */
            std::string serializedMessage;

            /**
             * This is the member to whom to send the message.
             */
            Member receiver;

            /**
             * This identifies the port of the receiver to which to send
             * the message.
             */
            Channel channel = Channel::Swim;

            /**
             * This is the default constructor.
             */
            SendMessageEvent()
                : Event(Type::SendMessage)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces that the
         * health of a member changed.
         */
        struct HealthChangeEvent : public Event {
            /**
             * This is the member whose health changed.
             */
            Member member;

            /**
             * This is the new health of the member.
             */
            Health health = Health::Alive;

            /**
             * This is the default constructor.
             */
            HealthChangeEvent()
                : Event(Type::HealthChange)
            {
            }
        };

        /**
         * This is an event published by the server.  It announces that the
         * stored state of an election changed.
         */
        struct ElectionChangeEvent : public Event {
            /**
             * This is the new state of the election.
             */
            Rumor::ElectionDetails election;

            /**
             * This is the default constructor.
             */
            ElectionChangeEvent()
                : Event(Type::ElectionChange)
            {
            }
        };

        /**
         * Declare the type of delegate used to deliver events published by the
         * server.
         *
         * @param[in] baseEvent
         *     This is a reference to the base of the event that was published.
         *     The delegate should look at the event's type and downcast
         *     the reference to the matching subtype for more details.
         */
        using EventDelegate = std::function<
            void(
                const Swim::IServer::Event& baseEvent
            )
        >;

        /**
         * Declare the type of delegate returned when a subscriber subscribes
         * to server events.  When called, this delegate cancels the
         * subscription.
         */
        using EventsUnsubscribeDelegate = std::function< void() >;

        // Methods
    public:
        /**
         * Subscribe to events published by the server.
         *
         * @param[in] eventDelegate
         *     This is the delegate to be called whenever an event
         *     is published by the server.
         *
         * @return
         *     A delegate that can be called to cancel the subscription
         *     is returned.
         */
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) = 0;

        /**
         * This method starts the periodic activities of the server: probing
         * other members and gossiping with them.
         *
         * @param[in] scheduler
         *     This is the object used to track time and call back
         *     the server when periodic activities are due.
         *
         * @param[in] serverConfiguration
         *     This holds the configuration items for the server.
         */
        virtual void Mobilize(
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const ServerConfiguration& serverConfiguration
        ) = 0;

        /**
         * This method stops the periodic activities of the server, and
         * stops its event worker thread.
         */
        virtual void Demobilize() = 0;

        /**
         * This method is called whenever the server receives a message
         * from another member.
         *
         * @param[in] serializedMessage
         *     This is the serialized message received.
         */
        virtual void ReceiveMessage(const std::string& serializedMessage) = 0;

        /**
         * Add or update a member in the membership list of the server,
         * bypassing probing.  This is how seed members are loaded.
         *
         * @param[in] member
         *     This is the member to add or update.
         *
         * @param[in] health
         *     This is the health to record for the member.
         *
         * @return
         *     An indication of whether or not the membership list
         *     changed is returned.
         */
        virtual bool InsertMember(
            const Member& member,
            Health health
        ) = 0;

        /**
         * Stop all communication with the given member, in both directions.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to exclude.
         */
        virtual void AddToBlacklist(const std::string& memberId) = 0;

        /**
         * Resume communication with the given member.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to include again.
         */
        virtual void RemoveFromBlacklist(const std::string& memberId) = 0;

        /**
         * Determine whether or not the given member is excluded from
         * communication.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member to check.
         *
         * @return
         *     An indication of whether or not the member is blacklisted
         *     is returned.
         */
        virtual bool IsBlacklisted(const std::string& memberId) = 0;

        /**
         * Look up the health of the given member, as seen by the server.
         *
         * @param[in] memberId
         *     This is the unique identifier of the member.
         *
         * @param[out] health
         *     This is where to store the health of the member, if known.
         *
         * @return
         *     An indication of whether or not the member is known
         *     is returned.
         */
        virtual bool HealthOf(
            const std::string& memberId,
            Health& health
        ) = 0;

        /**
         * Return the membership list of the server.
         */
        virtual const MembershipList& GetMembershipList() = 0;

        /**
         * Return the number of protocol periods the server completed.
         */
        virtual size_t GetSwimRounds() = 0;

        /**
         * Return the number of gossip rounds the server completed.
         */
        virtual size_t GetGossipRounds() = 0;

        /**
         * Suspend the periodic activities of the server, and ignore
         * received messages, until the server is resumed.
         */
        virtual void Pause() = 0;

        /**
         * Restart the periodic activities of a paused server.
         */
        virtual void Resume() = 0;

        /**
         * Determine whether or not the server is paused.
         */
        virtual bool IsPaused() = 0;

        /**
         * Announce that the server is leaving the network for good.  Its
         * service registrations are withdrawn and it stops probing.
         */
        virtual void Depart() = 0;

        /**
         * Put the server up as a candidate to lead the given service group.
         *
         * @param[in] serviceGroup
         *     This is the name of the service group holding the election.
         *
         * @param[in] suitability
         *     This measures how suitable the server is to lead the group.
         *     Higher values are better.
         *
         * @param[in] term
         *     This is the generation of the election.
         */
        virtual void StartElection(
            const std::string& serviceGroup,
            uint64_t suitability,
            uint64_t term
        ) = 0;

        /**
         * Register the server in a service group.  The member identifier of
         * the given registration is replaced by that of the server.
         *
         * @param[in] service
         *     This describes the service provided by the server.
         */
        virtual void InsertService(Rumor::ServiceDetails service) = 0;

        /**
         * Withdraw the registration of the server in a service group.
         *
         * @param[in] serviceGroup
         *     This is the name of the service group to leave.
         */
        virtual void RemoveService(const std::string& serviceGroup) = 0;

        /**
         * Return the store holding every rumor known by the server.
         */
        virtual const RumorStore& GetRumorStore() = 0;

        /**
         * Return collected statistics.
         *
         * @return
         *     Statistics collected by the server are returned.
         */
        virtual Json::Value GetStatistics() = 0;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Swim::IServer::QuorumRule class.
     *
     * @param[in] quorumRule
     *     This is the quorum rule value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     quorum rule value.
     */
    void PrintTo(
        IServer::QuorumRule quorumRule,
        std::ostream* os
    );

}

#endif /* SWIM_I_SERVER_HPP */
