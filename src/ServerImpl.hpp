#pragma once

/**
 * @file ServerImpl.hpp
 *
 * This module contains the implementation of the Swim::Server class.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Message.hpp"
#include "ProbeInfo.hpp"

#include <atomic>
#include <AsyncData/MultiProducerSingleConsumerQueue.hpp>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stdint.h>
#include <string>
#include <Swim/MembershipList.hpp>
#include <Swim/RumorStore.hpp>
#include <Swim/Server.hpp>
#include <Swim/Timing.hpp>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <Timekeeping/Scheduler.hpp>
#include <thread>
#include <vector>

namespace Swim {

    /**
     * This contains the private properties of a Server class instance.
     *
     * State is guarded per structure.  Locks are always taken in this order:
     * mutex, probeMutex, gossipMutex, electionMutex, selfMutex, and then the
     * locks internal to the membership list, the rumor store, the blacklist
     * and the event queue.  No lock is held while events are delivered.
     */
    struct Server::Impl
        : std::enable_shared_from_this< Impl >
    {
        // Types

        /**
         * This holds what the server tracks about an election in which it
         * is the candidate.
         */
        struct CandidacyInfo {
            /**
             * This is the term of the election.
             */
            uint64_t term = 0;

            /**
             * This is the gossip round count at which the server noticed it
             * was the candidate in this term.
             */
            size_t since = 0;
        };

        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is the human-readable name of the server.
         */
        const std::string name;

        /**
         * This is the unique identifier of the server.
         */
        const std::string selfId;

        /**
         * This is used to synchronize the lifecycle of the server:
         * mobilizing, demobilizing, pausing and resuming.
         */
        std::recursive_mutex mutex;

        std::atomic< bool > mobilized{false};

        std::atomic< bool > paused{false};

        std::atomic< size_t > generation{0};

        /**
         * This holds all configuration items for the server.
         *
         * It is only changed while holding mutex, probeMutex, gossipMutex
         * and electionMutex, so holding any one of them is enough to read it.
         */
        IServer::ServerConfiguration serverConfiguration;

        /**
         * This is the object used to track time for the server
         * and call back functions at specific times.
         *
         * It is guarded the same way as serverConfiguration.
         */
        std::shared_ptr< Timekeeping::Scheduler > scheduler;

        /**
         * This computes when periodic activities are due.
         *
         * It is guarded the same way as serverConfiguration.
         */
        std::shared_ptr< Timing > timing;

        /**
         * This is used to synchronize access to the failure detector state
         * below.
         */
        std::mutex probeMutex;

        /**
         * This is the scheduler token for the callback that happens
         * at the end of the current protocol period.
         */
        int probePeriodToken = 0;

        /**
         * This holds what the server tracks about its current probe.
         */
        ProbeInfo probe;

        /**
         * This is the sequence number of the last probe sent.
         */
        unsigned int lastSeq = 0;

        /**
         * These are the members the server currently suspects, keyed by
         * member identifier.
         */
        std::map< std::string, SuspicionInfo > suspicions;

        /**
         * This is a standard C++ Mersenne Twister pseudo-random number
         * generator, used to pick members to probe.
         */
        std::mt19937 probeRng;

        /**
         * This is used to synchronize access to the gossip state below.
         */
        std::mutex gossipMutex;

        /**
         * This is the scheduler token for the callback that happens
         * at the end of the current gossip round.
         */
        int gossipRoundToken = 0;

        /**
         * This is a standard C++ Mersenne Twister pseudo-random number
         * generator, used to pick members to gossip with.
         */
        std::mt19937 gossipRng;

        /**
         * This is used to synchronize access to the election bookkeeping
         * below.
         */
        std::recursive_mutex electionMutex;

        /**
         * These are the suitabilities the server announced for the service
         * groups in which it stood for election, keyed by service group.
         */
        std::map< std::string, uint64_t > suitabilities;

        /**
         * These track the elections in which the server is the candidate,
         * keyed by service group.
         */
        std::map< std::string, CandidacyInfo > candidacies;

        /**
         * This is used to synchronize access to the self properties below.
         */
        std::mutex selfMutex;

        /**
         * This is the identity record the server advertises for itself.
         */
        Member self;

        /**
         * This indicates whether or not the server left the network.
         */
        std::atomic< bool > departed{false};

        /**
         * These are the service registrations of the server, keyed by
         * service group.
         */
        std::map< std::string, Rumor::ServiceDetails > ownServices;

        /**
         * This is the server's view of every member it knows about.
         */
        MembershipList membershipList;

        /**
         * This holds every rumor known by the server.
         */
        RumorStore rumorStore;

        /**
         * This is used to synchronize access to the blacklist.
         */
        std::mutex blacklistMutex;

        /**
         * These are the identifiers of the members with which the server
         * does not communicate.
         */
        std::set< std::string > blacklist;

        std::atomic< size_t > swimRounds{0};

        std::atomic< size_t > gossipRounds{0};

        std::atomic< size_t > messagesSent{0};

        std::atomic< size_t > messagesReceived{0};

        std::atomic< size_t > messagesDropped{0};

        std::atomic< size_t > probesAcknowledged{0};

        std::atomic< size_t > probesFailed{0};

        /**
         * This is the next identifier to use for an event subscription.
         */
        int nextEventSubscriberId = 0;

        /**
         * These are the current subscriptions to server events.
         *
         * This is guarded by eventQueueMutex.
         */
        std::map< int, IServer::EventDelegate > eventSubscribers;

        /**
         * This holds events to be published by the server in its worker
         * thread.
         */
        AsyncData::MultiProducerSingleConsumerQueue<
            std::shared_ptr< IServer::Event >
        > eventQueue;

        /**
         * This thread publishes any events in the event queue.
         */
        std::thread eventQueueWorker;

        /**
         * This is notified whenever the event queue is no longer empty,
         * and when the event queue worker thread should stop.
         */
        std::condition_variable eventQueueWorkerWakeCondition;

        /**
         * This is used to synchronize access to the event queue worker thread.
         */
        std::mutex eventQueueMutex;

        /**
         * This indicates whether or not the event queue worker thread should
         * stop.
         */
        bool stopEventQueueWorker = false;

        // Methods

        /**
         * This is the constructor of the class.
         *
         * @param[in] name
         *     This is the human-readable name of the server.
         */
        explicit Impl(const std::string& name);

        /**
         * Return a copy of the identity record the server advertises
         * for itself.
         */
        Member GetSelf();

        bool IsBlacklisted(const std::string& memberId);

        /**
         * Determine whether or not a timer callback scheduled in the given
         * generation should still do its work.
         *
         * @param[in] thisGeneration
         *     This is the generation in which the callback was scheduled.
         *
         * @return
         *     An indication of whether or not the callback is still
         *     current is returned.
         */
        bool IsCurrent(size_t thisGeneration) const;

        /**
         * Queue a request to send the given message to the given member,
         * unless the member is blacklisted.
         *
         * @param[in] message
         *     This is the message to send.
         *
         * @param[in] receiver
         *     This is the member to whom to send the message.
         *
         * @param[in] channel
         *     This identifies the port of the receiver to use.
         */
        void QueueMessageToBeSent(
            const Message& message,
            const Member& receiver,
            IServer::Channel channel
        );

        void AddToEventQueue(std::shared_ptr< IServer::Event >&& event);

        /**
         * Empty out the event queue, processing each event in order.
         *
         * @param[in] lock
         *     This is the object holding the mutex protecting the
         *     event queue.
         */
        void ProcessEventQueue(
            std::unique_lock< decltype(eventQueueMutex) >& lock
        );

        /**
         * This runs in a thread which publishes any events pushed into
         * the event queue.
         */
        void EventQueueWorker();

        /**
         * Merge a membership rumor received from another member, or
         * produced locally.  Rumors about the server itself are turned into
         * refutations, and rumors about blacklisted members are ignored.
         *
         * @param[in] rumor
         *     This is the membership rumor to merge.
         *
         * @return
         *     An indication of whether or not the membership list
         *     changed is returned.
         */
        bool MergeMemberRumor(const Rumor& rumor);

        /**
         * Apply a membership rumor to the membership list and the rumor
         * store, without any filtering.  This is how the failure detector
         * records its own findings.
         *
         * @param[in] rumor
         *     This is the membership rumor to apply.
         *
         * @return
         *     An indication of whether or not the membership list
         *     changed is returned.
         */
        bool ApplyMemberRumor(const Rumor& rumor);

        /**
         * Handle a membership rumor about the server itself.
         *
         * @param[in] rumor
         *     This is the membership rumor about the server.
         *
         * @return
         *     An indication of whether or not the server had to refute the
         *     rumor is returned.
         */
        bool MergeSelfRumor(const Rumor& rumor);

        /**
         * Merge a service rumor, re-asserting the server's own registration
         * if the rumor withdraws it without the server's consent.
         *
         * @param[in] rumor
         *     This is the service rumor to merge.
         *
         * @return
         *     An indication of whether or not the rumor store
         *     changed is returned.
         */
        bool MergeServiceRumor(const Rumor& rumor);

        /**
         * Merge an election rumor, and then update the election according
         * to the new state.
         *
         * @param[in] rumor
         *     This is the election rumor to merge.
         *
         * @return
         *     An indication of whether or not the rumor store
         *     changed is returned.
         */
        bool MergeElectionRumor(const Rumor& rumor);

        /**
         * Merge any kind of rumor received from another member.
         *
         * @param[in] rumor
         *     This is the rumor to merge.
         */
        void MergeRumor(const Rumor& rumor);

        /**
         * Withdraw every service registration of the given member, because
         * the member departed.
         *
         * @param[in] memberId
         *     This is the unique identifier of the departed member.
         */
        void TombstoneServicesOf(const std::string& memberId);

        /**
         * Set up a callback to end the current protocol period.
         */
        void ScheduleProbePeriod();

        /**
         * End the current protocol period: judge the outcome of the current
         * probe, escalate old suspicions, and start the next probe.
         */
        void OnProbePeriodEnd();

        /**
         * Pick a member and send it a probe.
         */
        void StartProbe();

        /**
         * Ask other members to probe the current probe target, because the
         * direct probe went unanswered.
         *
         * @param[in] seq
         *     This is the sequence number of the probe which timed out.
         */
        void OnPingTimeout(unsigned int seq);

        /**
         * Record the suspicion of newly suspected members, confirm those
         * suspected for too long, and forget members no longer suspected.
         */
        void EscalateSuspicions();

        /**
         * Build the membership rumors to piggyback on a probe message.
         *
         * @param[in] about
         *     If not empty, this is the identifier of a member whose
         *     current entry is always included.
         *
         * @return
         *     The membership rumors to piggyback are returned.
         */
        std::vector< Rumor > GetPiggybackRumors(const std::string& about);

        /**
         * Merge the sender of a message as alive, along with the membership
         * rumors piggybacked on the message.
         *
         * @param[in] message
         *     This is the message received.
         */
        void MergeMessageMembership(const Message& message);

        void OnReceivePing(Message&& message);
        void OnReceiveAck(Message&& message);
        void OnReceivePingReq(Message&& message);
        void OnReceiveGossip(Message&& message);

        /**
         * Set up a callback to end the current gossip round.
         */
        void ScheduleGossipRound();

        /**
         * Push rumors to a random set of members, update elections, and
         * let the rumors cool down by one round.
         */
        void OnGossipRound();

        /**
         * Return the identifiers of the members entitled to vote in the
         * election of the given service group.
         *
         * @param[in] serviceGroup
         *     This is the name of the service group.
         *
         * @return
         *     The identifiers of the electorate are returned.
         */
        std::set< std::string > GetElectorate(const std::string& serviceGroup);

        /**
         * Return the number of votes a candidate needs to win the election
         * held by the given electorate.
         *
         * @param[in] electorate
         *     These are the identifiers of the members entitled to vote.
         *
         * @return
         *     The number of votes needed is returned.
         */
        size_t GetQuorum(const std::set< std::string >& electorate);

        /**
         * Insert the given election state into the rumor store, publishing
         * an event if the stored state changed.
         *
         * @param[in] election
         *     This is the election state to insert.
         *
         * @return
         *     An indication of whether or not the stored state changed
         *     is returned.
         */
        bool InsertElection(const Rumor::ElectionDetails& election);

        /**
         * Move the election of the given service group forward, based on
         * the stored state: vote, finish, give up, or start over.
         *
         * @param[in] serviceGroup
         *     This is the name of the service group.
         */
        void UpdateElection(const std::string& serviceGroup);

        /**
         * Move every known election forward.
         */
        void UpdateElections();

        /**
         * Put the server up as candidate in the election of the given
         * service group.
         *
         * @param[in] serviceGroup
         *     This is the name of the service group.
         *
         * @param[in] suitability
         *     This measures how suitable the server is to lead the group.
         *
         * @param[in] term
         *     This is the generation of the election.
         */
        void StartElection(
            const std::string& serviceGroup,
            uint64_t suitability,
            uint64_t term
        );
    };

}
