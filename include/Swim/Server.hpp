#ifndef SWIM_SERVER_HPP
#define SWIM_SERVER_HPP

/**
 * @file Server.hpp
 *
 * This module declares the Swim::Server implementation.
 *
 * © 2018-2020 by Richard Walters
 */

#include <memory>
#include <stddef.h>
#include <string>
#include <Swim/IServer.hpp>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Swim {

    /**
     * This class represents one member of a gossip network.  It detects
     * failures of other members, spreads rumors, and takes part in the
     * elections of the service groups it knows about.
     */
    class Server
        : public IServer
    {
        // Lifecycle Methods
    public:
        ~Server() noexcept;
        Server(const Server&) = delete;
        Server(Server&&) noexcept;
        Server& operator=(const Server&) = delete;
        Server& operator=(Server&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.  A new unique member
         * identifier is generated for the server, and the server enters its
         * own membership list as alive.
         *
         * @param[in] name
         *     This is a human-readable name for the server, used only in
         *     diagnostic messages.
         */
        explicit Server(const std::string& name = "");

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the class.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * Return the human-readable name of the server.
         */
        std::string GetName() const;

        /**
         * Return the unique identifier of the server within the network.
         */
        std::string GetMemberId() const;

        /**
         * Return the current identity record of the server, as it is
         * advertised to other members.
         */
        Member GetSelf() const;

        // IServer
    public:
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) override;
        virtual void Mobilize(
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const ServerConfiguration& serverConfiguration
        ) override;
        virtual void Demobilize() override;
        virtual void ReceiveMessage(const std::string& serializedMessage) override;
        virtual bool InsertMember(
            const Member& member,
            Health health
        ) override;
        virtual void AddToBlacklist(const std::string& memberId) override;
        virtual void RemoveFromBlacklist(const std::string& memberId) override;
        virtual bool IsBlacklisted(const std::string& memberId) override;
        virtual bool HealthOf(
            const std::string& memberId,
            Health& health
        ) override;
        virtual const MembershipList& GetMembershipList() override;
        virtual size_t GetSwimRounds() override;
        virtual size_t GetGossipRounds() override;
        virtual void Pause() override;
        virtual void Resume() override;
        virtual bool IsPaused() override;
        virtual void Depart() override;
        virtual void StartElection(
            const std::string& serviceGroup,
            uint64_t suitability,
            uint64_t term
        ) override;
        virtual void InsertService(Rumor::ServiceDetails service) override;
        virtual void RemoveService(const std::string& serviceGroup) override;
        virtual const RumorStore& GetRumorStore() override;
        virtual Json::Value GetStatistics() override;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr< Impl > impl_;
    };

}

#endif /* SWIM_SERVER_HPP */
