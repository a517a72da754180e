#ifndef SWIM_TIMING_HPP
#define SWIM_TIMING_HPP

/**
 * @file Timing.hpp
 *
 * This module declares the Swim::Timing class and the Swim::SteadyClock
 * class.
 *
 * © 2018-2020 by Richard Walters
 */

#include "IServer.hpp"

#include <memory>
#include <Timekeeping/Clock.hpp>

namespace Swim {

    /**
     * This implements the Timekeeping::Clock interface in terms of the
     * monotonic clock of the system.  Times are in seconds, measured from
     * an arbitrary fixed point.
     */
    class SteadyClock
        : public Timekeeping::Clock
    {
        // Timekeeping::Clock
    public:
        virtual double GetCurrentTime() override;
    };

    /**
     * This computes when the periodic activities of a server are due: the
     * protocol periods of the failure detector and the gossip rounds of the
     * disseminator.  All times are absolute, according to the given clock.
     */
    class Timing {
        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] serverConfiguration
         *     This holds the lengths of the periodic activities.
         *
         * @param[in] clock
         *     This is the clock used to tell the current time.
         */
        Timing(
            const IServer::ServerConfiguration& serverConfiguration,
            std::shared_ptr< Timekeeping::Clock > clock
        );

        /**
         * Return the length of one failure detector protocol period,
         * in seconds.
         */
        double GetProtocolPeriod() const;

        /**
         * Return how long to wait for the direct acknowledgment of a probe
         * before asking other members to probe indirectly, in seconds.
         */
        double GetPingTimeout() const;

        /**
         * Return the length of one gossip round, in seconds.
         */
        double GetGossipInterval() const;

        /**
         * Return the time at which a protocol period starting now ends.
         *
         * @return
         *     The absolute time of the next protocol period boundary
         *     is returned.
         */
        double NextProtocolPeriod() const;

        /**
         * Return the time at which the ping timeout of a probe sent now
         * expires.
         *
         * @return
         *     The absolute time of the ping timeout is returned.
         */
        double NextPingTimeout() const;

        /**
         * Return the time at which a gossip round starting now ends.
         *
         * @return
         *     The absolute time of the next gossip round boundary
         *     is returned.
         */
        double NextGossipRound() const;

        /**
         * Determine whether or not the given boundary has passed.
         *
         * @param[in] boundary
         *     This is the absolute time of the boundary to check.
         *
         * @return
         *     An indication of whether or not the clock has reached the
         *     given boundary is returned.
         */
        bool HasPassed(double boundary) const;

        // Private properties
    private:
        double protocolPeriod_;
        double pingTimeout_;
        double gossipInterval_;
        std::shared_ptr< Timekeeping::Clock > clock_;
    };

}

#endif /* SWIM_TIMING_HPP */
