#ifndef SWIM_PROBE_INFO_HPP
#define SWIM_PROBE_INFO_HPP

/**
 * @file ProbeInfo.hpp
 *
 * This module contains the declaration of the Swim::ProbeInfo and
 * Swim::SuspicionInfo structures.
 *
 * © 2018-2020 by Richard Walters
 */

#include <stddef.h>
#include <stdint.h>
#include <Swim/Member.hpp>

namespace Swim {

    /**
     * This holds what a server tracks about the probe it made in the
     * current protocol period.
     */
    struct ProbeInfo {
        /**
         * This indicates whether or not a probe was sent in the current
         * protocol period.
         */
        bool active = false;

        /**
         * This is the member being probed, as it was known when the probe
         * was sent.
         */
        Member target;

        /**
         * This is the sequence number carried by the probe, and by any
         * acknowledgment answering it.
         */
        unsigned int seq = 0;

        /**
         * This indicates whether or not an acknowledgment was received,
         * either directly or through another member.
         */
        bool acknowledged = false;

        /**
         * This indicates whether or not other members were asked to probe
         * the target indirectly.
         */
        bool indirect = false;

        /**
         * This is the scheduler token for the callback that happens
         * when the ping timeout expires.
         */
        int pingTimeoutToken = 0;

        /**
         * This is the time, according to the scheduler clock, at which
         * the probe was sent.
         */
        double timeSent = 0.0;
    };

    /**
     * This holds what a server tracks about a member it suspects.
     */
    struct SuspicionInfo {
        /**
         * This is the incarnation of the member at which it became suspect.
         */
        uint64_t incarnation = 0;

        /**
         * This is the protocol period count at which the suspicion
         * was noticed.
         */
        size_t since = 0;
    };

}

#endif /* SWIM_PROBE_INFO_HPP */
