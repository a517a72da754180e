#ifndef SWIM_MEMBER_HPP
#define SWIM_MEMBER_HPP

/**
 * @file Member.hpp
 *
 * This module declares the Swim::Member structure and the Swim::Health
 * enumeration.
 *
 * © 2018-2020 by Richard Walters
 */

#include <Json/Value.hpp>
#include <ostream>
#include <stdint.h>
#include <string>

namespace SystemAbstractions {
    class IFile;
}

namespace Swim {

    /**
     * This is used to indicate the health of a member, as observed by one
     * particular server.  Values are declared in order of increasing
     * precedence when two updates with the same incarnation are compared.
     */
    enum class Health {
        /**
         * The member answered a probe recently, or refuted suspicion about
         * itself.
         */
        Alive,

        /**
         * The member failed to answer a probe, either directly or through
         * any of the members asked to probe it indirectly.
         */
        Suspect,

        /**
         * The member stayed suspect for long enough without refuting the
         * suspicion.
         */
        Confirmed,

        /**
         * The member announced that it left the network.  This state
         * is terminal.
         */
        Departed,
    };

    /**
     * This holds the identity of one member of the network, along with the
     * information needed to reach it.  Copies are exchanged by value.
     */
    struct Member {
        // Properties

        /**
         * This is the unique identifier of the member.
         */
        std::string id;

        /**
         * This is incremented by the member itself whenever it needs
         * to refute suspicion about itself.
         */
        uint64_t incarnation = 0;

        /**
         * This is the network address of the member.
         */
        std::string address;

        /**
         * This is the port on which the member receives probe messages.
         */
        int swimPort = 0;

        /**
         * This is the port on which the member receives gossip messages.
         */
        int gossipPort = 0;

        /**
         * This indicates whether or not the member should be kept in the
         * probe rotation no matter what other members report about it.
         */
        bool persistent = false;

        // Methods

        /**
         * This is the default constructor.
         */
        Member() = default;

        /**
         * This constructs the member from its JSON encoding.
         *
         * @param[in] json
         *     This is the JSON encoding of the member.
         */
        Member(const Json::Value& json);

        /**
         * This method returns a JSON value which can be used to construct a
         * new member with the exact same contents as this member.
         *
         * @return
         *     The JSON encoding of the member is returned.
         */
        operator Json::Value() const;

        /**
         * Write the member to the given buffer.
         *
         * @param[in,out] buffer
         *     This is the buffer to which to write the member.
         *
         * @return
         *     An indication of whether or not the member was written
         *     successfully is returned.
         */
        bool Serialize(SystemAbstractions::IFile* buffer) const;

        /**
         * Read the member from the given buffer.
         *
         * @param[in,out] buffer
         *     This is the buffer from which to read the member.
         *
         * @return
         *     An indication of whether or not the member was read
         *     successfully is returned.
         */
        bool Deserialize(SystemAbstractions::IFile* buffer);

        bool operator==(const Member& other) const;
        bool operator!=(const Member& other) const;
    };

    /**
     * Determine whether a membership update should replace what is
     * currently known about a member.  Departure is final, so a departed
     * member only ever takes a later departure.  Otherwise a higher
     * incarnation always wins, and at equal incarnations the more "dead"
     * health wins.
     *
     * @param[in] incomingIncarnation
     *     This is the incarnation carried by the update.
     *
     * @param[in] incomingHealth
     *     This is the health carried by the update.
     *
     * @param[in] currentIncarnation
     *     This is the incarnation currently known.
     *
     * @param[in] currentHealth
     *     This is the health currently known.
     *
     * @return
     *     An indication of whether or not the update supersedes what is
     *     currently known is returned.
     */
    bool Supersedes(
        uint64_t incomingIncarnation,
        Health incomingHealth,
        uint64_t currentIncarnation,
        Health currentHealth
    );

    /**
     * Return a human-readable string representation of the given health.
     *
     * @param[in] health
     *     This is the health to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given health is
     *     returned.
     */
    std::string HealthToString(Health health);

    /**
     * Parse the given string as a health value.
     *
     * @param[in] healthAsString
     *     This is the string to parse.
     *
     * @param[out] health
     *     This is where to store the parsed health.
     *
     * @return
     *     An indication of whether or not the string named a health
     *     value is returned.
     */
    bool HealthFromString(const std::string& healthAsString, Health& health);

    /**
     * This is a support function for Google Test to print out
     * values of the Swim::Health class.
     *
     * @param[in] health
     *     This is the health value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the health value.
     */
    void PrintTo(
        Health health,
        std::ostream* os
    );

}

#endif /* SWIM_MEMBER_HPP */
