#ifndef SWIM_MESSAGE_HPP
#define SWIM_MESSAGE_HPP

/**
 * @file Message.hpp
 *
 * This module declares the Swim::Message structure.
 *
 * © 2018-2020 by Richard Walters
 */

#include <stddef.h>
#include <string>
#include <Swim/Member.hpp>
#include <Swim/Rumor.hpp>
#include <vector>

namespace Swim {

    /**
     * This is a single datagram sent from one server to another.
     */
    struct Message {
        // Types

        /**
         * These are the types of messages for which the message object might
         * be used.
         */
        enum class Type {
            /**
             * This is the default type of message, used for uninitialized
             * messages and for datagrams which could not be decoded.
             */
            Unknown,

            /**
             * This is a direct probe, sent to check whether the receiver is
             * still alive.  If it carries a member to forward to, the probe
             * is being made on behalf of that member.
             */
            Ping,

            /**
             * This is the answer to a probe.  If it carries a member to
             * forward to, whoever receives it passes it on to that member.
             */
            Ack,

            /**
             * This asks the receiver to probe the target member on behalf of
             * the sender, because the sender's own probe went unanswered.
             */
            PingReq,

            /**
             * This pushes rumors to the receiver.
             */
            Gossip,
        };

        // Properties

        /**
         * This indicates for what purpose the message is being sent.
         */
        Type type = Type::Unknown;

        /**
         * This is the member which sent the message.  For a forwarded Ack,
         * this is the member which answered the probe.
         */
        Member from;

        /**
         * This is used by Ping and Ack messages sent on behalf of another
         * member.  The identifier is empty when the message is not forwarded.
         */
        Member forwardTo;

        /**
         * This is the member to probe, for PingReq messages.
         */
        Member target;

        /**
         * This is the sequence number used to match acknowledgments with
         * the probes they answer.
         */
        unsigned int seq = 0;

        /**
         * These are the rumors carried by the message.  Probe messages
         * piggyback membership rumors here.
         */
        std::vector< Rumor > rumors;

        // Methods

        /**
         * This is the constructor of the class.
         *
         * @param[in] serialization
         *     If not empty, this is the serialized form of the message, used
         *     to initialize the type and properties of the message.  If it
         *     cannot be decoded, the message type is left as Type::Unknown.
         */
        Message(const std::string& serialization = "");

        /**
         * This method returns a string which can be used to construct a new
         * message with the exact same contents as this message.
         *
         * @return
         *     A string which can be used to construct a new message with the
         *     exact same contents as this message is returned.
         */
        std::string Serialize() const;

        /**
         * Determine whether or not the message is carried on behalf of
         * another member.
         */
        bool IsForwarded() const;
    };

    /**
     * Return a human-readable string representation of the given message
     * type.
     *
     * @param[in] type
     *     This is the message type to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given message type
     *     is returned.
     */
    std::string MessageTypeToString(Message::Type type);

    /**
     * This is a support function for Google Test to print out
     * values of the Swim::Message::Type class.
     */
    void PrintTo(
        Message::Type type,
        std::ostream* os
    );

}

#endif /* SWIM_MESSAGE_HPP */
