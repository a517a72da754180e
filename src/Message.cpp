/**
 * @file Message.cpp
 *
 * This module contains the implementation of the Swim::Message class.
 *
 * © 2018-2020 by Richard Walters
 */

#include "Message.hpp"

#include <Serialization/SerializedInteger.hpp>
#include <Serialization/SerializedUnsignedInteger.hpp>
#include <SystemAbstractions/StringFile.hpp>

namespace {

    constexpr unsigned int CURRENT_SERIALIZATION_VERSION = 1;

    /**
     * This is the most rumors a single message may claim to carry.  Anything
     * claiming more is treated as malformed.
     */
    constexpr size_t MAX_RUMORS_PER_MESSAGE = 65536;

}

namespace Swim {

    Message::Message(const std::string& serialization) {
        if (serialization.empty()) {
            return;
        }
        SystemAbstractions::StringFile buffer(serialization);
        Serialization::SerializedUnsignedInteger version;
        if (!version.Deserialize(&buffer)) {
            return;
        }
        if (version > CURRENT_SERIALIZATION_VERSION) {
            return;
        }
        Serialization::SerializedInteger serializedType;
        if (!serializedType.Deserialize(&buffer)) {
            return;
        }
        const auto decodedType = (Message::Type)(int)serializedType;
        if (!from.Deserialize(&buffer)) {
            return;
        }
        Serialization::SerializedUnsignedInteger unsignedField;
        if (!unsignedField.Deserialize(&buffer)) {
            return;
        }
        seq = (unsigned int)unsignedField;
        switch (decodedType) {
            case Message::Type::Ping:
            case Message::Type::Ack: {
                if (!forwardTo.Deserialize(&buffer)) {
                    return;
                }
            } break;

            case Message::Type::PingReq: {
                if (!target.Deserialize(&buffer)) {
                    return;
                }
            } break;

            case Message::Type::Gossip: {
            } break;

            default: return;
        }
        if (!unsignedField.Deserialize(&buffer)) {
            return;
        }
        const auto numRumors = (size_t)(uintmax_t)unsignedField;
        if (numRumors > MAX_RUMORS_PER_MESSAGE) {
            return;
        }
        std::vector< Rumor > decodedRumors;
        for (size_t i = 0; i < numRumors; ++i) {
            Rumor rumor;
            if (!rumor.Deserialize(&buffer)) {
                return;
            }
            decodedRumors.push_back(std::move(rumor));
        }
        rumors = std::move(decodedRumors);
        type = decodedType;
    }

    std::string Message::Serialize() const {
        SystemAbstractions::StringFile buffer;
        Serialization::SerializedUnsignedInteger unsignedField(CURRENT_SERIALIZATION_VERSION);
        if (!unsignedField.Serialize(&buffer)) {
            return "";
        }
        Serialization::SerializedInteger intField((int)type);
        if (!intField.Serialize(&buffer)) {
            return "";
        }
        if (!from.Serialize(&buffer)) {
            return "";
        }
        unsignedField = seq;
        if (!unsignedField.Serialize(&buffer)) {
            return "";
        }
        switch (type) {
            case Message::Type::Ping:
            case Message::Type::Ack: {
                if (!forwardTo.Serialize(&buffer)) {
                    return "";
                }
            } break;

            case Message::Type::PingReq: {
                if (!target.Serialize(&buffer)) {
                    return "";
                }
            } break;

            case Message::Type::Gossip: {
            } break;

            default: return "";
        }
        unsignedField = rumors.size();
        if (!unsignedField.Serialize(&buffer)) {
            return "";
        }
        for (const auto& rumor: rumors) {
            if (!rumor.Serialize(&buffer)) {
                return "";
            }
        }
        return buffer;
    }

    bool Message::IsForwarded() const {
        return !forwardTo.id.empty();
    }

    std::string MessageTypeToString(Message::Type type) {
        switch (type) {
            case Message::Type::Ping: return "Ping";
            case Message::Type::Ack: return "Ack";
            case Message::Type::PingReq: return "PingReq";
            case Message::Type::Gossip: return "Gossip";
            default: return "Unknown";
        }
    }

    void PrintTo(
        Message::Type type,
        std::ostream* os
    ) {
        *os << MessageTypeToString(type);
    }

}
