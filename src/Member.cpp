/**
 * @file Member.cpp
 *
 * This module contains the implementation of the Swim::Member structure
 * methods and the free functions operating on Swim::Health values.
 *
 * © 2018-2020 by Richard Walters
 */

#include <Json/Value.hpp>
#include <Serialization/SerializedBoolean.hpp>
#include <Serialization/SerializedInteger.hpp>
#include <Serialization/SerializedString.hpp>
#include <Serialization/SerializedUnsignedInteger.hpp>
#include <Swim/Member.hpp>
#include <SystemAbstractions/IFile.hpp>

namespace {

    constexpr int CURRENT_SERIALIZATION_VERSION = 1;

}

namespace Swim {

    Member::Member(const Json::Value& json) {
        id = (std::string)json["id"];
        incarnation = (size_t)json["incarnation"];
        address = (std::string)json["address"];
        swimPort = json["swimPort"];
        gossipPort = json["gossipPort"];
        persistent = json["persistent"];
    }

    Member::operator Json::Value() const {
        return Json::Object({
            {"id", id},
            {"incarnation", (size_t)incarnation},
            {"address", address},
            {"swimPort", swimPort},
            {"gossipPort", gossipPort},
            {"persistent", persistent},
        });
    }

    bool Member::Serialize(SystemAbstractions::IFile* buffer) const {
        Serialization::SerializedInteger version(CURRENT_SERIALIZATION_VERSION);
        if (!version.Serialize(buffer)) {
            return false;
        }
        Serialization::SerializedString stringField(id);
        if (!stringField.Serialize(buffer)) {
            return false;
        }
        Serialization::SerializedUnsignedInteger incarnationField(incarnation);
        if (!incarnationField.Serialize(buffer)) {
            return false;
        }
        stringField = address;
        if (!stringField.Serialize(buffer)) {
            return false;
        }
        Serialization::SerializedInteger intField(swimPort);
        if (!intField.Serialize(buffer)) {
            return false;
        }
        intField = gossipPort;
        if (!intField.Serialize(buffer)) {
            return false;
        }
        Serialization::SerializedBoolean boolField(persistent);
        return boolField.Serialize(buffer);
    }

    bool Member::Deserialize(SystemAbstractions::IFile* buffer) {
        Serialization::SerializedInteger version;
        if (!version.Deserialize(buffer)) {
            return false;
        }
        if (version > CURRENT_SERIALIZATION_VERSION) {
            return false;
        }
        Serialization::SerializedString stringField;
        if (!stringField.Deserialize(buffer)) {
            return false;
        }
        id = stringField;
        Serialization::SerializedUnsignedInteger incarnationField;
        if (!incarnationField.Deserialize(buffer)) {
            return false;
        }
        incarnation = incarnationField;
        if (!stringField.Deserialize(buffer)) {
            return false;
        }
        address = stringField;
        Serialization::SerializedInteger intField;
        if (!intField.Deserialize(buffer)) {
            return false;
        }
        swimPort = intField;
        if (!intField.Deserialize(buffer)) {
            return false;
        }
        gossipPort = intField;
        Serialization::SerializedBoolean boolField;
        if (!boolField.Deserialize(buffer)) {
            return false;
        }
        persistent = boolField;
        return true;
    }

    bool Member::operator==(const Member& other) const {
        return (
            (id == other.id)
            && (incarnation == other.incarnation)
            && (address == other.address)
            && (swimPort == other.swimPort)
            && (gossipPort == other.gossipPort)
            && (persistent == other.persistent)
        );
    }

    bool Member::operator!=(const Member& other) const {
        return !(*this == other);
    }

    bool Supersedes(
        uint64_t incomingIncarnation,
        Health incomingHealth,
        uint64_t currentIncarnation,
        Health currentHealth
    ) {
        const auto incomingDeparted = (incomingHealth == Health::Departed);
        const auto currentDeparted = (currentHealth == Health::Departed);
        if (incomingDeparted != currentDeparted) {
            return incomingDeparted;
        }
        if (incomingIncarnation != currentIncarnation) {
            return (incomingIncarnation > currentIncarnation);
        }
        return ((int)incomingHealth > (int)currentHealth);
    }

    std::string HealthToString(Health health) {
        switch (health) {
            case Health::Alive: return "Alive";
            case Health::Suspect: return "Suspect";
            case Health::Confirmed: return "Confirmed";
            case Health::Departed: return "Departed";
            default: return "???";
        }
    }

    bool HealthFromString(const std::string& healthAsString, Health& health) {
        if (healthAsString == "Alive") {
            health = Health::Alive;
        } else if (healthAsString == "Suspect") {
            health = Health::Suspect;
        } else if (healthAsString == "Confirmed") {
            health = Health::Confirmed;
        } else if (healthAsString == "Departed") {
            health = Health::Departed;
        } else {
            return false;
        }
        return true;
    }

    void PrintTo(
        Health health,
        std::ostream* os
    ) {
        *os << HealthToString(health);
    }

}
