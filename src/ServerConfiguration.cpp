/**
 * @file ServerConfiguration.cpp
 *
 * This module contains the implementation of the
 * Swim::IServer::ServerConfiguration structure methods.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <Json/Value.hpp>
#include <Swim/IServer.hpp>

namespace Swim {

    IServer::ServerConfiguration::ServerConfiguration(const Json::Value& json) {
        if (json.Has("address")) {
            address = (std::string)json["address"];
        }
        if (json.Has("swimPort")) {
            swimPort = json["swimPort"];
        }
        if (json.Has("gossipPort")) {
            gossipPort = json["gossipPort"];
        }
        if (json.Has("protocolPeriod")) {
            protocolPeriod = json["protocolPeriod"];
        }
        if (json.Has("pingTimeout")) {
            pingTimeout = json["pingTimeout"];
        }
        if (json.Has("pingReqTargets")) {
            pingReqTargets = json["pingReqTargets"];
        }
        if (json.Has("suspicionPeriods")) {
            suspicionPeriods = json["suspicionPeriods"];
        }
        if (json.Has("gossipInterval")) {
            gossipInterval = json["gossipInterval"];
        }
        if (json.Has("gossipFanout")) {
            gossipFanout = json["gossipFanout"];
        }
        if (json.Has("rumorHeatRounds")) {
            rumorHeatRounds = json["rumorHeatRounds"];
        }
        if (json.Has("antiEntropyRounds")) {
            antiEntropyRounds = json["antiEntropyRounds"];
        }
        if (json.Has("piggybackLimit")) {
            piggybackLimit = json["piggybackLimit"];
        }
        if (json.Has("electionTimeoutRounds")) {
            electionTimeoutRounds = json["electionTimeoutRounds"];
        }
        if (json.Has("quorumRule")) {
            (void)QuorumRuleFromString((std::string)json["quorumRule"], quorumRule);
        }
    }

    IServer::ServerConfiguration::operator Json::Value() const {
        return Json::Object({
            {"address", address},
            {"swimPort", swimPort},
            {"gossipPort", gossipPort},
            {"protocolPeriod", protocolPeriod},
            {"pingTimeout", pingTimeout},
            {"pingReqTargets", pingReqTargets},
            {"suspicionPeriods", suspicionPeriods},
            {"gossipInterval", gossipInterval},
            {"gossipFanout", gossipFanout},
            {"rumorHeatRounds", rumorHeatRounds},
            {"antiEntropyRounds", antiEntropyRounds},
            {"piggybackLimit", piggybackLimit},
            {"electionTimeoutRounds", electionTimeoutRounds},
            {"quorumRule", QuorumRuleToString(quorumRule)},
        });
    }

}
