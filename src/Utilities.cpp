/**
 * @file Utilities.cpp
 *
 * This module contains the implementation of free functions used by other
 * parts of the library implementation.
 *
 * © 2019-2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <stdint.h>
#include <StringExtensions/StringExtensions.hpp>
#include <SystemAbstractions/CryptoRandom.hpp>

namespace Swim {

    std::string GenerateMemberId() {
        SystemAbstractions::CryptoRandom jim;
        uint8_t bytes[16];
        jim.Generate(bytes, sizeof(bytes));
        bytes[6] = (uint8_t)((bytes[6] & 0x0F) | 0x40);
        bytes[8] = (uint8_t)((bytes[8] & 0x3F) | 0x80);
        std::string id;
        for (size_t i = 0; i < sizeof(bytes); ++i) {
            if (
                (i == 4)
                || (i == 6)
                || (i == 8)
                || (i == 10)
            ) {
                id += '-';
            }
            id += StringExtensions::sprintf("%02x", bytes[i]);
        }
        return id;
    }

    std::string QuorumRuleToString(IServer::QuorumRule quorumRule) {
        switch (quorumRule) {
            case IServer::QuorumRule::KnownMembers: return "KnownMembers";
            case IServer::QuorumRule::LiveMembers: return "LiveMembers";
            default: return "???";
        }
    }

    bool QuorumRuleFromString(
        const std::string& quorumRuleAsString,
        IServer::QuorumRule& quorumRule
    ) {
        if (quorumRuleAsString == "KnownMembers") {
            quorumRule = IServer::QuorumRule::KnownMembers;
        } else if (quorumRuleAsString == "LiveMembers") {
            quorumRule = IServer::QuorumRule::LiveMembers;
        } else {
            return false;
        }
        return true;
    }

    void PrintTo(
        IServer::QuorumRule quorumRule,
        std::ostream* os
    ) {
        *os << QuorumRuleToString(quorumRule);
    }

}
