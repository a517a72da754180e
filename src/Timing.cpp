/**
 * @file Timing.cpp
 *
 * This module contains the implementation of the Swim::Timing class and the
 * Swim::SteadyClock class.
 *
 * © 2018-2020 by Richard Walters
 */

#include <chrono>
#include <Swim/Timing.hpp>

namespace Swim {

    double SteadyClock::GetCurrentTime() {
        const auto now = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration_cast< std::chrono::duration< double > >(now).count();
    }

    Timing::Timing(
        const IServer::ServerConfiguration& serverConfiguration,
        std::shared_ptr< Timekeeping::Clock > clock
    )
        : protocolPeriod_(serverConfiguration.protocolPeriod)
        , pingTimeout_(serverConfiguration.pingTimeout)
        , gossipInterval_(serverConfiguration.gossipInterval)
        , clock_(clock)
    {
    }

    double Timing::GetProtocolPeriod() const {
        return protocolPeriod_;
    }

    double Timing::GetPingTimeout() const {
        return pingTimeout_;
    }

    double Timing::GetGossipInterval() const {
        return gossipInterval_;
    }

    double Timing::NextProtocolPeriod() const {
        return clock_->GetCurrentTime() + protocolPeriod_;
    }

    double Timing::NextPingTimeout() const {
        return clock_->GetCurrentTime() + pingTimeout_;
    }

    double Timing::NextGossipRound() const {
        return clock_->GetCurrentTime() + gossipInterval_;
    }

    bool Timing::HasPassed(double boundary) const {
        return (clock_->GetCurrentTime() >= boundary);
    }

}
