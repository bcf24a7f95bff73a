#pragma once

#include <optional>
#include <string>

#include "datatypes.hpp"
#include "config.hpp"

namespace engine {

    enum class TripReason {
        None,
        Drawdown,
        ConsecutiveLosses
    };

    std::string tripReasonToString(TripReason reason);

    // Portfolio-level circuit breakers. A trip suspends new entries for cooldown_days;
    // open positions keep being managed.
    class RiskGovernor {
    public:
        RiskGovernor(const core::RiskConfig& config, double initial_equity);

        // Updates peak and drawdown; trips the drawdown breaker whenever drawdown >= threshold outside a pause
        void onEquity(const core::Timestamp& now, double equity);

        // A loss (pnl < 0) counts towards the consecutive-loss breaker; a win (pnl > 0) resets it
        void onTradeClosed(const core::Timestamp& now, double pnl);

        // True while now < suspended_until. Clears an expired suspension and the loss streak.
        bool isSuspended(const core::Timestamp& now);

        double getPeakEquity() const { return peak_equity_; }
        double getCurrentDrawdown() const { return current_drawdown_; }
        int getConsecutiveLosses() const { return consecutive_losses_; }
        std::optional<core::Timestamp> getSuspendedUntil() const { return suspended_until_; }
        TripReason getLastTripReason() const { return last_trip_reason_; }
        int getTripCount() const { return trip_count_; }

    private:
        void trip(const core::Timestamp& now, TripReason reason);

        core::RiskConfig config_;
        double peak_equity_;
        double current_drawdown_ = 0.0;
        int consecutive_losses_ = 0;
        std::optional<core::Timestamp> suspended_until_;
        TripReason last_trip_reason_ = TripReason::None;
        int trip_count_ = 0;
    };

} // namespace engine
