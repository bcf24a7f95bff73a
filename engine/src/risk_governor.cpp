#include "risk_governor.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace engine {

    std::string tripReasonToString(TripReason reason) {
        switch (reason) {
            case TripReason::None:              return "None";
            case TripReason::Drawdown:          return "Max Drawdown";
            case TripReason::ConsecutiveLosses: return "Consecutive Losses";
        }
        return "Unknown";
    }

    RiskGovernor::RiskGovernor(const core::RiskConfig& config, double initial_equity)
        : config_(config), peak_equity_(initial_equity) {}

    void RiskGovernor::onEquity(const core::Timestamp& now, double equity) {
        if (equity > peak_equity_) {
            peak_equity_ = equity;
        }
        current_drawdown_ = peak_equity_ > 0.0 ? (peak_equity_ - equity) / peak_equity_ : 0.0;

        if (!config_.enabled) return;

        // Re-checked on every bar once a pause has run out
        const bool paused = suspended_until_ && now < *suspended_until_;
        if (!paused && current_drawdown_ >= config_.max_drawdown_pct / 100.0) {
            core::logging::getLogger()->warn("CIRCUIT BREAKER: drawdown {:.2f}% (peak {:.2f}, equity {:.2f})",
                                             current_drawdown_ * 100.0, peak_equity_, equity);
            trip(now, TripReason::Drawdown);
        }
    }

    void RiskGovernor::onTradeClosed(const core::Timestamp& now, double pnl) {
        if (pnl > 0.0) {
            consecutive_losses_ = 0;
            return;
        }
        if (pnl == 0.0) return;

        ++consecutive_losses_;
        if (config_.enabled && consecutive_losses_ >= config_.max_consecutive_losses) {
            core::logging::getLogger()->warn("CIRCUIT BREAKER: {} consecutive losses", consecutive_losses_);
            trip(now, TripReason::ConsecutiveLosses);
        }
    }

    void RiskGovernor::trip(const core::Timestamp& now, TripReason reason) {
        auto logger = core::logging::getLogger();
        ++trip_count_;
        last_trip_reason_ = reason;

        // No stacking: an existing future resume date is neither extended nor shortened
        if (suspended_until_ && now < *suspended_until_) {
            logger->info("Trading already suspended until {} ({}), resume date unchanged",
                         core::utils::dateToString(*suspended_until_), tripReasonToString(reason));
            return;
        }
        suspended_until_ = core::utils::addDays(now, config_.cooldown_days);
        logger->warn("Trading suspended until {} ({})", core::utils::dateToString(*suspended_until_),
                     tripReasonToString(reason));
    }

    bool RiskGovernor::isSuspended(const core::Timestamp& now) {
        if (!config_.enabled || !suspended_until_) return false;
        if (now < *suspended_until_) return true;

        core::logging::getLogger()->info("Trading resumed on {} after {} suspension",
                                         core::utils::dateToString(now), tripReasonToString(last_trip_reason_));
        suspended_until_.reset();
        consecutive_losses_ = 0; // The loss streak starts over after a pause
        return false;
    }

} // namespace engine

