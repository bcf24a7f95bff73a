#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept> // For invalid_argument
#include <cmath>
#include <algorithm>

namespace engine {

    namespace {
        constexpr double kLedgerTolerance = 1e-6;
    }

    std::string admissionBlockToString(AdmissionBlock block) {
        switch (block) {
            case AdmissionBlock::None:                return "None";
            case AdmissionBlock::AlreadyOpen:         return "AlreadyOpen";
            case AdmissionBlock::NoFreeSlot:          return "NoFreeSlot";
            case AdmissionBlock::InCooldown:          return "InCooldown";
            case AdmissionBlock::InsufficientCapital: return "InsufficientCapital";
        }
        return "Unknown";
    }

    Portfolio::Portfolio(const PortfolioSettings& settings)
        : settings_(settings), total_capital_(settings.initial_capital), free_capital_(settings.initial_capital) {
        if (settings_.initial_capital <= 0) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
        if (settings_.max_positions < 1) {
            throw std::invalid_argument("max_positions must be at least 1.");
        }
        if (settings_.capital_per_position <= 0 || settings_.capital_per_position > settings_.initial_capital + kLedgerTolerance) {
            throw std::invalid_argument(fmt::format("Capital per position {:.2f} must be in (0, initial capital].",
                                                    settings_.capital_per_position));
        }
        if (settings_.transaction_cost_pct < 0 || settings_.transaction_cost_pct >= 100) {
            throw std::invalid_argument("Transaction cost must be in [0, 100).");
        }
    }

    bool Portfolio::hasOpenPosition(const std::string& instrument) const {
        return open_positions_.count(instrument) > 0;
    }

    const Position& Portfolio::getOpenPosition(const std::string& instrument) const {
        return open_positions_.at(instrument);
    }

    bool Portfolio::isInCooldown(const std::string& instrument, const core::Timestamp& now) const {
        auto it = cooldown_until_.find(instrument);
        return it != cooldown_until_.end() && now < it->second;
    }

    AdmissionBlock Portfolio::canOpen(const std::string& instrument, const core::Timestamp& now) const {
        if (hasOpenPosition(instrument)) return AdmissionBlock::AlreadyOpen;
        if (openCount() >= settings_.max_positions) return AdmissionBlock::NoFreeSlot;
        if (isInCooldown(instrument, now)) return AdmissionBlock::InCooldown;
        if (free_capital_ + kLedgerTolerance < settings_.capital_per_position) return AdmissionBlock::InsufficientCapital;
        return AdmissionBlock::None;
    }

    double Portfolio::entryCostFor() const {
        return settings_.capital_per_position * settings_.transaction_cost_pct / 100.0;
    }

    long long Portfolio::quantityFor(double price) const {
        if (price <= 0) return 0;
        return static_cast<long long>(std::floor((settings_.capital_per_position - entryCostFor()) / price));
    }

    const Position& Portfolio::openPosition(const std::string& instrument, const core::Timestamp& now, size_t bar_index,
                                            double price, double stop_loss_price, double take_profit_price,
                                            double signal_strength, const core::IndicatorSnapshot& snapshot) {
        auto logger = core::logging::getLogger();

        switch (canOpen(instrument, now)) {
            case AdmissionBlock::None:
                break;
            case AdmissionBlock::AlreadyOpen:
                throw std::logic_error("Position already open for " + instrument);
            case AdmissionBlock::NoFreeSlot:
                throw std::logic_error(fmt::format("Cannot open {}: all {} slots in use", instrument, settings_.max_positions));
            case AdmissionBlock::InCooldown:
                throw std::logic_error("Cannot open " + instrument + ": instrument in cooldown");
            case AdmissionBlock::InsufficientCapital:
                throw core::InsufficientCapitalException(
                    fmt::format("Free capital {:.2f} below slot size {:.2f} for {}", free_capital_, settings_.capital_per_position, instrument));
        }

        const long long quantity = quantityFor(price);
        if (quantity <= 0) {
            throw core::InsufficientCapitalException(
                fmt::format("Slot {:.2f} cannot buy one share of {} at {:.2f}", settings_.capital_per_position, instrument, price));
        }

        EntryFill fill;
        fill.instrument = instrument;
        fill.timestamp = now;
        fill.bar_index = bar_index;
        fill.price = price;
        fill.quantity = quantity;
        fill.capital_committed = settings_.capital_per_position;
        fill.entry_cost = entryCostFor();
        fill.stop_loss_price = stop_loss_price;
        fill.take_profit_price = take_profit_price;
        fill.signal_strength = signal_strength;
        fill.snapshot = snapshot;

        auto inserted = open_positions_.emplace(instrument, Position(fill));
        free_capital_ -= settings_.capital_per_position;
        last_prices_[instrument] = price;

        logger->info("ENTRY {} @ {:.2f} x {} on {} (strength {:.3f}, SL {:.2f}, TP {:.2f}, free {:.2f})",
                     instrument, price, quantity, core::utils::dateToString(now), signal_strength,
                     stop_loss_price, take_profit_price, free_capital_);
        return inserted.first->second;
    }

    Position Portfolio::closePosition(const std::string& instrument, const core::Timestamp& now,
                                      double exit_price, core::ExitReason reason) {
        auto it = open_positions_.find(instrument);
        if (it == open_positions_.end()) {
            throw std::logic_error("No open position to close for " + instrument);
        }

        Position position = it->second;
        const double exit_cost = static_cast<double>(position.getQuantity()) * exit_price * settings_.transaction_cost_pct / 100.0;
        const double pnl = position.close(now, exit_price, reason, exit_cost);

        total_capital_ += pnl;
        free_capital_ += position.getCapitalCommitted() + pnl;
        open_positions_.erase(it);
        last_prices_.erase(instrument);

        if (pnl < 0 && settings_.cooldown_days > 0) {
            cooldown_until_[instrument] = core::utils::addDays(now, settings_.cooldown_days);
        }

        closed_trades_.push_back(position);
        core::logging::getLogger()->info("EXIT {} @ {:.2f} on {} ({}), P&L {:.2f} ({:.2f}%), held {} days",
                                         instrument, exit_price, core::utils::dateToString(now),
                                         core::exitReasonToString(reason), pnl, position.returnPct(),
                                         position.daysHeld(now));
        return position;
    }

    void Portfolio::restorePosition(const Position& position) {
        const std::string& instrument = position.getInstrument();
        if (!position.isOpen()) {
            throw std::logic_error("Cannot restore a closed position for " + instrument);
        }
        if (hasOpenPosition(instrument)) {
            throw std::logic_error("Position already open for " + instrument);
        }
        if (openCount() >= settings_.max_positions) {
            throw std::logic_error("Cannot restore " + instrument + ": all slots in use");
        }
        if (free_capital_ + kLedgerTolerance < position.getCapitalCommitted()) {
            throw core::InsufficientCapitalException("Not enough free capital to restore position " + instrument);
        }
        open_positions_.emplace(instrument, position);
        free_capital_ -= position.getCapitalCommitted();
        last_prices_[instrument] = position.getEntryPrice();
        core::logging::getLogger()->info("Restored open position {} x {} @ {:.2f}", instrument,
                                         position.getQuantity(), position.getEntryPrice());
    }

    void Portfolio::updateHighestPrice(const std::string& instrument, double price) {
        auto it = open_positions_.find(instrument);
        if (it == open_positions_.end()) {
            throw std::logic_error("No open position for " + instrument);
        }
        it->second.updateHighestPrice(price);
    }

    double Portfolio::markToMarket(const std::map<std::string, double>& prices) {
        for (const auto& pair : open_positions_) {
            auto price_it = prices.find(pair.first);
            if (price_it != prices.end()) {
                last_prices_[pair.first] = price_it->second;
            }
        }
        return positionsValue();
    }

    double Portfolio::positionsValue() const {
        double value = 0.0;
        for (const auto& pair : open_positions_) {
            auto price_it = last_prices_.find(pair.first);
            const double price = price_it != last_prices_.end() ? price_it->second : pair.second.getEntryPrice();
            value += pair.second.marketValue(price) + pair.second.residualCash();
        }
        return value;
    }

    double Portfolio::currentEquity() const {
        return free_capital_ + positionsValue();
    }

    const EquityPoint& Portfolio::recordEquity(const core::Timestamp& now, const std::map<std::string, double>& prices) {
        EquityPoint point;
        point.timestamp = now;
        point.free_capital = free_capital_;
        point.positions_value = markToMarket(prices);
        point.total_equity = point.free_capital + point.positions_value;

        // Avoid duplicate entries for the same timestamp
        if (!equity_curve_.empty() && equity_curve_.back().timestamp == now) {
            equity_curve_.back() = point;
        } else {
            equity_curve_.push_back(point);
        }
        return equity_curve_.back();
    }

    void Portfolio::checkInvariant() const {
        double committed = 0.0;
        for (const auto& pair : open_positions_) {
            committed += pair.second.getCapitalCommitted();
        }
        const double drift = free_capital_ + committed - total_capital_;
        if (std::abs(drift) > kLedgerTolerance * std::max(1.0, std::abs(total_capital_))) {
            throw std::logic_error(fmt::format("Ledger identity violated: free {:.6f} + committed {:.6f} != total {:.6f}",
                                               free_capital_, committed, total_capital_));
        }
        if (openCount() > settings_.max_positions) {
            throw std::logic_error("Open positions exceed max_positions");
        }
    }

} // namespace engine
