// engine/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <map>

#include "datatypes.hpp" // Provides core::Timestamp, core::ExitReason
#include "position.hpp"

namespace engine {

    // --- Portfolio State Struct (for equity curve) ---
    struct EquityPoint {
        core::Timestamp timestamp;
        double free_capital = 0.0;
        double positions_value = 0.0; // Market value of holdings plus unspent committed cash
        double total_equity = 0.0;    // free_capital + positions_value
    };

    // Why an instrument cannot be entered right now
    enum class AdmissionBlock {
        None,
        AlreadyOpen,
        NoFreeSlot,
        InCooldown,
        InsufficientCapital
    };

    std::string admissionBlockToString(AdmissionBlock block);

    struct PortfolioSettings {
        double initial_capital = 0.0;
        int max_positions = 1;
        double capital_per_position = 0.0; // Constant slot size
        double transaction_cost_pct = 0.0; // Percent of traded value, both sides
        int cooldown_days = 0;             // Re-entry block after a losing exit
    };

    // --- Portfolio Ledger ---
    // Invariant at every bar boundary: free + sum(committed of open) == total capital.
    class Portfolio {
    public:
        explicit Portfolio(const PortfolioSettings& settings);

        // --- Getters ---
        double getInitialCapital() const { return settings_.initial_capital; }
        double getTotalCapital() const { return total_capital_; }   // initial + realized P&L
        double getFreeCapital() const { return free_capital_; }
        double capitalPerPosition() const { return settings_.capital_per_position; }
        double getTransactionCostPct() const { return settings_.transaction_cost_pct; }
        int getMaxPositions() const { return settings_.max_positions; }
        int openCount() const { return static_cast<int>(open_positions_.size()); }
        bool hasOpenPosition(const std::string& instrument) const;
        const Position& getOpenPosition(const std::string& instrument) const; // Throws std::out_of_range
        const std::map<std::string, Position>& getOpenPositions() const { return open_positions_; }
        const std::vector<Position>& getClosedTrades() const { return closed_trades_; }
        const std::vector<EquityPoint>& getEquityCurve() const { return equity_curve_; }
        const std::map<std::string, core::Timestamp>& getCooldowns() const { return cooldown_until_; }

        bool isInCooldown(const std::string& instrument, const core::Timestamp& now) const;
        AdmissionBlock canOpen(const std::string& instrument, const core::Timestamp& now) const;

        double entryCostFor() const;                  // Fee on one capital slot
        long long quantityFor(double price) const;    // Whole shares one slot buys after the fee

        // --- Modifiers ---
        // Re-validates slot, duplicate, cooldown and capital. Throws InsufficientCapitalException
        // when the slot cannot be funded, std::logic_error on a ledger invariant breach.
        const Position& openPosition(const std::string& instrument, const core::Timestamp& now, size_t bar_index,
                                     double price, double stop_loss_price, double take_profit_price,
                                     double signal_strength, const core::IndicatorSnapshot& snapshot);

        // Settles capital and appends to the closed-trade log. Sets a cooldown on a loss.
        // Returns the closed position. Throws std::logic_error if nothing is open for the instrument.
        Position closePosition(const std::string& instrument, const core::Timestamp& now,
                               double exit_price, core::ExitReason reason);

        // Re-inserts a position recovered from the trade store (live restart)
        void restorePosition(const Position& position);

        void updateHighestPrice(const std::string& instrument, double price);

        // Updates last known prices of held instruments and returns the positions value
        double markToMarket(const std::map<std::string, double>& prices);
        double currentEquity() const;

        // Records portfolio equity state at a specific timestamp (last known prices)
        const EquityPoint& recordEquity(const core::Timestamp& now, const std::map<std::string, double>& prices);

        // Throws std::logic_error if free + committed drifts from total capital
        void checkInvariant() const;

    private:
        double positionsValue() const;

        PortfolioSettings settings_;
        double total_capital_;
        double free_capital_;
        std::map<std::string, Position> open_positions_;
        std::map<std::string, double> last_prices_;
        std::map<std::string, core::Timestamp> cooldown_until_;
        std::vector<EquityPoint> equity_curve_;
        std::vector<Position> closed_trades_;
    };

} // namespace engine
