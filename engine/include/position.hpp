// engine/include/position.hpp
#pragma once

#include <string>
#include <optional>

#include "datatypes.hpp" // Provides core::Timestamp, core::ExitReason, core::IndicatorSnapshot

namespace engine {

    // Everything known about a fill that opens a position
    struct EntryFill {
        std::string instrument;
        core::Timestamp timestamp;
        size_t bar_index = 0;
        double price = 0.0;
        long long quantity = 0;
        double capital_committed = 0.0; // Fixed capital slot reserved for this position
        double entry_cost = 0.0;        // Transaction cost paid on entry
        double stop_loss_price = 0.0;
        double take_profit_price = 0.0;
        double signal_strength = 0.0;
        core::IndicatorSnapshot snapshot;
    };

    // A single long holding. Open -> Closed exactly once.
    class Position {
    public:
        // Throws std::invalid_argument unless quantity > 0 and stop < entry < take-profit
        explicit Position(const EntryFill& fill);

        // --- Getters ---
        const std::string& getInstrument() const { return instrument_; }
        core::Timestamp getEntryTime() const { return entry_time_; }
        size_t getEntryBarIndex() const { return entry_bar_index_; }
        double getEntryPrice() const { return entry_price_; }
        long long getQuantity() const { return quantity_; }
        double getCapitalCommitted() const { return capital_committed_; }
        double getEntryCost() const { return entry_cost_; }
        double getStopLossPrice() const { return stop_loss_price_; }
        double getTakeProfitPrice() const { return take_profit_price_; }
        double getHighestPrice() const { return highest_price_; }
        double getSignalStrength() const { return signal_strength_; }
        const core::IndicatorSnapshot& getEntrySnapshot() const { return entry_snapshot_; }
        core::PositionStatus getStatus() const { return status_; }
        bool isOpen() const { return status_ == core::PositionStatus::Open; }

        // Only set once closed
        std::optional<core::Timestamp> getExitTime() const { return exit_time_; }
        std::optional<double> getExitPrice() const { return exit_price_; }
        std::optional<core::ExitReason> getExitReason() const { return exit_reason_; }
        double getExitCost() const { return exit_cost_; }
        std::optional<double> getRealizedPnl() const { return realized_pnl_; }

        // --- Derived ---
        int daysHeld(const core::Timestamp& now) const; // Calendar days since entry
        double marketValue(double price) const;         // quantity * price
        double unrealizedPnl(double price) const;       // Before exit costs
        // Part of the committed slot not spent on shares or the entry fee
        double residualCash() const;
        double returnPct() const;                        // Realized P&L / capital committed, 0 while open

        // --- Modifiers ---
        // Ignores prices at or below the current highest. Throws std::logic_error once closed.
        void updateHighestPrice(double price);

        // Settles the position. Throws std::logic_error if it is already closed.
        double close(const core::Timestamp& exit_time, double exit_price, core::ExitReason reason, double exit_cost);

        // Restores the trailing-stop reference for a recovered position
        void restoreHighestPrice(double price);

    private:
        std::string instrument_;
        core::Timestamp entry_time_;
        size_t entry_bar_index_;
        double entry_price_;
        long long quantity_;
        double capital_committed_;
        double entry_cost_;
        double stop_loss_price_;
        double take_profit_price_;
        double highest_price_;
        double signal_strength_;
        core::IndicatorSnapshot entry_snapshot_;
        core::PositionStatus status_ = core::PositionStatus::Open;

        std::optional<core::Timestamp> exit_time_;
        std::optional<double> exit_price_;
        std::optional<core::ExitReason> exit_reason_;
        double exit_cost_ = 0.0;
        std::optional<double> realized_pnl_;
    };

} // namespace engine
