#include "position.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace engine {

    Position::Position(const EntryFill& fill)
        : instrument_(fill.instrument),
          entry_time_(fill.timestamp),
          entry_bar_index_(fill.bar_index),
          entry_price_(fill.price),
          quantity_(fill.quantity),
          capital_committed_(fill.capital_committed),
          entry_cost_(fill.entry_cost),
          stop_loss_price_(fill.stop_loss_price),
          take_profit_price_(fill.take_profit_price),
          highest_price_(fill.price),
          signal_strength_(fill.signal_strength),
          entry_snapshot_(fill.snapshot) {
        if (instrument_.empty()) {
            throw std::invalid_argument("Position requires an instrument key.");
        }
        if (quantity_ <= 0) {
            throw std::invalid_argument(fmt::format("Position quantity must be positive for {}, got {}", instrument_, quantity_));
        }
        if (!(stop_loss_price_ < entry_price_ && entry_price_ < take_profit_price_)) {
            throw std::invalid_argument(fmt::format("Position for {} requires stop ({:.2f}) < entry ({:.2f}) < target ({:.2f})",
                                                    instrument_, stop_loss_price_, entry_price_, take_profit_price_));
        }
    }

    int Position::daysHeld(const core::Timestamp& now) const {
        return core::utils::daysBetween(entry_time_, now);
    }

    double Position::marketValue(double price) const {
        return static_cast<double>(quantity_) * price;
    }

    double Position::unrealizedPnl(double price) const {
        return static_cast<double>(quantity_) * (price - entry_price_) - entry_cost_;
    }

    double Position::residualCash() const {
        return capital_committed_ - static_cast<double>(quantity_) * entry_price_ - entry_cost_;
    }

    double Position::returnPct() const {
        if (!realized_pnl_ || capital_committed_ == 0.0) return 0.0;
        return *realized_pnl_ / capital_committed_ * 100.0;
    }

    void Position::updateHighestPrice(double price) {
        if (!isOpen()) {
            throw std::logic_error("Cannot update highest price of a closed position: " + instrument_);
        }
        if (price > highest_price_) {
            highest_price_ = price;
        }
    }

    void Position::restoreHighestPrice(double price) {
        if (price > highest_price_) {
            highest_price_ = price;
        }
    }

    double Position::close(const core::Timestamp& exit_time, double exit_price, core::ExitReason reason, double exit_cost) {
        if (!isOpen()) {
            throw std::logic_error("Position already closed: " + instrument_);
        }
        const double qty = static_cast<double>(quantity_);
        const double pnl = qty * exit_price - exit_cost - qty * entry_price_ - entry_cost_;

        status_ = core::PositionStatus::Closed;
        exit_time_ = exit_time;
        exit_price_ = exit_price;
        exit_reason_ = reason;
        exit_cost_ = exit_cost;
        realized_pnl_ = pnl;
        return pnl;
    }

} // namespace engine
