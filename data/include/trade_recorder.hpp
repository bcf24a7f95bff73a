#pragma once

#include <string>
#include <vector>
#include <optional>

#include "datatypes.hpp" // Timestamp, TradeAction

namespace data {

    // One BUY or SELL emitted by the engine
    struct TradeRecord {
        std::string instrument;
        core::TradeAction action = core::TradeAction::Buy;
        double price = 0.0;
        long long quantity = 0;
        double capital = 0.0;            // Capital committed (BUY) or returned (SELL)
        std::string reason;              // Exit reason for SELL, entry signal for BUY
        core::Timestamp timestamp;
        std::optional<double> realized_pnl; // SELL only
    };

    // Snapshot of an open position, enough to rebuild it after a restart
    struct OpenPositionRecord {
        std::string instrument;
        core::Timestamp entry_time;
        double entry_price = 0.0;
        long long quantity = 0;
        double capital_committed = 0.0;
        double entry_cost = 0.0;
        double stop_loss_price = 0.0;
        double take_profit_price = 0.0;
        double highest_price = 0.0;
        double signal_strength = 0.0;
    };

    // Sink for trade records. Implementations throw core::ExternalServiceException on failure.
    class ITradeRecorder {
    public:
        virtual ~ITradeRecorder() = default;
        virtual void record(const TradeRecord& trade) = 0;
    };

    // Crash-recovery storage for the live trader's open positions
    class IPositionStore {
    public:
        virtual ~IPositionStore() = default;
        // Replaces the stored set with 'positions'
        virtual void saveOpenPositions(const std::vector<OpenPositionRecord>& positions) = 0;
        virtual std::vector<OpenPositionRecord> loadOpenPositions() = 0;
    };

} // namespace data
