#pragma once

#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "interfaces.hpp"     // strategy_engine::IStrategy
#include "regime_filter.hpp"
#include "trade_recorder.hpp" // data::ITradeRecorder
#include "portfolio.hpp"
#include "exit_resolver.hpp"
#include "risk_governor.hpp"
#include "execution.hpp"

namespace engine {

    // The bar an instrument prints at the current timestamp, with its index in the
    // candle series the strategy was prepared on
    struct InstrumentBar {
        core::Candle candle;
        size_t index = 0;
    };

    struct BarSummary {
        int exits = 0;
        int entries = 0;
        int data_gaps = 0;       // Held instruments without a bar
        bool suspended = false;  // Risk governor blocked entries
        bool tradeable = true;   // Regime allowed entries
        double equity = 0.0;
    };

    // The per-bar step shared by the backtest and live drivers:
    // exits -> mark-to-market -> risk -> entry admission -> equity record.
    // Owns its ledger; the strategy, regime filter, recorder and execution handler are borrowed.
    class TradingEngine {
    public:
        TradingEngine(const core::EngineConfig& config,
                      strategy_engine::IStrategy& strategy,
                      const strategy_engine::RegimeFilter& regime,
                      data::ITradeRecorder* recorder = nullptr,
                      IExecutionHandler* execution = nullptr);

        BarSummary processBar(const core::Timestamp& now, const std::map<std::string, InstrumentBar>& bars);

        // Blocks all further entries (live shutdown); exits keep working
        void haltEntries() { entries_halted_ = true; }
        bool entriesHalted() const { return entries_halted_; }

        const Portfolio& getPortfolio() const { return portfolio_; }
        Portfolio& getPortfolio() { return portfolio_; }
        const RiskGovernor& getRiskGovernor() const { return risk_; }
        const ExitResolver& getExitResolver() const { return exit_resolver_; }
        const core::EngineConfig& getConfig() const { return config_; }

    private:
        int processExits(const core::Timestamp& now, const std::map<std::string, InstrumentBar>& bars, BarSummary& summary);
        int admitEntries(const core::Timestamp& now, const std::map<std::string, InstrumentBar>& bars);
        bool executeExit(const std::string& instrument, const ExitDecision& decision, const core::Timestamp& now);
        bool executeEntry(const std::string& instrument, const InstrumentBar& bar, double strength, const core::Timestamp& now);
        void emit(const data::TradeRecord& record);

        core::EngineConfig config_;
        strategy_engine::IStrategy& strategy_;
        const strategy_engine::RegimeFilter& regime_;
        data::ITradeRecorder* recorder_;
        IExecutionHandler* execution_;

        Portfolio portfolio_;
        ExitResolver exit_resolver_;
        RiskGovernor risk_;
        bool entries_halted_ = false;
    };

    PortfolioSettings portfolioSettingsFrom(const core::EngineConfig& config);

} // namespace engine
