#include "trading_engine.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <stdexcept>

namespace engine {

    PortfolioSettings portfolioSettingsFrom(const core::EngineConfig& config) {
        PortfolioSettings settings;
        settings.initial_capital = config.initial_capital;
        settings.max_positions = config.portfolio.max_positions;
        settings.capital_per_position = config.capitalPerPosition();
        settings.transaction_cost_pct = config.portfolio.transaction_cost_pct;
        settings.cooldown_days = config.entry.cooldown_days;
        return settings;
    }

    TradingEngine::TradingEngine(const core::EngineConfig& config,
                                 strategy_engine::IStrategy& strategy,
                                 const strategy_engine::RegimeFilter& regime,
                                 data::ITradeRecorder* recorder,
                                 IExecutionHandler* execution)
        : config_(config),
          strategy_(strategy),
          regime_(regime),
          recorder_(recorder),
          execution_(execution),
          portfolio_(portfolioSettingsFrom(config)),
          exit_resolver_(config.exits),
          risk_(config.risk, config.initial_capital) {
        config_.validate();
    }

    BarSummary TradingEngine::processBar(const core::Timestamp& now, const std::map<std::string, InstrumentBar>& bars) {
        auto logger = core::logging::getLogger();
        BarSummary summary;

        // --- 1. Exits ---
        summary.exits = processExits(now, bars, summary);

        // --- 2. Mark-to-market and portfolio risk ---
        std::map<std::string, double> prices;
        for (const auto& pair : bars) {
            prices[pair.first] = pair.second.candle.close;
        }
        portfolio_.markToMarket(prices);
        risk_.onEquity(now, portfolio_.currentEquity());

        // --- 3. Entry admission ---
        summary.suspended = risk_.isSuspended(now);
        summary.tradeable = regime_.isTradeable(now);
        if (entries_halted_) {
            logger->debug("{}: entries halted, admission skipped", core::utils::dateToString(now));
        } else if (summary.suspended) {
            logger->debug("{}: circuit breaker active, admission skipped", core::utils::dateToString(now));
        } else if (!summary.tradeable) {
            logger->debug("{}: regime not tradeable, admission skipped", core::utils::dateToString(now));
        } else {
            summary.entries = admitEntries(now, bars);
        }

        // --- 4. Equity record ---
        summary.equity = portfolio_.recordEquity(now, prices).total_equity;
        portfolio_.checkInvariant();
        return summary;
    }

    int TradingEngine::processExits(const core::Timestamp& now, const std::map<std::string, InstrumentBar>& bars, BarSummary& summary) {
        auto logger = core::logging::getLogger();

        // Copy keys: closing a position mutates the map
        std::vector<std::string> held;
        for (const auto& pair : portfolio_.getOpenPositions()) {
            held.push_back(pair.first);
        }

        int exits = 0;
        for (const auto& instrument : held) {
            auto bar_it = bars.find(instrument);
            if (bar_it == bars.end()) {
                ++summary.data_gaps;
                logger->warn("Data gap: no bar for held instrument {} on {}", instrument, core::utils::dateToString(now));
                continue;
            }
            const InstrumentBar& bar = bar_it->second;
            portfolio_.updateHighestPrice(instrument, bar.candle.high);

            auto decision = exit_resolver_.evaluate(portfolio_.getOpenPosition(instrument), bar.candle, now, strategy_, bar.index);
            if (decision && executeExit(instrument, *decision, now)) {
                ++exits;
            }
        }
        return exits;
    }

    bool TradingEngine::executeExit(const std::string& instrument, const ExitDecision& decision, const core::Timestamp& now) {
        auto logger = core::logging::getLogger();
        const Position& open = portfolio_.getOpenPosition(instrument);

        OrderRequest order;
        order.instrument = instrument;
        order.action = core::TradeAction::Sell;
        order.quantity = open.getQuantity();
        order.price = decision.price;
        order.timestamp = now;
        order.reason = core::exitReasonToString(decision.reason);

        if (execution_) {
            if (!execution_->approve(order)) {
                logger->info("Exit of {} ({}) not approved, position stays open", instrument, order.reason);
                return false;
            }
            if (!execution_->submit(order)) {
                logger->error("Exit order for {} failed, position stays open", instrument);
                return false;
            }
        }

        Position closed = portfolio_.closePosition(instrument, now, decision.price, decision.reason);
        const double pnl = closed.getRealizedPnl().value_or(0.0);

        data::TradeRecord record;
        record.instrument = instrument;
        record.action = core::TradeAction::Sell;
        record.price = decision.price;
        record.quantity = closed.getQuantity();
        record.capital = closed.getCapitalCommitted() + pnl;
        record.reason = order.reason;
        record.timestamp = now;
        record.realized_pnl = pnl;
        emit(record);

        risk_.onTradeClosed(now, pnl);
        return true;
    }

    int TradingEngine::admitEntries(const core::Timestamp& now, const std::map<std::string, InstrumentBar>& bars) {
        auto logger = core::logging::getLogger();

        struct Candidate {
            std::string instrument;
            double strength;
        };
        std::vector<Candidate> candidates;

        // Universe order: stable_sort keeps it for equal strengths
        for (const auto& instrument : config_.universe) {
            auto bar_it = bars.find(instrument);
            if (bar_it == bars.end()) continue;

            AdmissionBlock block = portfolio_.canOpen(instrument, now);
            if (block == AdmissionBlock::AlreadyOpen || block == AdmissionBlock::InCooldown) {
                logger->debug("Skip {}: {}", instrument, admissionBlockToString(block));
                continue;
            }

            strategy_engine::SignalResult result = strategy_.signal(instrument, bar_it->second.index);
            if (!result.signal) continue;
            if (result.strength < config_.entry.min_signal_strength) {
                logger->debug("Skip {}: strength {:.3f} below {:.3f}", instrument, result.strength, config_.entry.min_signal_strength);
                continue;
            }
            candidates.push_back({instrument, result.strength});
        }

        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const Candidate& a, const Candidate& b) { return a.strength > b.strength; });

        int entries = 0;
        for (const auto& candidate : candidates) {
            if (portfolio_.openCount() >= portfolio_.getMaxPositions()) {
                logger->debug("All {} slots in use, {} not entered", portfolio_.getMaxPositions(), candidate.instrument);
                break;
            }
            if (executeEntry(candidate.instrument, bars.at(candidate.instrument), candidate.strength, now)) {
                ++entries;
            }
        }
        return entries;
    }

    bool TradingEngine::executeEntry(const std::string& instrument, const InstrumentBar& bar, double strength, const core::Timestamp& now) {
        auto logger = core::logging::getLogger();
        const double price = bar.candle.close;

        const long long quantity = portfolio_.quantityFor(price);
        if (quantity <= 0) {
            logger->debug("Skip {}: slot {:.2f} buys no shares at {:.2f}", instrument, portfolio_.capitalPerPosition(), price);
            return false;
        }

        OrderRequest order;
        order.instrument = instrument;
        order.action = core::TradeAction::Buy;
        order.quantity = quantity;
        order.price = price;
        order.timestamp = now;
        order.reason = fmt::format("Entry signal (strength {:.4f})", strength);

        if (execution_) {
            if (!execution_->approve(order)) {
                logger->info("Entry into {} not approved", instrument);
                return false;
            }
            // Slot and capital are checked again at submission time
            AdmissionBlock block = portfolio_.canOpen(instrument, now);
            if (block != AdmissionBlock::None || entries_halted_) {
                logger->info("Entry into {} dropped after approval: {}", instrument,
                             entries_halted_ ? std::string("entries halted") : admissionBlockToString(block));
                return false;
            }
            if (!execution_->submit(order)) {
                logger->error("Entry order for {} failed", instrument);
                return false;
            }
        }

        try {
            const Position& position = portfolio_.openPosition(
                instrument, now, bar.index, price,
                exit_resolver_.stopLossPrice(price), exit_resolver_.takeProfitPrice(price),
                strength, strategy_.snapshot(instrument, bar.index));

            data::TradeRecord record;
            record.instrument = instrument;
            record.action = core::TradeAction::Buy;
            record.price = price;
            record.quantity = position.getQuantity();
            record.capital = position.getCapitalCommitted();
            record.reason = order.reason;
            record.timestamp = now;
            emit(record);
            return true;
        } catch (const core::InsufficientCapitalException& e) {
            logger->debug("Skip {}: {}", instrument, e.what());
            return false;
        }
    }

    void TradingEngine::emit(const data::TradeRecord& record) {
        if (!recorder_) return;
        try {
            recorder_->record(record);
        } catch (const core::ExternalServiceException& e) {
            core::logging::getLogger()->error("Failed to persist {} {}: {}", core::tradeActionToString(record.action),
                                              record.instrument, e.what());
        }
    }

} // namespace engine
