#include "trade_log.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>

namespace backtester {

    namespace {
        std::string formatSnapshot(const core::IndicatorSnapshot& snapshot) {
            std::string text;
            for (const auto& pair : snapshot) { // std::map: stable key order
                if (!text.empty()) text += ";";
                text += fmt::format("{}={:.4f}", pair.first, pair.second);
            }
            return text;
        }

        std::ofstream openForWrite(const std::string& path) {
            std::ofstream file(path, std::ios::out | std::ios::trunc);
            if (!file.is_open()) {
                throw core::TradingEngineException("Cannot open output file: " + path);
            }
            return file;
        }
    } // end anonymous namespace

    void writeTradeLogCsv(std::ostream& out, const std::vector<engine::Position>& closed_trades) {
        out << "Instrument,Entry Date,Entry Price,Exit Date,Exit Price,Quantity,Capital,Entry Cost,Exit Cost,"
               "PnL,Return %,Days Held,Exit Reason,Signal Strength,Entry Indicators\n";
        for (const auto& trade : closed_trades) {
            if (trade.isOpen()) continue;
            const core::Timestamp exit_time = *trade.getExitTime();
            out << fmt::format("{},{},{:.2f},{},{:.2f},{},{:.2f},{:.2f},{:.2f},{:.2f},{:.2f},{},{},{:.4f},{}\n",
                               trade.getInstrument(),
                               core::utils::dateToString(trade.getEntryTime()),
                               trade.getEntryPrice(),
                               core::utils::dateToString(exit_time),
                               trade.getExitPrice().value_or(0.0),
                               trade.getQuantity(),
                               trade.getCapitalCommitted(),
                               trade.getEntryCost(),
                               trade.getExitCost(),
                               trade.getRealizedPnl().value_or(0.0),
                               trade.returnPct(),
                               trade.daysHeld(exit_time),
                               core::exitReasonToString(*trade.getExitReason()),
                               trade.getSignalStrength(),
                               formatSnapshot(trade.getEntrySnapshot()));
        }
    }

    void writeTradeLogCsv(const std::string& path, const std::vector<engine::Position>& closed_trades) {
        std::ofstream file = openForWrite(path);
        writeTradeLogCsv(file, closed_trades);
        core::logging::getLogger()->info("Wrote {} trades to {}", closed_trades.size(), path);
    }

    void writeEquityCurveCsv(std::ostream& out, const std::vector<engine::EquityPoint>& equity_curve) {
        out << "Date,Free Capital,Positions Value,Total Equity\n";
        for (const auto& point : equity_curve) {
            out << fmt::format("{},{:.2f},{:.2f},{:.2f}\n", core::utils::dateToString(point.timestamp),
                               point.free_capital, point.positions_value, point.total_equity);
        }
    }

    void writeEquityCurveCsv(const std::string& path, const std::vector<engine::EquityPoint>& equity_curve) {
        std::ofstream file = openForWrite(path);
        writeEquityCurveCsv(file, equity_curve);
        core::logging::getLogger()->info("Wrote {} equity points to {}", equity_curve.size(), path);
    }

} // namespace backtester
