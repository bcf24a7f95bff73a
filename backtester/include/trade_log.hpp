#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "portfolio.hpp" // engine::Position, engine::EquityPoint

namespace backtester {

    // One row per closed trade, in close order. Fixed formatting, so identical runs give identical bytes.
    void writeTradeLogCsv(std::ostream& out, const std::vector<engine::Position>& closed_trades);
    void writeTradeLogCsv(const std::string& path, const std::vector<engine::Position>& closed_trades);

    void writeEquityCurveCsv(std::ostream& out, const std::vector<engine::EquityPoint>& equity_curve);
    void writeEquityCurveCsv(const std::string& path, const std::vector<engine::EquityPoint>& equity_curve);

} // namespace backtester
