#pragma once

#include <string>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp> // Include JSON library header

#include "interfaces.hpp"

namespace strategy_engine {

    using json = nlohmann::json; // Alias for convenience

    class StrategyFactory {
    public:
        // Creates a strategy from the "strategy" config object:
        //   { "type": "ma_crossover" | "macd" | "rsi", ...variant parameters... }
        // Missing parameters take the variant defaults.
        // Throws core::StrategyException for unknown types or bad parameters.
        static std::unique_ptr<IStrategy> createStrategy(const json& config);
    };

} // namespace strategy_engine
