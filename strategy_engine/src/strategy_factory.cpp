#include "strategy_factory.hpp"
#include "ma_crossover_strategy.hpp"  // Concrete strategies...
#include "macd_strategy.hpp"
#include "rsi_strategy.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <stdexcept>              // For std::invalid_argument
#include <type_traits>
#include <string>
#include <memory>

namespace strategy_engine {

    using json = nlohmann::json; // Alias

    namespace { // Use anonymous namespace for file-local helpers

        template<typename T>
        void readParam(const json& config, const std::string& key, T& out) {
            if (!config.contains(key)) return;
            const json& value = config[key];
            if constexpr (std::is_same_v<T, bool>) {
                if (!value.is_boolean()) throw std::invalid_argument(fmt::format("'{}' must be a boolean.", key));
            } else if constexpr (std::is_integral_v<T>) {
                if (!value.is_number_integer()) throw std::invalid_argument(fmt::format("'{}' must be an integer.", key));
            } else {
                if (!value.is_number()) throw std::invalid_argument(fmt::format("'{}' must be a number.", key));
            }
            out = value.get<T>();
        }

        std::unique_ptr<IStrategy> createMaCrossover(const json& config) {
            MaCrossoverParams params;
            readParam(config, "fast_period", params.fast_period);
            readParam(config, "slow_period", params.slow_period);
            readParam(config, "volume_period", params.volume_period);
            readParam(config, "use_volume_filter", params.use_volume_filter);
            readParam(config, "volume_multiplier", params.volume_multiplier);
            return std::make_unique<MaCrossoverStrategy>(params);
        }

        std::unique_ptr<IStrategy> createMacd(const json& config) {
            MacdParams params;
            readParam(config, "fast_period", params.fast_period);
            readParam(config, "slow_period", params.slow_period);
            readParam(config, "signal_period", params.signal_period);
            readParam(config, "histogram_threshold", params.histogram_threshold);
            readParam(config, "use_trend_filter", params.use_trend_filter);
            readParam(config, "trend_period", params.trend_period);
            readParam(config, "use_volume_filter", params.use_volume_filter);
            readParam(config, "volume_period", params.volume_period);
            readParam(config, "volume_multiplier", params.volume_multiplier);
            return std::make_unique<MacdStrategy>(params);
        }

        std::unique_ptr<IStrategy> createRsi(const json& config) {
            RsiParams params;
            readParam(config, "period", params.period);
            readParam(config, "oversold", params.oversold);
            readParam(config, "overbought", params.overbought);
            return std::make_unique<RsiStrategy>(params);
        }

    } // end anonymous namespace

    // --- Main Factory Method ---
    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config) {
        auto logger = core::logging::getLogger();
        logger->debug("Attempting to create strategy from JSON config...");

        try {
            // --- Basic Validation ---
            if (!config.is_object()) throw std::invalid_argument("Strategy config must be a JSON object.");
            if (!config.contains("type") || !config["type"].is_string()) throw std::invalid_argument("Strategy config missing 'type'.");
            const std::string type = config["type"].get<std::string>();

            std::unique_ptr<IStrategy> strategy;
            if (type == "ma_crossover") {
                strategy = createMaCrossover(config);
            } else if (type == "macd") {
                strategy = createMacd(config);
            } else if (type == "rsi") {
                strategy = createRsi(config);
            } else {
                throw std::invalid_argument("Unknown strategy type: '" + type + "'");
            }

            logger->info("Successfully created strategy: '{}'", strategy->getName());
            return strategy;

        } catch (const json::exception& e) {
            logger->error("JSON error while creating strategy: {}", e.what());
            throw core::StrategyException(fmt::format("Invalid strategy configuration: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid strategy configuration: {}", e.what());
            throw core::StrategyException(fmt::format("Invalid strategy configuration: {}", e.what()));
        }
    }

} // namespace strategy_engine
