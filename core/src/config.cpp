#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <set>
#include <stdexcept>

namespace core {

    namespace { // File-local parsing helpers

        [[noreturn]] void fail(const std::string& key, const std::string& message) {
            throw InvalidConfigurationException(fmt::format("Invalid configuration '{}': {}", key, message));
        }

        const json* section(const json& document, const std::string& key) {
            if (!document.contains(key)) return nullptr;
            if (!document[key].is_object()) fail(key, "must be an object");
            return &document[key];
        }

        void readDouble(const json& obj, const std::string& key, const std::string& path, double& out) {
            if (!obj.contains(key)) return;
            if (!obj[key].is_number()) fail(path + key, "must be a number");
            out = obj[key].get<double>();
        }

        void readInt(const json& obj, const std::string& key, const std::string& path, int& out) {
            if (!obj.contains(key)) return;
            if (!obj[key].is_number_integer()) fail(path + key, "must be an integer");
            out = obj[key].get<int>();
        }

        void readBool(const json& obj, const std::string& key, const std::string& path, bool& out) {
            if (!obj.contains(key)) return;
            if (!obj[key].is_boolean()) fail(path + key, "must be a boolean");
            out = obj[key].get<bool>();
        }

        void readString(const json& obj, const std::string& key, const std::string& path, std::string& out) {
            if (!obj.contains(key)) return;
            if (!obj[key].is_string()) fail(path + key, "must be a string");
            out = obj[key].get<std::string>();
        }

        SizingMode stringToSizingMode(const std::string& mode) {
            if (mode == "equal_weight") return SizingMode::EqualWeight;
            if (mode == "percent_of_initial") return SizingMode::PercentOfInitial;
            fail("portfolio.sizing_mode", "must be 'equal_weight' or 'percent_of_initial', got '" + mode + "'");
        }

        void require(bool condition, const std::string& key, const std::string& message) {
            if (!condition) fail(key, message);
        }

    } // end anonymous namespace

    std::string sizingModeToString(SizingMode mode) {
        return mode == SizingMode::PercentOfInitial ? "percent_of_initial" : "equal_weight";
    }

    double EngineConfig::capitalPerPosition() const {
        if (portfolio.sizing_mode == SizingMode::PercentOfInitial) {
            return initial_capital * portfolio.capital_per_position_pct / 100.0;
        }
        return initial_capital / static_cast<double>(portfolio.max_positions);
    }

    bool EngineConfig::regimeActive() const {
        return regime.enabled && !benchmark.empty();
    }

    void EngineConfig::validate() const {
        require(initial_capital > 0.0, "initial_capital", "must be positive");
        require(!universe.empty(), "universe", "must list at least one instrument");
        std::set<std::string> seen;
        for (const auto& key : universe) {
            require(!key.empty(), "universe", "instrument keys must not be empty");
            require(seen.insert(key).second, "universe", "duplicate instrument '" + key + "'");
        }
        require(!interval.empty(), "interval", "must not be empty");

        require(portfolio.max_positions >= 1, "portfolio.max_positions", "must be at least 1");
        require(portfolio.transaction_cost_pct >= 0.0 && portfolio.transaction_cost_pct < 100.0,
                "portfolio.transaction_cost_pct", "must be in [0, 100)");
        if (portfolio.sizing_mode == SizingMode::PercentOfInitial) {
            require(portfolio.capital_per_position_pct > 0.0, "portfolio.capital_per_position_pct", "must be positive");
            require(portfolio.capital_per_position_pct * portfolio.max_positions <= 100.0 + 1e-9,
                    "portfolio.capital_per_position_pct", "times max_positions must not exceed 100");
        }

        require(exits.stop_loss_pct > 0.0 && exits.stop_loss_pct < 100.0, "exits.stop_loss_pct", "must be in (0, 100)");
        require(exits.take_profit_pct > 0.0, "exits.take_profit_pct", "must be positive");
        require(exits.stop_loss_pct < exits.take_profit_pct, "exits.stop_loss_pct",
                "must be smaller than exits.take_profit_pct");
        require(exits.trailing_stop_pct >= 0.0 && exits.trailing_stop_pct < 100.0,
                "exits.trailing_stop_pct", "must be in [0, 100)");
        require(exits.max_hold_days >= 1, "exits.max_hold_days", "must be at least 1");
        require(exits.min_hold_days >= 0 && exits.min_hold_days <= exits.max_hold_days,
                "exits.min_hold_days", "must be in [0, max_hold_days]");

        require(entry.min_signal_strength >= 0.0 && entry.min_signal_strength <= 1.0,
                "entry.min_signal_strength", "must be in [0, 1]");
        require(entry.cooldown_days >= 0, "entry.cooldown_days", "must not be negative");

        require(regime.ma_period >= 1, "regime.ma_period", "must be at least 1");

        require(risk.max_drawdown_pct > 0.0 && risk.max_drawdown_pct <= 100.0,
                "risk.max_drawdown_pct", "must be in (0, 100]");
        require(risk.max_consecutive_losses >= 1, "risk.max_consecutive_losses", "must be at least 1");
        require(risk.cooldown_days >= 0, "risk.cooldown_days", "must not be negative");

        require(live.poll_interval_seconds >= 1, "live.poll_interval_seconds", "must be at least 1");
        require(live.price_retry_attempts >= 1, "live.price_retry_attempts", "must be at least 1");
        require(live.price_retry_backoff_ms >= 0, "live.price_retry_backoff_ms", "must not be negative");
        require(live.max_missed_intervals >= 1, "live.max_missed_intervals", "must be at least 1");
        require(live.history_days >= 1, "live.history_days", "must be at least 1");
        int start_minutes = 0;
        int end_minutes = 0;
        try {
            start_minutes = utils::parseTimeOfDay(live.trading_start);
            end_minutes = utils::parseTimeOfDay(live.trading_end);
        } catch (const std::invalid_argument& e) {
            fail("live.trading_start/trading_end", e.what());
        }
        require(start_minutes < end_minutes, "live.trading_start", "must be earlier than live.trading_end");
    }

    EngineConfig parseEngineConfig(const json& document) {
        if (!document.is_object()) {
            throw InvalidConfigurationException("Configuration root must be a JSON object.");
        }

        EngineConfig config;
        readDouble(document, "initial_capital", "", config.initial_capital);
        if (document.contains("universe")) {
            if (!document["universe"].is_array()) fail("universe", "must be an array of instrument keys");
            for (const auto& item : document["universe"]) {
                if (!item.is_string()) fail("universe", "must contain only strings");
                config.universe.push_back(item.get<std::string>());
            }
        }
        readString(document, "benchmark", "", config.benchmark);
        readString(document, "interval", "", config.interval);
        if (document.contains("strategy")) {
            if (!document["strategy"].is_object()) fail("strategy", "must be an object");
            config.strategy = document["strategy"];
        }

        // --- Portfolio ---
        if (const json* s = section(document, "portfolio")) {
            readInt(*s, "max_positions", "portfolio.", config.portfolio.max_positions);
            std::string mode = sizingModeToString(config.portfolio.sizing_mode);
            readString(*s, "sizing_mode", "portfolio.", mode);
            config.portfolio.sizing_mode = stringToSizingMode(mode);
            readDouble(*s, "capital_per_position_pct", "portfolio.", config.portfolio.capital_per_position_pct);
            readDouble(*s, "transaction_cost_pct", "portfolio.", config.portfolio.transaction_cost_pct);
        }

        // --- Exits ---
        if (const json* s = section(document, "exits")) {
            readDouble(*s, "stop_loss_pct", "exits.", config.exits.stop_loss_pct);
            readDouble(*s, "take_profit_pct", "exits.", config.exits.take_profit_pct);
            readDouble(*s, "trailing_stop_pct", "exits.", config.exits.trailing_stop_pct);
            readInt(*s, "min_hold_days", "exits.", config.exits.min_hold_days);
            readInt(*s, "max_hold_days", "exits.", config.exits.max_hold_days);
        }

        // --- Entry ---
        if (const json* s = section(document, "entry")) {
            readDouble(*s, "min_signal_strength", "entry.", config.entry.min_signal_strength);
            readInt(*s, "cooldown_days", "entry.", config.entry.cooldown_days);
        }

        // --- Regime ---
        if (const json* s = section(document, "regime")) {
            readBool(*s, "enabled", "regime.", config.regime.enabled);
            readInt(*s, "ma_period", "regime.", config.regime.ma_period);
        }

        // --- Risk ---
        if (const json* s = section(document, "risk")) {
            readBool(*s, "enabled", "risk.", config.risk.enabled);
            readDouble(*s, "max_drawdown_pct", "risk.", config.risk.max_drawdown_pct);
            readInt(*s, "max_consecutive_losses", "risk.", config.risk.max_consecutive_losses);
            readInt(*s, "cooldown_days", "risk.", config.risk.cooldown_days);
        }

        // --- Live ---
        if (const json* s = section(document, "live")) {
            readInt(*s, "poll_interval_seconds", "live.", config.live.poll_interval_seconds);
            readString(*s, "trading_start", "live.", config.live.trading_start);
            readString(*s, "trading_end", "live.", config.live.trading_end);
            readBool(*s, "require_manual_approval", "live.", config.live.require_manual_approval);
            readInt(*s, "price_retry_attempts", "live.", config.live.price_retry_attempts);
            readInt(*s, "price_retry_backoff_ms", "live.", config.live.price_retry_backoff_ms);
            readInt(*s, "max_missed_intervals", "live.", config.live.max_missed_intervals);
            readInt(*s, "history_days", "live.", config.live.history_days);
        }

        config.validate();
        return config;
    }

    EngineConfig loadEngineConfig(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading configuration from '{}'", path);

        std::ifstream file(path);
        if (!file.is_open()) {
            throw InvalidConfigurationException("Could not open configuration file: " + path);
        }

        json document;
        try {
            file >> document;
        } catch (const json::parse_error& e) {
            throw InvalidConfigurationException(fmt::format("Failed to parse configuration file '{}': {}", path, e.what()));
        }

        EngineConfig config = parseEngineConfig(document);
        logger->info("Configuration loaded: {} instruments, capital {:.2f}, max_positions {}, sizing {}",
                     config.universe.size(), config.initial_capital, config.portfolio.max_positions,
                     sizingModeToString(config.portfolio.sizing_mode));
        return config;
    }

} // namespace core
