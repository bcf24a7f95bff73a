#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace core {

    using json = nlohmann::json;

    enum class SizingMode {
        EqualWeight,       // initial_capital / max_positions
        PercentOfInitial   // initial_capital * capital_per_position_pct / 100
    };

    struct PortfolioConfig {
        int max_positions = 3;
        SizingMode sizing_mode = SizingMode::EqualWeight;
        double capital_per_position_pct = 33.33;
        double transaction_cost_pct = 0.1;
    };

    // All percentages are in percent (10.0 == 10 %)
    struct ExitConfig {
        double stop_loss_pct = 10.0;
        double take_profit_pct = 30.0;
        double trailing_stop_pct = 3.0; // 0 disables the trailing stop
        int min_hold_days = 1;
        int max_hold_days = 250;
    };

    struct EntryConfig {
        double min_signal_strength = 0.37;
        int cooldown_days = 10;
    };

    struct RegimeConfig {
        bool enabled = true;
        int ma_period = 50;
    };

    struct RiskConfig {
        bool enabled = true;
        double max_drawdown_pct = 15.0;
        int max_consecutive_losses = 5;
        int cooldown_days = 10;
    };

    struct LiveConfig {
        int poll_interval_seconds = 300;
        std::string trading_start = "09:15"; // IST
        std::string trading_end = "15:00";   // IST
        bool require_manual_approval = true;
        int price_retry_attempts = 3;
        int price_retry_backoff_ms = 500;
        int max_missed_intervals = 1;
        int history_days = 120;
    };

    struct EngineConfig {
        double initial_capital = 100000.0;
        std::vector<std::string> universe; // Order matters: it breaks strength ties
        std::string benchmark;             // Empty = no regime benchmark
        std::string interval = "day";
        json strategy = json{{"type", "ma_crossover"}}; // Handed to strategy_engine::StrategyFactory

        PortfolioConfig portfolio;
        ExitConfig exits;
        EntryConfig entry;
        RegimeConfig regime;
        RiskConfig risk;
        LiveConfig live;

        // Throws InvalidConfigurationException naming the offending key
        void validate() const;

        double capitalPerPosition() const;

        // Regime gating needs both the switch and a benchmark instrument
        bool regimeActive() const;
    };

    // Reads and parses the JSON file, then validates it. Throws InvalidConfigurationException.
    EngineConfig loadEngineConfig(const std::string& path);

    // Parses an already loaded document (missing keys keep their defaults) and validates it
    EngineConfig parseEngineConfig(const json& document);

    std::string sizingModeToString(SizingMode mode);

} // namespace core
