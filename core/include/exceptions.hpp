#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class TradingEngineException : public std::runtime_error {
    public:
        explicit TradingEngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit TradingEngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types

    // Missing price for a scheduled evaluation. Recovered per instrument.
    class DataGapException : public TradingEngineException {
    public: using TradingEngineException::TradingEngineException; };

    // Entry cannot be funded. Never fatal, the entry is skipped.
    class InsufficientCapitalException : public TradingEngineException {
    public: using TradingEngineException::TradingEngineException; };

    // Parameters out of range. Fatal, the run does not start.
    class InvalidConfigurationException : public TradingEngineException {
    public: using TradingEngineException::TradingEngineException; };

    // Broker, market data or store unavailable.
    class ExternalServiceException : public TradingEngineException {
    public: using TradingEngineException::TradingEngineException; };

    // Broker rejected the credentials. Fatal for a live run.
    class AuthenticationException : public ExternalServiceException {
    public: using ExternalServiceException::ExternalServiceException; };

    class DataLoadException : public TradingEngineException {
    public: using TradingEngineException::TradingEngineException; };

    class IndicatorCalculationException : public TradingEngineException {
    public: using TradingEngineException::TradingEngineException; };

    class StrategyException : public InvalidConfigurationException {
    public: using InvalidConfigurationException::InvalidConfigurationException; };

} // namespace core
