#pragma once

#include <string>
#include "datatypes.hpp"

namespace engine {

    // An order the engine wants filled before it touches the ledger
    struct OrderRequest {
        std::string instrument;
        core::TradeAction action = core::TradeAction::Buy;
        long long quantity = 0;
        double price = 0.0;      // Expected fill price
        core::Timestamp timestamp;
        std::string reason;
    };

    // Hook between a decision and the ledger. Without one the engine fills immediately
    // at the decided price (backtest). The live trader plugs in approval and a broker.
    class IExecutionHandler {
    public:
        virtual ~IExecutionHandler() = default;

        // Blocks until the order is approved or rejected
        virtual bool approve(const OrderRequest& order) = 0;

        // Sends the order. False leaves the ledger untouched.
        virtual bool submit(const OrderRequest& order) = 0;
    };

} // namespace engine
