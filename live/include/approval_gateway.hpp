#pragma once

#include <future>
#include <iostream>
#include <mutex>

#include "execution.hpp" // engine::OrderRequest

namespace live {

    // Human (or automatic) sign-off for an order. The trader waits on the future
    // before it touches the ledger.
    class IApprovalGateway {
    public:
        virtual ~IApprovalGateway() = default;
        virtual std::future<bool> requestApproval(const engine::OrderRequest& order) = 0;
    };

    // Approves everything (require_manual_approval = false)
    class AutoApprover : public IApprovalGateway {
    public:
        std::future<bool> requestApproval(const engine::OrderRequest& order) override;
    };

    // Prompts on a terminal: "y"/"yes" approves, anything else (or end of input) rejects
    class ConsoleApprover : public IApprovalGateway {
    public:
        explicit ConsoleApprover(std::istream& in = std::cin, std::ostream& out = std::cout);
        std::future<bool> requestApproval(const engine::OrderRequest& order) override;

    private:
        std::istream& in_;
        std::ostream& out_;
        std::mutex io_mutex_;
    };

} // namespace live
