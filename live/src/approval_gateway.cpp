#include "approval_gateway.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace live {

    std::future<bool> AutoApprover::requestApproval(const engine::OrderRequest& order) {
        core::logging::getLogger()->debug("Auto-approved {} {} x {}", core::tradeActionToString(order.action),
                                          order.quantity, order.instrument);
        std::promise<bool> approved;
        approved.set_value(true);
        return approved.get_future();
    }

    ConsoleApprover::ConsoleApprover(std::istream& in, std::ostream& out)
        : in_(in), out_(out) {}

    std::future<bool> ConsoleApprover::requestApproval(const engine::OrderRequest& order) {
        return std::async(std::launch::async, [this, order]() {
            std::lock_guard<std::mutex> lock(io_mutex_);
            out_ << fmt::format("\n[{}] {} {} x {} @ {:.2f} ({})\nApprove? [y/N]: ",
                                core::utils::timestampToString(order.timestamp),
                                core::tradeActionToString(order.action), order.quantity,
                                order.instrument, order.price, order.reason);
            out_.flush();

            std::string answer;
            if (!std::getline(in_, answer)) {
                core::logging::getLogger()->warn("Approval input closed, rejecting {} {}",
                                                 core::tradeActionToString(order.action), order.instrument);
                return false;
            }
            std::transform(answer.begin(), answer.end(), answer.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            bool approved = (answer == "y" || answer == "yes");
            core::logging::getLogger()->info("{} {} {} by operator", core::tradeActionToString(order.action),
                                             order.instrument, approved ? "approved" : "rejected");
            return approved;
        });
    }

} // namespace live
