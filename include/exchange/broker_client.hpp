#pragma once

#include "../types.hpp"

#include <string>

namespace tradebot {
namespace exchange {

enum class OrderState : uint8_t {
    Pending = 0, // Accepted, not yet filled
    Filled,      // Fully filled, fill_price and fee valid
    Cancelled,
    Rejected,
    Unknown // Broker could not report a status
};

inline const char* order_state_to_string(OrderState state) {
    switch (state) {
    case OrderState::Pending:
        return "pending";
    case OrderState::Filled:
        return "filled";
    case OrderState::Cancelled:
        return "cancelled";
    case OrderState::Rejected:
        return "rejected";
    default:
        return "unknown";
    }
}

inline bool is_terminal(OrderState state) {
    return state == OrderState::Filled || state == OrderState::Cancelled || state == OrderState::Rejected;
}

/**
 * Broker answer to place_order.
 * accepted=false means no order exists at the broker; error says why.
 */
struct OrderAck {
    bool accepted = false;
    std::string order_id;
    OrderState state = OrderState::Unknown;
    double fill_price = 0;      // valid when state == Filled
    double filled_quantity = 0; // base units, valid when state == Filled
    double fee = 0;             // quote currency
    std::string error;
};

/**
 * Broker answer to get_order_status
 */
struct OrderStatusReport {
    OrderState state = OrderState::Unknown;
    double fill_price = 0;
    double filled_quantity = 0;
    double fee = 0;
    std::string error;
};

/**
 * IBrokerClient - order placement boundary
 *
 * Market orders only, sized in base units. Implementations must be safe
 * to call from several bot threads at once and may throw
 * std::runtime_error on transport failures.
 */
class IBrokerClient {
public:
    virtual ~IBrokerClient() = default;

    virtual OrderAck place_order(const std::string& pair, Side side, double base_quantity) = 0;
    virtual OrderStatusReport get_order_status(const std::string& order_id) = 0;
};

} // namespace exchange
} // namespace tradebot
