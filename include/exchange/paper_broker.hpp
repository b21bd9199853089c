#pragma once

#include "../config/defaults.hpp"
#include "broker_client.hpp"
#include "market_data.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tradebot {
namespace exchange {

/**
 * PaperBroker - simulated broker for paper trading and tests
 *
 * Market orders fill at the provider's current price with adverse
 * slippage and a commission on notional. With immediate fills disabled
 * orders stay pending until the next get_order_status call, which is how
 * a real broker behaves between placement and the order monitor's poll.
 */
class PaperBroker : public IBrokerClient {
public:
    static constexpr double DEFAULT_SLIPPAGE_BPS = 5.0;

    explicit PaperBroker(IMarketDataProvider& market)
        : market_(market)
        , commission_rate_(config::execution::PAPER_COMMISSION_PCT)
        , slippage_bps_(DEFAULT_SLIPPAGE_BPS)
        , fill_immediately_(true)
        , fail_next_(false)
        , next_order_id_(1)
        , total_orders_(0)
        , total_fills_(0)
        , total_commission_(0) {}

    void set_commission_rate(double rate) {
        std::lock_guard<std::mutex> lock(mutex_);
        commission_rate_ = rate;
    }

    void set_slippage_bps(double bps) {
        std::lock_guard<std::mutex> lock(mutex_);
        slippage_bps_ = bps;
    }

    void set_fill_immediately(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        fill_immediately_ = enabled;
    }

    // Next place_order is rejected
    void fail_next_order() {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_next_ = true;
    }

    OrderAck place_order(const std::string& pair, Side side, double base_quantity) override {
        OrderAck ack;
        std::optional<double> price = market_.get_price(pair);

        std::lock_guard<std::mutex> lock(mutex_);
        ++total_orders_;

        if (fail_next_) {
            fail_next_ = false;
            ack.error = "paper broker: simulated rejection";
            return ack;
        }
        if (!price || *price <= 0) {
            ack.error = "paper broker: no price for " + pair;
            return ack;
        }
        if (base_quantity <= 0) {
            ack.error = "paper broker: invalid quantity";
            return ack;
        }

        ack.accepted = true;
        ack.order_id = "paper-" + std::to_string(next_order_id_++);

        OrderStatusReport fill = simulate_fill(side, base_quantity, *price);
        if (fill_immediately_) {
            ack.state = OrderState::Filled;
            ack.fill_price = fill.fill_price;
            ack.filled_quantity = fill.filled_quantity;
            ack.fee = fill.fee;
            record_fill(fill);
        } else {
            ack.state = OrderState::Pending;
        }
        orders_[ack.order_id] = Order{fill, fill_immediately_};
        return ack;
    }

    OrderStatusReport get_order_status(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it == orders_.end()) {
            OrderStatusReport unknown;
            unknown.error = "paper broker: unknown order " + order_id;
            return unknown;
        }
        if (!it->second.filled) {
            it->second.filled = true;
            record_fill(it->second.report);
        }
        return it->second.report;
    }

    uint64_t total_orders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_orders_;
    }

    uint64_t total_fills() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_fills_;
    }

    double total_commission() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_commission_;
    }

private:
    struct Order {
        OrderStatusReport report;
        bool filled;
    };

    IMarketDataProvider& market_;
    mutable std::mutex mutex_;
    double commission_rate_;
    double slippage_bps_;
    bool fill_immediately_;
    bool fail_next_;
    uint64_t next_order_id_;
    uint64_t total_orders_;
    uint64_t total_fills_;
    double total_commission_;
    std::unordered_map<std::string, Order> orders_;

    // Slippage always adverse: buys pay more, sells receive less
    OrderStatusReport simulate_fill(Side side, double quantity, double price) const {
        double slippage = price * slippage_bps_ / 10000.0;
        OrderStatusReport report;
        report.state = OrderState::Filled;
        report.fill_price = (side == Side::Buy) ? price + slippage : price - slippage;
        report.filled_quantity = quantity;
        report.fee = quantity * report.fill_price * commission_rate_;
        return report;
    }

    void record_fill(const OrderStatusReport& report) {
        ++total_fills_;
        total_commission_ += report.fee;
    }
};

} // namespace exchange
} // namespace tradebot
