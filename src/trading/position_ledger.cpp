#include "../../include/trading/position_ledger.hpp"

#include <algorithm>
#include <cmath>

namespace tradebot::trading {

FillOutcome PositionLedger::record_fill(const Fill& fill) {
    FillOutcome outcome;

    if (!(fill.quantity > 0) || !(fill.price > 0) || !std::isfinite(fill.quantity) || !std::isfinite(fill.price)) {
        outcome.result = FillResult::Invalid;
        LOGF_WARN(logger_, logging::LogCategory::Position, "ignoring invalid fill %s qty=%.8f price=%.2f",
                  fill.fill_id.c_str(), fill.quantity, fill.price);
        return outcome;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!fill.fill_id.empty() && !seen_fills_.insert(fill.fill_id).second) {
        outcome.result = FillResult::Duplicate;
        LOGF_DEBUG(logger_, logging::LogCategory::Position, "duplicate fill %s ignored", fill.fill_id.c_str());
        return outcome;
    }

    PairBook& book = books_[fill.pair];
    book.total_fees += fill.fee;

    if (fill.side == Side::Buy) {
        Lot lot;
        lot.quantity = fill.quantity;
        lot.unit_cost = fill.price + fill.fee / fill.quantity;
        lot.fill_id = fill.fill_id;
        lot.purchase_date = fill.timestamp;
        book.lots.push_back(std::move(lot));
        ++book.buy_count;
        LOGF_DEBUG(logger_, logging::LogCategory::Position, "%s buy lot %.8f @ %.4f", fill.pair.c_str(),
                   fill.quantity, fill.price);
    } else {
        outcome.realized_pnl = apply_sell(book, fill, outcome);
        ++book.sell_count;
    }
    return outcome;
}

double PositionLedger::apply_sell(PairBook& book, const Fill& fill, FillOutcome& outcome) {
    double remaining = fill.quantity;
    double realized = 0;

    while (remaining > QUANTITY_EPSILON && !book.lots.empty()) {
        Lot& lot = book.lots.front();
        double take = std::min(remaining, lot.quantity);

        realized += take * (fill.price - lot.unit_cost);
        lot.quantity -= take;
        remaining -= take;
        outcome.consumed_quantity += take;

        if (lot.quantity <= QUANTITY_EPSILON) {
            book.lots.pop_front();
        }
    }

    realized -= fill.fee;
    book.realized_pnl += realized;

    if (remaining > QUANTITY_EPSILON) {
        outcome.oversold_quantity = remaining;
        LOGF_WARN(logger_, logging::LogCategory::Position, "%s oversell: %.8f beyond held quantity (fill %s)",
                  fill.pair.c_str(), remaining, fill.fill_id.c_str());
    }
    return realized;
}

PositionSummary PositionLedger::summary(const std::string& pair, std::optional<double> current_price) const {
    PositionSummary s;
    s.pair = pair;
    s.current_price = current_price;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(pair);
    if (it == books_.end()) {
        return s;
    }

    const PairBook& book = it->second;
    double cost = 0;
    for (const auto& lot : book.lots) {
        s.current_quantity += lot.quantity;
        cost += lot.quantity * lot.unit_cost;
    }
    s.average_cost_basis = s.current_quantity > QUANTITY_EPSILON ? cost / s.current_quantity : 0;
    s.realized_pnl = book.realized_pnl;
    s.total_fees = book.total_fees;
    s.buy_count = book.buy_count;
    s.sell_count = book.sell_count;
    s.open_lots = book.lots.size();

    if (current_price && s.current_quantity > QUANTITY_EPSILON) {
        s.unrealized_pnl = s.current_quantity * (*current_price - s.average_cost_basis);
    }
    s.total_pnl = s.realized_pnl + s.unrealized_pnl;
    return s;
}

std::vector<Lot> PositionLedger::lots(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(pair);
    if (it == books_.end()) {
        return {};
    }
    return std::vector<Lot>(it->second.lots.begin(), it->second.lots.end());
}

std::vector<std::string> PositionLedger::pairs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(books_.size());
    for (const auto& [pair, book] : books_) {
        out.push_back(pair);
    }
    std::sort(out.begin(), out.end());
    return out;
}

double PositionLedger::quantity(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(pair);
    if (it == books_.end()) {
        return 0;
    }
    double q = 0;
    for (const auto& lot : it->second.lots) {
        q += lot.quantity;
    }
    return q;
}

} // namespace tradebot::trading
