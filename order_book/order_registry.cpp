#include "order_registry.H"

#include <algorithm>
#include <stdexcept>

namespace keeper::orders {

OrderRegistry::OrderRegistry(std::shared_ptr<spdlog::logger> logger) : logger(logger) {}

void OrderRegistry::begin_placement() {
    currently_placing_orders++;
}

void OrderRegistry::end_placement() {
    if (currently_placing_orders == 0) {
        // unbalanced bracket, a caller bug rather than a venue race
        logger->error("end_placement called with no placement in flight");
        return;
    }
    currently_placing_orders--;
}

void OrderRegistry::record_placed(const Order& order) {
    if (order.order_id.empty()) {
        throw std::invalid_argument("Placed order has no order id");
    }
    orders_placed.push_back({order, next_sequence++});
    logger->info("Recorded placed order {} {} {} @ {} on {}", order.order_id,
                 order.is_sell ? "sell" : "buy", order.amount, order.price, order.pair);
}

bool OrderRegistry::begin_cancel(const std::string& order_id) {
    if (order_ids_cancelled.count(order_id)) {
        logger->info("Order {} is already cancelled", order_id);
        return false;
    }
    if (!order_ids_cancelling.insert(order_id).second) {
        logger->debug("Order {} is already being cancelled", order_id);
    }
    return true;
}

void OrderRegistry::confirm_cancel(const std::string& order_id) {
    if (order_ids_cancelling.erase(order_id) == 0) {
        logger->warn("Cancel confirmed for order {} which was not being cancelled", order_id);
        return;
    }
    order_ids_cancelled.insert(order_id);

    orders_placed.erase(std::remove_if(orders_placed.begin(), orders_placed.end(),
                                       [&order_id](const PlacedOrder& placed) {
                                           return placed.order.order_id == order_id;
                                       }),
                        orders_placed.end());
}

void OrderRegistry::abandon_cancel(const std::string& order_id) {
    if (order_ids_cancelling.erase(order_id) == 0) {
        logger->info("Failed to remove {} from orders being cancelled", order_id);
    }
}

bool OrderRegistry::is_cancelling(const std::string& order_id) const {
    return order_ids_cancelling.count(order_id) > 0;
}

bool OrderRegistry::is_cancelled(const std::string& order_id) const {
    return order_ids_cancelled.count(order_id) > 0;
}

std::vector<Order> OrderRegistry::orders_placed_since(uint64_t sequence) const {
    std::vector<Order> result;
    for (const auto& placed : orders_placed) {
        if (placed.sequence >= sequence) {
            result.push_back(placed.order);
        }
    }
    return result;
}

RegistrySnapshot OrderRegistry::snapshot() const {
    RegistrySnapshot snap;
    snap.orders_placed.reserve(orders_placed.size());
    for (const auto& placed : orders_placed) {
        snap.orders_placed.push_back(placed.order);
    }
    snap.order_ids_cancelling = order_ids_cancelling;
    snap.order_ids_cancelled = order_ids_cancelled;
    snap.currently_placing_orders = currently_placing_orders;
    return snap;
}

PendingCancel::PendingCancel(OrderRegistry& registry, std::string order_id)
    : registry(registry), order_id(std::move(order_id)) {
    active = registry.begin_cancel(this->order_id);
}

PendingCancel::~PendingCancel() {
    if (active) {
        registry.abandon_cancel(order_id);
    }
}

void PendingCancel::confirm() {
    if (!active) {
        return;
    }
    active = false;
    registry.confirm_cancel(order_id);
}

} // namespace keeper::orders
