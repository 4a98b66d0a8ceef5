#include "keeper.H"

#include "order_book/pair.H"

#include <chrono>

namespace keeper {

Keeper::Keeper(const KeeperConfig& config,
               exchange::PaperExchange& exchange,
               std::shared_ptr<reporting::OrderHistoryReporter> reporter,
               const gas::OracleFetchers& fetchers,
               std::shared_ptr<spdlog::logger> logger)
    : config(config), exchange(exchange), logger(logger) {

    manager = std::make_unique<orders::OrderBookManager>(
        logger, orders::make_placement_executor(config.placement_workers, logger));

    std::string pair = config.pair;
    manager->get_orders_with([&exchange, pair]() { return exchange.get_orders(pair); });
    manager->get_balances_with([&exchange]() { return exchange.get_balances(); });
    manager->cancel_orders_with([&exchange](const orders::Order& order) { return exchange.cancel_order(order.order_id); });

    if (reporter) {
        manager->enable_history_reporting(reporter,
            [pair](const std::vector<orders::Order>& orders) { return orders::our_buy_orders(orders, pair); },
            [pair](const std::vector<orders::Order>& orders) { return orders::our_sell_orders(orders, pair); });
    }

    gas = gas::GasPriceFactory::create_gas_price(config.gas, fetchers, logger);
}

void Keeper::start() {
    manager->start(std::chrono::seconds(config.refresh_frequency));
}

void Keeper::synchronize_orders() {
    auto book = manager->get_order_book();
    if (book.orders_being_placed || book.orders_being_cancelled) {
        logger->debug("Order book is in progress, not synchronizing orders");
        return;
    }

    std::vector<bool> satisfied(config.orders.size(), false);
    std::vector<orders::Order> orders_to_cancel;
    for (const auto& order : book.orders) {
        if (order.pair != config.pair) {
            continue;
        }

        bool matched = false;
        for (size_t i = 0; i < config.orders.size(); i++) {
            const auto& spec = config.orders[i];
            if (!satisfied[i] && spec.is_sell == order.is_sell && spec.price == order.price && spec.amount == order.amount) {
                satisfied[i] = true;
                matched = true;
                break;
            }
        }
        if (!matched) {
            orders_to_cancel.push_back(order);
        }
    }

    if (!orders_to_cancel.empty()) {
        logger->info("Cancelling {} orders no longer wanted", orders_to_cancel.size());
        manager->cancel_orders(orders_to_cancel);
    }

    for (size_t i = 0; i < config.orders.size(); i++) {
        if (satisfied[i]) {
            continue;
        }
        OrderSpec spec = config.orders[i];
        logger->info("Placing {} order for {} at {}", spec.is_sell ? "sell" : "buy", spec.amount, spec.price);
        manager->place_order([this, spec]() {
            return exchange.place_order(config.pair, spec.is_sell, spec.price, spec.amount);
        });
    }
}

void Keeper::shutdown() {
    logger->info("Shutting down, cancelling all orders");
    manager->wait_for_placements();
    manager->cancel_all_orders();
    manager->stop();
}

} // namespace keeper
