#include "paper_exchange.H"

#include "common/utils.H"
#include "order_book/pair.H"

#include <stdexcept>
#include <thread>

namespace keeper::exchange {

PaperExchange::SessionRequest::SessionRequest(PaperExchange& exchange) : exchange(exchange) {
    if (exchange.session_busy.exchange(true)) {
        throw std::runtime_error("Order session busy, concurrent request rejected");
    }
    exchange.requests++;
    if (exchange.session_latency.count() > 0) {
        std::this_thread::sleep_for(exchange.session_latency);
    }
}

PaperExchange::SessionRequest::~SessionRequest() {
    exchange.session_busy = false;
}

PaperExchange::PaperExchange(std::string pair, orders::Balances balances, std::shared_ptr<spdlog::logger> logger)
    : pair(pair), base(orders::token_sell(pair)), quote(orders::token_buy(pair)), available(std::move(balances)), logger(logger) {
    logger->info("Paper exchange for {} ({} / {})", this->pair, base, quote);
}

std::vector<orders::Order> PaperExchange::get_orders(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<orders::Order> result;
    for (const auto& [order_id, order] : open_orders) {
        if (order.pair == pair) {
            result.push_back(order);
        }
    }
    return result;
}

orders::Balances PaperExchange::get_balances() const {
    std::lock_guard<std::mutex> lock(mutex);
    return available;
}

std::optional<orders::Order> PaperExchange::place_order(const std::string& pair, bool is_sell, double price, double amount) {
    SessionRequest request(*this);
    if (pair != this->pair) {
        throw std::invalid_argument("Unknown pair " + pair);
    }
    if (price <= 0 || amount <= 0) {
        throw std::invalid_argument("Price and amount must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex);
    const std::string& token = is_sell ? base : quote;
    double locked = is_sell ? amount : amount * price;
    if (available[token] < locked) {
        logger->warn("Insufficient {} to place {} order: need {}, have {}", token,
                     is_sell ? "sell" : "buy", locked, available[token]);
        return std::nullopt;
    }
    available[token] -= locked;

    orders::Order order("paper-" + std::to_string(next_order_id++), unix_time(), pair, is_sell, price, amount);
    open_orders.emplace(order.order_id, order);
    logger->info("Paper order {} placed", order.order_id);
    return order;
}

bool PaperExchange::cancel_order(const std::string& order_id) {
    SessionRequest request(*this);

    std::lock_guard<std::mutex> lock(mutex);
    auto it = open_orders.find(order_id);
    if (it == open_orders.end()) {
        logger->warn("Paper order {} not found", order_id);
        return false;
    }

    const auto& order = it->second;
    if (order.is_sell) {
        available[base] += order.amount;
    } else {
        available[quote] += order.amount * order.price;
    }
    open_orders.erase(it);
    logger->info("Paper order {} cancelled", order_id);
    return true;
}

bool PaperExchange::fill_order(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = open_orders.find(order_id);
    if (it == open_orders.end()) {
        return false;
    }

    const auto& order = it->second;
    if (order.is_sell) {
        available[quote] += order.amount * order.price;
    } else {
        available[base] += order.amount;
    }
    open_orders.erase(it);
    logger->info("Paper order {} filled", order_id);
    return true;
}

} // namespace keeper::exchange
