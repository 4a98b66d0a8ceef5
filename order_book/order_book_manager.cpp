#include "order_book_manager.H"

#include "common/utils.H"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace keeper::orders {

namespace {

// clears the in-progress flag however a refresh exits
struct RefreshInProgress {
    explicit RefreshInProgress(std::atomic<bool>& flag) : flag(flag) {}
    ~RefreshInProgress() { flag = false; }
    std::atomic<bool>& flag;
};

// hands the placement turn to the next ticket however an attempt exits
struct PlacementTurn {
    PlacementTurn(uint64_t& serving_ticket, std::condition_variable& cv) : serving_ticket(serving_ticket), cv(cv) {}
    ~PlacementTurn() {
        serving_ticket++;
        cv.notify_all();
    }
    uint64_t& serving_ticket;
    std::condition_variable& cv;
};

// releases the cancelling entries of a batch that never got their attempt
struct UnattemptedCancels {
    UnattemptedCancels(OrderRegistry& registry, std::mutex& mutex, const std::vector<Order>& orders)
        : registry(registry), mutex(mutex), orders(orders) {}
    ~UnattemptedCancels() {
        if (next >= orders.size()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t i = next; i < orders.size(); i++) {
            registry.abandon_cancel(orders[i].order_id);
        }
    }
    OrderRegistry& registry;
    std::mutex& mutex;
    const std::vector<Order>& orders;
    size_t next = 0;
};

} // namespace

OrderBookManager::OrderBookManager(std::shared_ptr<spdlog::logger> logger, std::unique_ptr<PlacementExecutor> executor)
    : registry(logger), executor(std::move(executor)), logger(logger) {
    if (!this->executor) {
        this->executor = std::make_unique<InlineExecutor>();
    }
}

OrderBookManager::~OrderBookManager() {
    stop();
    // queued attempts still use this object
    executor.reset();
}

void OrderBookManager::get_orders_with(GetOrdersFunction get_orders_function) {
    std::lock_guard<std::mutex> lock(mutex);
    this->get_orders_function = std::move(get_orders_function);
}

void OrderBookManager::get_balances_with(GetBalancesFunction get_balances_function) {
    std::lock_guard<std::mutex> lock(mutex);
    this->get_balances_function = std::move(get_balances_function);
}

void OrderBookManager::cancel_orders_with(CancelOrderFunction cancel_order_function) {
    std::lock_guard<std::mutex> lock(mutex);
    this->cancel_order_function = std::move(cancel_order_function);
}

void OrderBookManager::enable_history_reporting(std::shared_ptr<reporting::OrderHistoryReporter> reporter,
                                                OrderFilterFunction buy_orders_function,
                                                OrderFilterFunction sell_orders_function) {
    if (!reporter || !buy_orders_function || !sell_orders_function) {
        throw std::invalid_argument("History reporting needs a reporter and both order filters");
    }
    std::lock_guard<std::mutex> lock(mutex);
    order_history_reporter = std::move(reporter);
    this->buy_orders_function = std::move(buy_orders_function);
    this->sell_orders_function = std::move(sell_orders_function);
}

void OrderBookManager::start(std::chrono::milliseconds refresh_period) {
    if (refresh_period.count() <= 0) {
        throw std::invalid_argument("Refresh period must be positive");
    }
    if (running.exchange(true)) {
        logger->warn("Order book manager already started");
        return;
    }

    logger->info("Starting order book refresh every {} ms", refresh_period.count());
    refresh_thread = std::thread([this]() { refresh_loop(); });
    timer_thread = std::thread([this, refresh_period]() { timer_loop(refresh_period); });
}

void OrderBookManager::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex);
        if (!running.exchange(false)) {
            return;
        }
    }
    timer_cv.notify_all();
    state_changed.notify_all();

    if (timer_thread.joinable()) {
        timer_thread.join();
    }
    if (refresh_thread.joinable()) {
        refresh_thread.join();
    }
    logger->info("Stopped order book refresh");
}

void OrderBookManager::timer_loop(std::chrono::milliseconds refresh_period) {
    auto next_tick = std::chrono::steady_clock::now();
    while (running) {
        {
            std::lock_guard<std::mutex> lock(timer_mutex);
            if (refresh_in_progress) {
                logger->debug("Order book refresh still in progress, skipping this tick");
            } else {
                refresh_requested = true;
            }
        }
        timer_cv.notify_all();

        next_tick += refresh_period;
        std::unique_lock<std::mutex> lock(timer_mutex);
        timer_cv.wait_until(lock, next_tick, [this]() { return !running; });
    }
}

void OrderBookManager::refresh_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(timer_mutex);
            timer_cv.wait(lock, [this]() { return refresh_requested || !running; });
            if (!running) {
                return;
            }
            refresh_requested = false;
        }
        refresh_order_book();
    }
}

bool OrderBookManager::refresh_order_book() {
    bool expected = false;
    if (!refresh_in_progress.compare_exchange_strong(expected, true)) {
        logger->debug("Order book refresh already in progress, skipping");
        return false;
    }

    GetOrdersFunction get_orders;
    GetBalancesFunction get_balances;
    uint64_t watermark;
    {
        RefreshInProgress in_progress(refresh_in_progress);
        {
            std::lock_guard<std::mutex> lock(mutex);
            get_orders = get_orders_function;
            get_balances = get_balances_function;
            watermark = registry.placement_sequence();
        }

        if (!get_orders || !get_balances) {
            logger->error("Cannot refresh the order book, orders or balances function not set");
            return false;
        }

        // the venue is queried outside the lock
        std::vector<Order> orders;
        Balances balances;
        try {
            orders = get_orders();
            balances = get_balances();
        } catch (const std::exception& e) {
            logger->error("Failed to refresh the order book: {}", e.what());
            return false;
        } catch (...) {
            logger->error("Failed to refresh the order book: unknown exception");
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            remote_orders = std::move(orders);
            remote_balances = std::move(balances);
            remote_watermark = watermark;
            ready = true;
            refresh_count++;
            logger->debug("Order book refreshed, {} open orders on the venue", remote_orders.size());
        }
    }

    publish();
    return true;
}

OrderBook OrderBookManager::get_order_book() {
    std::unique_lock<std::mutex> lock(mutex);
    while (!ready) {
        logger->info("Waiting for the order book to become available...");
        state_changed.wait_for(lock, std::chrono::milliseconds(500));
    }
    return build_order_book();
}

OrderBook OrderBookManager::build_order_book() const {
    OrderBook book;
    book.orders = remote_orders;

    // orders we placed that the last refresh could not have seen yet
    std::set<std::string> known_ids;
    for (const auto& order : book.orders) {
        known_ids.insert(order.order_id);
    }
    for (auto& order : registry.orders_placed_since(remote_watermark)) {
        if (known_ids.insert(order.order_id).second) {
            book.orders.push_back(std::move(order));
        }
    }

    book.orders.erase(std::remove_if(book.orders.begin(), book.orders.end(),
                                     [this](const Order& order) {
                                         return registry.is_cancelling(order.order_id) ||
                                                registry.is_cancelled(order.order_id);
                                     }),
                      book.orders.end());

    book.balances = remote_balances;
    book.ready = ready;
    book.refresh_in_progress = refresh_in_progress;
    book.orders_being_placed = registry.currently_placing() > 0;
    book.orders_being_cancelled = registry.has_cancelling();
    book.refresh_count = refresh_count;
    return book;
}

void OrderBookManager::place_order(PlaceOrderFunction place_order_function) {
    if (!place_order_function) {
        logger->error("place_order called without a placement function");
        return;
    }

    std::lock_guard<std::mutex> submission(submission_mutex);
    uint64_t ticket;
    {
        std::lock_guard<std::mutex> lock(mutex);
        registry.begin_placement();
        ticket = next_ticket++;
    }
    publish();

    try {
        executor->submit([this, ticket, place_order_function]() { run_placement(ticket, place_order_function); });
    } catch (const std::exception& e) {
        logger->error("Failed to submit order placement: {}", e.what());
        run_placement(ticket, nullptr);
    }
}

void OrderBookManager::run_placement(uint64_t ticket, const PlaceOrderFunction& place_order_function) {
    {
        std::unique_lock<std::mutex> lock(mutex);
        state_changed.wait(lock, [this, ticket]() { return serving_ticket == ticket; });
        PlacementTurn turn(serving_ticket, state_changed);
        PlacementScope placing(registry, adopt_placement);

        if (!place_order_function) {
            logger->warn("Order placement {} was not attempted", ticket);
        } else {
            try {
                std::optional<Order> new_order = place_order_function();
                if (new_order) {
                    registry.record_placed(*new_order);
                } else {
                    logger->info("Order placement {} produced no order", ticket);
                }
            } catch (const std::exception& e) {
                logger->error("Failed to place order: {}", e.what());
            } catch (...) {
                logger->error("Failed to place order: unknown exception");
            }
        }
    }
    publish();
}

void OrderBookManager::cancel_orders(const std::vector<Order>& orders) {
    CancelOrderFunction cancel_order;
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancel_order = cancel_order_function;
        if (!cancel_order) {
            logger->error("Cannot cancel orders, cancel function not set");
            return;
        }
        for (const auto& order : orders) {
            registry.begin_cancel(order.order_id);
        }
    }
    publish();

    UnattemptedCancels unattempted(registry, mutex, orders);
    for (const auto& order : orders) {
        unattempted.next++;
        {
            std::lock_guard<std::mutex> lock(mutex);
            PendingCancel pending(registry, order.order_id);
            if (!pending.registered()) {
                logger->info("Not cancelling order {}, already cancelled", order.order_id);
            } else {
                try {
                    if (cancel_order(order)) {
                        pending.confirm();
                        logger->info("Cancelled order {}", order.order_id);
                    } else {
                        logger->warn("Failed to cancel order {}", order.order_id);
                    }
                } catch (const std::exception& e) {
                    logger->error("Failed to cancel order {}: {}", order.order_id, e.what());
                } catch (...) {
                    logger->error("Failed to cancel order {}: unknown exception", order.order_id);
                }
            }
        }
        publish();
    }
}

void OrderBookManager::cancel_all_orders(std::chrono::milliseconds final_wait) {
    while (true) {
        wait_for_stable_order_book();

        auto orders = get_order_book().orders;
        if (orders.empty()) {
            break;
        }

        logger->info("Cancelling {} open orders...", orders.size());
        cancel_orders(orders);

        uint64_t seen;
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen = refresh_count;
        }
        wait_for_order_book_refresh();
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (refresh_count == seen) {
                logger->error("Order book did not refresh, giving up on cancelling all orders");
                return;
            }
        }
    }

    if (final_wait.count() > 0) {
        logger->info("Waiting {} ms for any stale orders to show up", final_wait.count());
        std::this_thread::sleep_for(final_wait);
        wait_for_order_book_refresh();
        if (!get_order_book().orders.empty()) {
            cancel_all_orders();
            return;
        }
    }

    logger->info("All orders cancelled");
}

void OrderBookManager::wait_for_order_cancellation() {
    std::unique_lock<std::mutex> lock(mutex);
    state_changed.wait(lock, [this]() { return !registry.has_cancelling(); });
}

void OrderBookManager::wait_for_order_book_refresh() {
    uint64_t seen;
    {
        std::lock_guard<std::mutex> lock(mutex);
        seen = refresh_count;
    }

    if (!running) {
        // nobody else is going to refresh
        refresh_order_book();
        return;
    }

    std::unique_lock<std::mutex> lock(mutex);
    state_changed.wait(lock, [this, seen]() { return refresh_count > seen || !running; });
}

void OrderBookManager::wait_for_stable_order_book() {
    std::unique_lock<std::mutex> lock(mutex);
    state_changed.wait(lock, [this]() { return registry.currently_placing() == 0 && !registry.has_cancelling(); });
}

void OrderBookManager::wait_for_placements() {
    executor->wait_idle();
}

RegistrySnapshot OrderBookManager::registry_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return registry.snapshot();
}

void OrderBookManager::publish() {
    publishes++;
    state_changed.notify_all();

    std::shared_ptr<reporting::OrderHistoryReporter> reporter;
    OrderFilterFunction buy_orders;
    OrderFilterFunction sell_orders;
    OrderBook book;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!order_history_reporter || !ready) {
            return;
        }
        reporter = order_history_reporter;
        buy_orders = buy_orders_function;
        sell_orders = sell_orders_function;
        book = build_order_book();
    }

    try {
        reporter->report(unix_time(), buy_orders(book.orders), sell_orders(book.orders));
    } catch (const std::exception& e) {
        logger->error("Failed to report order history: {}", e.what());
    } catch (...) {
        logger->error("Failed to report order history: unknown exception");
    }
}

} // namespace keeper::orders
