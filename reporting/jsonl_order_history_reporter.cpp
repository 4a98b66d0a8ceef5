#include "jsonl_order_history_reporter.H"

#include <stdexcept>

namespace keeper::reporting {

using json = nlohmann::json;

json order_to_json(const orders::Order& order) {
    return json{
        {"order_id", order.order_id},
        {"timestamp", order.timestamp},
        {"pair", order.pair},
        {"side", order.is_sell ? "sell" : "buy"},
        {"price", order.price},
        {"amount", order.amount},
    };
}

JsonlOrderHistoryReporter::JsonlOrderHistoryReporter(const std::string& path, int64_t report_every,
                                                     std::shared_ptr<spdlog::logger> logger)
    : out(path, std::ios::app), path(path), report_every(report_every), logger(logger) {
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open order history file " + path);
    }
    if (report_every < 0) {
        throw std::invalid_argument("report_every must not be negative");
    }
    logger->info("Reporting order history to {} every {}s", path, report_every);
}

void JsonlOrderHistoryReporter::report(int64_t timestamp,
                                       const std::vector<orders::Order>& buy_orders,
                                       const std::vector<orders::Order>& sell_orders) {
    std::lock_guard<std::mutex> lock(mutex);
    if (reported && timestamp - last_report_ts < report_every) {
        return;
    }

    json line;
    line["timestamp"] = timestamp;
    line["orders"] = json::array();
    for (const auto& order : buy_orders) {
        line["orders"].push_back(order_to_json(order));
    }
    for (const auto& order : sell_orders) {
        line["orders"].push_back(order_to_json(order));
    }

    out << line.dump() << '\n';
    out.flush();
    if (!out) {
        logger->error("Failed to write order history to {}", path);
        out.clear();
        return;
    }

    reported = true;
    last_report_ts = timestamp;
    lines++;
}

uint64_t JsonlOrderHistoryReporter::lines_written() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lines;
}

void LoggingOrderHistoryReporter::report(int64_t timestamp,
                                         const std::vector<orders::Order>& buy_orders,
                                         const std::vector<orders::Order>& sell_orders) {
    logger->info("Order history at {}: {} buy orders, {} sell orders", timestamp, buy_orders.size(), sell_orders.size());
}

} // namespace keeper::reporting
