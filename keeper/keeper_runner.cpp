/**
 * Run the keeper against the paper exchange.
 */
#include "keeper.H"
#include "keeper_config.H"

#include "common/utils.H"
#include "exchange/paper_exchange.H"
#include "reporting/jsonl_order_history_reporter.H"

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

static std::atomic<bool> stopped{false};

static void on_signal(int) {
    stopped = true;
}

int main(int argc, char* argv[]) {

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config file>" << std::endl;
        return 1;
    }

    keeper::KeeperConfig config;
    try {
        config = keeper::load_config(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    spdlog::init_thread_pool(8192, 1);
    auto logger = spdlog::daily_logger_mt<spdlog::async_factory>("async_logger", config.log_dir + "/keeper");
    logger->sinks().push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        keeper::exchange::PaperExchange exchange(config.pair, config.balances, logger);

        std::shared_ptr<keeper::reporting::OrderHistoryReporter> reporter;
        if (config.order_history.empty()) {
            reporter = std::make_shared<keeper::reporting::LoggingOrderHistoryReporter>(logger);
        } else {
            reporter = std::make_shared<keeper::reporting::JsonlOrderHistoryReporter>(
                config.order_history, config.order_history_every, logger);
        }

        // no oracle clients in paper mode, only fixed or default gas pricing
        keeper::Keeper keeper(config, exchange, reporter, keeper::gas::OracleFetchers{}, logger);
        keeper.start();

        uint64_t start_ts = keeper::nanotime();
        uint64_t run_ns = static_cast<uint64_t>(config.run_seconds) * 1000000000ULL;
        while (!stopped && keeper::nanotime() - start_ts < run_ns) {
            keeper.synchronize_orders();

            uint64_t elapsed_secs = (keeper::nanotime() - start_ts) / 1000000000ULL;
            auto gas_price = keeper.gas_price().get_gas_price(elapsed_secs);
            if (gas_price) {
                logger->info("Settlement gas price after {}s: {} wei", elapsed_secs, *gas_price);
            }

            std::this_thread::sleep_for(std::chrono::seconds(config.refresh_frequency));
        }

        keeper.shutdown();
    } catch (const std::exception& e) {
        logger->error("Exception in main thread: {}", e.what());
        std::cout << "Exception in main thread: " << e.what() << std::endl;
        logger->flush();
        spdlog::shutdown();
        return 1;
    }

    logger->flush();
    spdlog::shutdown();
    return 0;
}
