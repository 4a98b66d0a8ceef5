#include "gas_price.H"

#include <algorithm>
#include <stdexcept>

namespace keeper::gas {

IncreasingGasPrice::IncreasingGasPrice(uint64_t initial_price, uint64_t increase_by, uint64_t every_secs, uint64_t max_price)
    : initial_price(initial_price), increase_by(increase_by), every_secs(every_secs), max_price(max_price) {
    if (every_secs == 0) {
        throw std::invalid_argument("every_secs must be positive");
    }
    if (max_price < initial_price) {
        throw std::invalid_argument("max_price must not be below initial_price");
    }
}

std::optional<uint64_t> IncreasingGasPrice::get_gas_price(uint64_t time_elapsed) {
    uint64_t steps = time_elapsed / every_secs;
    uint64_t headroom = max_price - initial_price;
    if (increase_by != 0 && steps > headroom / increase_by) {
        return max_price;
    }
    return std::min(initial_price + steps * increase_by, max_price);
}

SmartGasPrice::SmartGasPrice(std::unique_ptr<FastPriceFeed> feed, SmartGasParams params,
                             std::shared_ptr<spdlog::logger> logger)
    : feed(std::move(feed)), params(params),
      fallback(params.fallback_initial, params.fallback_increase, params.fallback_every_secs, params.fallback_max),
      logger(logger) {
    if (!this->feed) {
        throw std::invalid_argument("SmartGasPrice needs a fast price feed");
    }
    if (params.step_secs == 0) {
        throw std::invalid_argument("step_secs must be positive");
    }
}

std::optional<uint64_t> SmartGasPrice::get_gas_price(uint64_t time_elapsed) {
    std::optional<uint64_t> fast_price;
    try {
        fast_price = feed->fast_price();
    } catch (const std::exception& e) {
        logger->warn("Gas oracle failed, using fallback pricing: {}", e.what());
    } catch (...) {
        logger->warn("Gas oracle failed, using fallback pricing: unknown exception");
    }

    if (!fast_price) {
        return fallback.get_gas_price(time_elapsed);
    }

    // fast * 1.1, rounded down
    uint64_t base = *fast_price / 10 * 11 + (*fast_price % 10) * 11 / 10;
    uint64_t steps = time_elapsed / params.step_secs;
    if (params.step != 0 && steps > params.cap / params.step) {
        return base + params.cap;
    }
    return std::min(base + steps * params.step, base + params.cap);
}

std::unique_ptr<GasPrice> GasPriceFactory::create_gas_price(const GasSettings& settings,
                                                           const OracleFetchers& fetchers,
                                                           std::shared_ptr<spdlog::logger> logger) {
    if (settings.source) {
        auto feed = make_fast_price_feed(*settings.source, fetchers, settings.initial_multiplier, logger, settings.timing);
        return std::make_unique<SmartGasPrice>(std::move(feed), settings.params, logger);
    } else if (settings.gas_price) {
        logger->info("Using fixed gas price of {} wei", *settings.gas_price);
        return std::make_unique<FixedGasPrice>(*settings.gas_price);
    }
    logger->info("Using node default gas price");
    return std::make_unique<DefaultGasPrice>();
}

} // namespace keeper::gas
