#include "fast_price_feed.H"

#include "common/utils.H"

#include <cmath>
#include <stdexcept>

namespace keeper::gas {

CachedFastPriceFeed::CachedFastPriceFeed(std::string name, FastPriceFetcher fetcher,
                                         std::chrono::seconds refresh_interval, std::chrono::seconds expiry,
                                         std::shared_ptr<spdlog::logger> logger,
                                         std::function<uint64_t()> clock)
    : name(std::move(name)), fetcher(std::move(fetcher)), refresh_interval(refresh_interval),
      expiry(expiry), clock(std::move(clock)), logger(logger) {
    if (!this->fetcher) {
        throw std::invalid_argument("Gas oracle " + this->name + " has no fetcher");
    }
    if (!this->clock) {
        this->clock = nanotime;
    }
}

CachedFastPriceFeed::~CachedFastPriceFeed() {
    stop();
}

void CachedFastPriceFeed::start() {
    if (running.exchange(true)) {
        return;
    }
    poll_thread = std::thread([this]() {
        while (running) {
            poll();
            std::unique_lock<std::mutex> lock(poll_mutex);
            poll_cv.wait_for(lock, refresh_interval, [this]() { return !running; });
        }
    });
}

void CachedFastPriceFeed::stop() {
    {
        std::lock_guard<std::mutex> lock(poll_mutex);
        if (!running.exchange(false)) {
            return;
        }
    }
    poll_cv.notify_all();
    if (poll_thread.joinable()) {
        poll_thread.join();
    }
}

bool CachedFastPriceFeed::poll() {
    std::optional<uint64_t> price;
    try {
        price = fetcher();
    } catch (const std::exception& e) {
        logger->warn("Failed to fetch gas price from {}: {}", name, e.what());
        return false;
    } catch (...) {
        logger->warn("Failed to fetch gas price from {}: unknown exception", name);
        return false;
    }

    if (!price) {
        logger->warn("No gas price available from {}", name);
        return false;
    }

    std::lock_guard<std::mutex> lock(sample_mutex);
    sample = price;
    sample_ts = clock();
    logger->debug("Fast gas price from {} is {} wei", name, *price);
    return true;
}

std::optional<uint64_t> CachedFastPriceFeed::fast_price() {
    std::lock_guard<std::mutex> lock(sample_mutex);
    if (!sample) {
        return std::nullopt;
    }
    uint64_t age_ns = clock() - sample_ts;
    if (age_ns > static_cast<uint64_t>(expiry.count()) * 1000000000ULL) {
        return std::nullopt;
    }
    return sample;
}

std::string source_name(const GasOracleSource& source) {
    if (std::holds_alternative<EthGasStationSource>(source)) {
        return "ethgasstation";
    } else if (std::holds_alternative<EtherchainSource>(source)) {
        return "etherchain";
    } else if (std::holds_alternative<PoaNetworkSource>(source)) {
        return "poanetwork";
    }
    return "fixed";
}

std::unique_ptr<FastPriceFeed> make_fast_price_feed(const GasOracleSource& source,
                                                    const OracleFetchers& fetchers,
                                                    double initial_multiplier,
                                                    std::shared_ptr<spdlog::logger> logger,
                                                    OracleTiming timing) {
    if (const auto* fixed = std::get_if<FixedSource>(&source)) {
        double wei = fixed->gwei * initial_multiplier * GWEI;
        if (!std::isfinite(wei) || wei < 0) {
            throw std::invalid_argument("Fixed gas price must be a non-negative number");
        }
        if (wei >= MAX_WEI) {
            throw std::invalid_argument("Fixed gas price is too large");
        }
        auto price = static_cast<uint64_t>(std::llround(wei));
        logger->info("Using fixed gas price of {} wei", price);
        return std::make_unique<FixedFastPriceFeed>(price);
    }

    FastPriceFetcher fetcher;
    if (const auto* station = std::get_if<EthGasStationSource>(&source)) {
        if (fetchers.eth_gas_station) {
            fetcher = [f = fetchers.eth_gas_station, s = *station]() { return f(s); };
        }
    } else if (const auto* etherchain = std::get_if<EtherchainSource>(&source)) {
        if (fetchers.etherchain) {
            fetcher = [f = fetchers.etherchain, s = *etherchain]() { return f(s); };
        }
    } else if (const auto* poa = std::get_if<PoaNetworkSource>(&source)) {
        if (fetchers.poa_network) {
            fetcher = [f = fetchers.poa_network, s = *poa]() { return f(s); };
        }
    }

    std::string name = source_name(source);
    if (!fetcher) {
        throw std::invalid_argument("No client available for gas oracle " + name);
    }

    logger->info("Using {} gas oracle, refresh every {}s, expiry {}s", name,
                 timing.refresh_interval.count(), timing.expiry.count());
    auto feed = std::make_unique<CachedFastPriceFeed>(name, fetcher, timing.refresh_interval, timing.expiry, logger);
    feed->start();
    return feed;
}

} // namespace keeper::gas
