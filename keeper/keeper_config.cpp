#include "keeper_config.H"
#include "order_book/pair.H"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace keeper {

using json = nlohmann::json;

template <typename T>
static T get_or(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

static uint64_t gwei_to_wei(double gwei) {
    double wei = gwei * gas::GWEI;
    if (!std::isfinite(wei) || wei < 0) {
        throw std::runtime_error("Gas prices must be non-negative numbers");
    }
    if (wei >= gas::MAX_WEI) {
        throw std::runtime_error("Gas price is too large");
    }
    return static_cast<uint64_t>(std::llround(wei));
}

static gas::GasSettings parse_gas(const json& j) {
    gas::GasSettings settings;
    settings.initial_multiplier = get_or<double>(j, "initial_multiplier", 1.0);

    if (j.contains("gas_price") && !j["gas_price"].is_null()) {
        settings.gas_price = gwei_to_wei(j["gas_price"].get<double>());
    }

    std::string source = get_or<std::string>(j, "source", "");
    if (source.empty()) {
        return settings;
    }
    if (settings.gas_price) {
        throw std::runtime_error("gas.source and gas.gas_price are mutually exclusive");
    }

    if (source == "ethgasstation") {
        std::string api_key = get_or<std::string>(j, "api_key", "");
        if (api_key.empty()) {
            throw std::runtime_error("gas.api_key is required for ethgasstation");
        }
        settings.source = gas::EthGasStationSource{api_key};
    } else if (source == "etherchain") {
        settings.source = gas::EtherchainSource{};
    } else if (source == "poanetwork") {
        settings.source = gas::PoaNetworkSource{get_or<std::string>(j, "alt_url", "")};
    } else if (source == "fixed") {
        if (!j.contains("fixed_gas_price")) {
            throw std::runtime_error("gas.fixed_gas_price is required for a fixed source");
        }
        settings.source = gas::FixedSource{j["fixed_gas_price"].get<double>()};
    } else {
        throw std::runtime_error("Unknown gas source: " + source);
    }
    return settings;
}

KeeperConfig parse_config(const json& j) {
    KeeperConfig config;
    try {
        config.pair = j.at("pair").get<std::string>();
        config.refresh_frequency = get_or<int64_t>(j, "refresh_frequency", 3);
        config.order_history = get_or<std::string>(j, "order_history", "");
        config.order_history_every = get_or<int64_t>(j, "order_history_every", 30);
        config.placement_workers = get_or<size_t>(j, "placement_workers", 0);
        config.run_seconds = get_or<int64_t>(j, "run_seconds", 30);
        config.log_dir = get_or<std::string>(j, "log_dir", "logs");

        if (j.contains("gas")) {
            config.gas = parse_gas(j["gas"]);
        }

        for (const auto& order : j.value("orders", json::array())) {
            config.orders.push_back({order.at("is_sell").get<bool>(),
                                     order.at("price").get<double>(),
                                     order.at("amount").get<double>()});
        }

        json balances = j.value("balances", json::object());
        for (auto& el : balances.items()) {
            config.balances[el.key()] = el.value().get<double>();
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid keeper config: ") + e.what());
    }

    if (config.refresh_frequency <= 0) {
        throw std::runtime_error("refresh_frequency must be positive");
    }
    if (config.order_history_every < 0) {
        throw std::runtime_error("order_history_every must not be negative");
    }
    for (const auto& order : config.orders) {
        if (order.price <= 0 || order.amount <= 0) {
            throw std::runtime_error("Order price and amount must be positive");
        }
    }
    try {
        orders::token_sell(config.pair);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    return config;
}

KeeperConfig load_config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Failed to open config file " + filename);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + filename + ": " + e.what());
    }
    return parse_config(j);
}

} // namespace keeper
