#include "../gas_price.H"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace keeper::gas;

namespace {

// a feed the test controls directly
class StubFeed : public FastPriceFeed {
public:
    explicit StubFeed(std::optional<uint64_t>& price) : price(price) {}
    std::optional<uint64_t> fast_price() override { return price; }
private:
    std::optional<uint64_t>& price;
};

class ThrowingFeed : public FastPriceFeed {
public:
    std::optional<uint64_t> fast_price() override { throw std::runtime_error("oracle exploded"); }
};

class BrokenFeed : public FastPriceFeed {
public:
    std::optional<uint64_t> fast_price() override { throw 13; }
};

} // namespace

class SmartGasPriceTest : public ::testing::Test {
protected:
    SmartGasPrice make(SmartGasParams params = {}) {
        return SmartGasPrice(std::make_unique<StubFeed>(sample), params, logger);
    }

    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger();
    std::optional<uint64_t> sample;
};

TEST_F(SmartGasPriceTest, EscalatesInUnitSteps) {
    SmartGasParams params;
    params.step = 10;
    params.cap = 50;
    auto gas_price = make(params);

    sample = 100;
    EXPECT_EQ(gas_price.get_gas_price(0), 110u);
    EXPECT_EQ(gas_price.get_gas_price(59), 110u);
    EXPECT_EQ(gas_price.get_gas_price(60), 120u);
    EXPECT_EQ(gas_price.get_gas_price(125), 130u);
    EXPECT_EQ(gas_price.get_gas_price(299), 150u);
    EXPECT_EQ(gas_price.get_gas_price(300), 160u);
    EXPECT_EQ(gas_price.get_gas_price(100000), 160u);
}

TEST_F(SmartGasPriceTest, DefaultsInGwei) {
    auto gas_price = make();

    sample = 100 * GWEI;
    EXPECT_EQ(gas_price.get_gas_price(0), 110 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(125), 130 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(3600), 160 * GWEI);
}

TEST_F(SmartGasPriceTest, TenPercentRoundsDown) {
    SmartGasParams params;
    params.step = 10;
    params.cap = 50;
    auto gas_price = make(params);

    sample = 105;
    EXPECT_EQ(gas_price.get_gas_price(0), 115u);
    sample = 9;
    EXPECT_EQ(gas_price.get_gas_price(0), 9u);
}

TEST_F(SmartGasPriceTest, MonotonicAndBounded) {
    auto gas_price = make();

    for (uint64_t fast : std::vector<uint64_t>{1, 7 * GWEI, 100 * GWEI, 999 * GWEI + 3}) {
        sample = fast;
        uint64_t bound = fast * 11 / 10 + 50 * GWEI;
        uint64_t previous = 0;
        for (uint64_t t = 0; t < 1000; t += 7) {
            auto price = gas_price.get_gas_price(t);
            ASSERT_TRUE(price.has_value());
            EXPECT_GE(*price, previous);
            EXPECT_LE(*price, bound);
            previous = *price;
        }
        EXPECT_EQ(previous, bound);
    }
}

TEST_F(SmartGasPriceTest, FallsBackWithoutSample) {
    auto gas_price = make();

    sample.reset();
    EXPECT_EQ(gas_price.get_gas_price(0), 20 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(60), 30 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(125), 40 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(480), 100 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(100000), 100 * GWEI);

    // back on the oracle as soon as it has a sample again
    sample = 50 * GWEI;
    EXPECT_EQ(gas_price.get_gas_price(0), 55 * GWEI);
}

TEST_F(SmartGasPriceTest, FallbackUsesConfiguredSchedule) {
    SmartGasParams params;
    params.fallback_initial = 5;
    params.fallback_increase = 3;
    params.fallback_every_secs = 10;
    params.fallback_max = 20;
    auto gas_price = make(params);

    sample.reset();
    for (uint64_t t = 0; t < 200; t++) {
        uint64_t expected = std::min<uint64_t>(5 + (t / 10) * 3, 20);
        EXPECT_EQ(gas_price.get_gas_price(t), expected) << "t=" << t;
    }
}

TEST_F(SmartGasPriceTest, OracleErrorsNeverReachTheCaller) {
    SmartGasPrice gas_price(std::make_unique<ThrowingFeed>(), SmartGasParams{}, logger);
    std::optional<uint64_t> price;
    EXPECT_NO_THROW(price = gas_price.get_gas_price(60));
    EXPECT_EQ(price, 30 * GWEI);
}

TEST_F(SmartGasPriceTest, AnyOracleFailureFallsBack) {
    SmartGasPrice gas_price(std::make_unique<BrokenFeed>(), SmartGasParams{}, logger);
    std::optional<uint64_t> price;
    EXPECT_NO_THROW(price = gas_price.get_gas_price(125));
    EXPECT_EQ(price, 40 * GWEI);
}

TEST_F(SmartGasPriceTest, RejectsBadConstruction) {
    EXPECT_THROW(SmartGasPrice(nullptr, SmartGasParams{}, logger), std::invalid_argument);

    SmartGasParams params;
    params.step_secs = 0;
    EXPECT_THROW(SmartGasPrice(std::make_unique<StubFeed>(sample), params, logger), std::invalid_argument);
}

TEST(IncreasingGasPriceTest, Schedule) {
    IncreasingGasPrice gas_price(20, 10, 60, 100);
    EXPECT_EQ(gas_price.get_gas_price(0), 20u);
    EXPECT_EQ(gas_price.get_gas_price(119), 30u);
    EXPECT_EQ(gas_price.get_gas_price(120), 40u);
    EXPECT_EQ(gas_price.get_gas_price(600), 100u);
    EXPECT_EQ(gas_price.get_gas_price(UINT64_MAX), 100u);
}

TEST(IncreasingGasPriceTest, RejectsBadSchedule) {
    EXPECT_THROW(IncreasingGasPrice(20, 10, 0, 100), std::invalid_argument);
    EXPECT_THROW(IncreasingGasPrice(200, 10, 60, 100), std::invalid_argument);
}

TEST(FixedGasPriceTest, ConstantUntilUpdated) {
    FixedGasPrice gas_price(7 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(0), 7 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(10000), 7 * GWEI);

    gas_price.update_gas_price(9 * GWEI);
    EXPECT_EQ(gas_price.get_gas_price(0), 9 * GWEI);
}

TEST(DefaultGasPriceTest, LeavesItToTheNode) {
    DefaultGasPrice gas_price;
    EXPECT_FALSE(gas_price.get_gas_price(0).has_value());
    EXPECT_FALSE(gas_price.get_gas_price(600).has_value());
}

class GasPriceFactoryTest : public ::testing::Test {
protected:
    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger();
};

TEST_F(GasPriceFactoryTest, NothingConfigured) {
    auto gas_price = GasPriceFactory::create_gas_price(GasSettings{}, OracleFetchers{}, logger);
    EXPECT_NE(dynamic_cast<DefaultGasPrice*>(gas_price.get()), nullptr);
}

TEST_F(GasPriceFactoryTest, FixedGasPrice) {
    GasSettings settings;
    settings.gas_price = 12 * GWEI;
    auto gas_price = GasPriceFactory::create_gas_price(settings, OracleFetchers{}, logger);
    ASSERT_NE(dynamic_cast<FixedGasPrice*>(gas_price.get()), nullptr);
    EXPECT_EQ(gas_price->get_gas_price(500), 12 * GWEI);
}

TEST_F(GasPriceFactoryTest, FixedSourceIsScaledAndEscalated) {
    GasSettings settings;
    settings.source = FixedSource{20.0};
    settings.initial_multiplier = 1.5;
    auto gas_price = GasPriceFactory::create_gas_price(settings, OracleFetchers{}, logger);
    ASSERT_NE(dynamic_cast<SmartGasPrice*>(gas_price.get()), nullptr);

    // fast = 30 gwei, so 33 gwei rising by 10 gwei a minute
    EXPECT_EQ(gas_price->get_gas_price(0), 33 * GWEI);
    EXPECT_EQ(gas_price->get_gas_price(125), 53 * GWEI);
    EXPECT_EQ(gas_price->get_gas_price(10000), 83 * GWEI);
}

TEST_F(GasPriceFactoryTest, SelectsOnlyTheConfiguredOracle) {
    std::atomic<int> station_calls{0};
    std::atomic<int> etherchain_calls{0};
    std::string seen_key;

    OracleFetchers fetchers;
    fetchers.eth_gas_station = [&](const EthGasStationSource& source) -> std::optional<uint64_t> {
        station_calls++;
        seen_key = source.api_key;
        return 40 * GWEI;
    };
    fetchers.etherchain = [&](const EtherchainSource&) -> std::optional<uint64_t> {
        etherchain_calls++;
        return 1 * GWEI;
    };

    GasSettings settings;
    settings.source = EthGasStationSource{"secret"};
    auto gas_price = GasPriceFactory::create_gas_price(settings, fetchers, logger);

    // the feed polls on its own thread
    std::optional<uint64_t> price;
    for (int i = 0; i < 200 && price != 44 * GWEI; i++) {
        price = gas_price->get_gas_price(0);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(price, 44 * GWEI);
    EXPECT_GE(station_calls.load(), 1);
    EXPECT_EQ(etherchain_calls.load(), 0);
    EXPECT_EQ(seen_key, "secret");
}

TEST_F(GasPriceFactoryTest, MissingOracleClient) {
    GasSettings settings;
    settings.source = PoaNetworkSource{""};
    EXPECT_THROW(GasPriceFactory::create_gas_price(settings, OracleFetchers{}, logger), std::invalid_argument);
}
