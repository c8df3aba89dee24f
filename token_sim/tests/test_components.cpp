#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "components/AddOn.hpp"
#include "components/AgentPool.hpp"
#include "components/HoldingTimeModel.hpp"
#include "components/TransactionModel.hpp"
#include "components/UserGrowth.hpp"
#include "ContextFixture.hpp"

using namespace tokensim;
using Catch::Approx;

// ---- Add-ons -------------------------------------------------------------------

TEST_CASE("AddOn: RandomNoise with a constant draw shifts the value", "[addons]") {
    ContextFixture f;
    RandomNoise noise(Distribution::constant(2.5));
    REQUIRE(noise.apply(10.0, f.make()) == Approx(12.5));
}

TEST_CASE("AddOn: ProportionalNoise leaves zero untouched", "[addons]") {
    ContextFixture f;
    ProportionalNoise noise;
    REQUIRE(noise.apply(0.0, f.make()) == 0.0);
    REQUIRE_THROWS_AS(ProportionalNoise(0.0, 0.0), ConfigurationError);
}

TEST_CASE("AddOn: ProportionalNoise centres on the value", "[addons]") {
    ContextFixture f;
    ProportionalNoise replace(0.0, 5.0, false);

    double sum = 0.0;
    const int n = 5000;
    for (int i = 0; i < n; ++i) {
        sum += replace.apply(100.0, f.make());
    }
    REQUIRE(sum / n == Approx(100.0).margin(1.0));
}

TEST_CASE("AddOn: RandomReduction never increases a positive value", "[addons]") {
    ContextFixture f;
    RandomReduction reduction;
    for (int i = 0; i < 200; ++i) {
        double v = reduction.apply(50.0, f.make());
        REQUIRE(v >= 0.0);
        REQUIRE(v <= 50.0);
    }

    // Draws outside [0, 1] are clamped
    RandomReduction full(Distribution::constant(3.0));
    REQUIRE(full.apply(50.0, f.make()) == 0.0);
    RandomReduction none(Distribution::constant(-1.0));
    REQUIRE(none.apply(50.0, f.make()) == 50.0);
}

TEST_CASE("AddOn: TimedMultiplier acts inside its inclusive window", "[addons]") {
    ContextFixture f;
    TimedMultiplier shock(2.0, 3, 5);

    REQUIRE(shock.apply(10.0, f.make(2)) == 10.0);
    REQUIRE(shock.apply(10.0, f.make(3)) == 20.0);
    REQUIRE(shock.apply(10.0, f.make(5)) == 20.0);
    REQUIRE(shock.apply(10.0, f.make(6)) == 10.0);

    REQUIRE_THROWS_AS(TimedMultiplier(2.0, 5, 3), ConfigurationError);
}

TEST_CASE("AddOn: chains apply in order and copy deeply", "[addons]") {
    ContextFixture f;
    AddOnChain chain;
    chain.add(std::make_unique<RandomNoise>(Distribution::constant(1.0)));
    chain.add(std::make_unique<TimedMultiplier>(3.0, 0, 10));

    // (2 + 1) * 3, not 2 * 3 + 1
    REQUIRE(chain.apply(2.0, f.make()) == Approx(9.0));

    AddOnChain copy(chain);
    REQUIRE(copy.size() == 2);
    REQUIRE(copy.apply(2.0, f.make()) == Approx(9.0));

    REQUIRE_THROWS_AS(chain.add(nullptr), ConfigurationError);
}

// ---- User growth ---------------------------------------------------------------

TEST_CASE("UserGrowth: constant returns the same count", "[users]") {
    ContextFixture f;
    ConstantUserGrowth users(250.0);
    REQUIRE(users.nextUsers(f.make()) == 250.0);
    REQUIRE(users.nextUsers(f.make(1)) == 250.0);
    REQUIRE_THROWS_AS(ConstantUserGrowth(-1.0), ConfigurationError);
}

TEST_CASE("UserGrowth: from data repeats the last value", "[users]") {
    ContextFixture f;
    FromDataUserGrowth users({ 10.0, 20.0, 30.0 });
    REQUIRE(users.nextUsers(f.make()) == 10.0);
    REQUIRE(users.nextUsers(f.make()) == 20.0);
    REQUIRE(users.nextUsers(f.make()) == 30.0);
    REQUIRE(users.nextUsers(f.make()) == 30.0);

    users.reset();
    REQUIRE(users.nextUsers(f.make()) == 10.0);

    REQUIRE_THROWS_AS(FromDataUserGrowth(std::vector<double>{}), ConfigurationError);
}

TEST_CASE("UserGrowth: spaced schedule is rounded between initial and max", "[users]") {
    ContextFixture f;
    SpacedUserGrowth users(100.0, 1000.0, 4);

    const auto& schedule = users.getSchedule();
    REQUIRE(schedule == std::vector<double>{ 100.0, 400.0, 700.0, 1000.0 });

    REQUIRE(users.nextUsers(f.make()) == 100.0);
    REQUIRE(users.nextUsers(f.make()) == 400.0);
    REQUIRE(users.nextUsers(f.make()) == 700.0);
    REQUIRE(users.nextUsers(f.make()) == 1000.0);
    REQUIRE(users.nextUsers(f.make()) == 1000.0);
}

TEST_CASE("UserGrowth: spaced difference mode reports increments", "[users]") {
    SpacedUserGrowth users(100.0, 1000.0, 4, SpaceFunction::LINEAR, true);
    REQUIRE(users.getSchedule() == std::vector<double>{ 100.0, 300.0, 300.0, 300.0 });
}

TEST_CASE("UserGrowth: spaced noise never goes below zero", "[users]") {
    ContextFixture f;
    AddOnChain noise;
    noise.add(std::make_unique<RandomNoise>(Distribution::normal(0.0, 500.0)));
    SpacedUserGrowth users(10.0, 20.0, 5, SpaceFunction::LINEAR, false, noise);

    for (int i = 0; i < 50; ++i) {
        REQUIRE(users.nextUsers(f.make()) >= 0.0);
    }
}

TEST_CASE("UserGrowth: stochastic growth can accumulate", "[users]") {
    ContextFixture f;
    StochasticUserGrowth adding(Distribution::constant(5.0), true, 100.0);
    REQUIRE(adding.nextUsers(f.make()) == 105.0);
    REQUIRE(adding.nextUsers(f.make()) == 110.0);

    adding.reset();
    REQUIRE(adding.nextUsers(f.make()) == 105.0);

    StochasticUserGrowth replacing(Distribution::constant(5.0), false, 100.0);
    REQUIRE(replacing.nextUsers(f.make()) == 5.0);
    REQUIRE(replacing.nextUsers(f.make()) == 5.0);
}

TEST_CASE("UserGrowth: stochastic per-step parameters advance then repeat", "[users]") {
    ContextFixture f;
    DistributionParams a;
    a.loc = 1.0;
    DistributionParams b;
    b.loc = 2.0;
    StochasticUserGrowth users(DistributionKind::CONSTANT, { a, b });

    REQUIRE(users.nextUsers(f.make()) == 1.0);
    REQUIRE(users.nextUsers(f.make()) == 2.0);
    REQUIRE(users.nextUsers(f.make()) == 2.0);
}

TEST_CASE("UserGrowth: stochastic counts are floored at zero", "[users]") {
    ContextFixture f;
    StochasticUserGrowth users(Distribution::constant(-50.0));
    REQUIRE(users.nextUsers(f.make()) == 0.0);
}

// ---- Transactions --------------------------------------------------------------

TEST_CASE("Transactions: constant volume scales with users", "[transactions]") {
    ContextFixture f;
    ConstantTransactions tx(2.5);
    REQUIRE(tx.nextVolume(f.make(0, 1.0, 1000.0, 40.0)) == Approx(100.0));
    REQUIRE(tx.lastTransactionCount() == 40.0);
}

TEST_CASE("Transactions: from data ignores users", "[transactions]") {
    ContextFixture f;
    FromDataTransactions tx({ 5.0, -3.0 });
    REQUIRE(tx.nextVolume(f.make(0, 1.0, 1000.0, 999.0)) == 5.0);
    REQUIRE(tx.nextVolume(f.make()) == -3.0);
    REQUIRE(tx.nextVolume(f.make()) == -3.0);
}

TEST_CASE("Transactions: trend interpolates the per-user mean", "[transactions]") {
    ContextFixture f;
    TrendTransactions tx(1.0, 3.0, 3);
    REQUIRE(tx.nextVolume(f.make(0, 1.0, 1000.0, 10.0)) == Approx(10.0));
    REQUIRE(tx.nextVolume(f.make(1, 1.0, 1000.0, 10.0)) == Approx(20.0));
    REQUIRE(tx.nextVolume(f.make(2, 1.0, 1000.0, 10.0)) == Approx(30.0));
}

TEST_CASE("Transactions: trend noise below zero reverts to the mean", "[transactions]") {
    ContextFixture f;
    AddOnChain noise;
    noise.add(std::make_unique<RandomNoise>(Distribution::constant(-100.0)));
    TrendTransactions tx(2.0, 2.0, 2, SpaceFunction::LINEAR, noise);
    REQUIRE(tx.nextVolume(f.make(0, 1.0, 1000.0, 10.0)) == Approx(20.0));
}

TEST_CASE("Transactions: stochastic with fixed rates and full activity is exact", "[transactions]") {
    ContextFixture f;
    StochasticTransactionParams params;
    params.activityProbabilities = { 1.0 };
    params.transactionsPerUser = 2.0;
    params.valuePerTransaction = 5.0;

    StochasticTransactions tx(params);
    REQUIRE(tx.nextVolume(f.make(0, 1.0, 1000.0, 100.0)) == Approx(1000.0));
    REQUIRE(tx.getActiveUsers() == 100.0);
    REQUIRE(tx.lastTransactionCount() == Approx(200.0));
}

TEST_CASE("Transactions: stochastic activity thins the user base", "[transactions]") {
    ContextFixture f;
    StochasticTransactionParams params;
    params.activityProbabilities = { 0.0, 0.5 };
    params.transactionsPerUser = 1.0;
    params.valuePerTransaction = 1.0;

    StochasticTransactions tx(params);
    REQUIRE(tx.nextVolume(f.make(0, 1.0, 1000.0, 1000.0)) == 0.0);

    double second = tx.nextVolume(f.make(1, 1.0, 1000.0, 1000.0));
    REQUIRE(second > 350.0);
    REQUIRE(second < 650.0);
}

TEST_CASE("Transactions: stochastic sign policy zeroes the wrong direction", "[transactions]") {
    ContextFixture f;
    StochasticTransactionParams params;
    params.transactionsPerUser = 1.0;
    params.valuePerTransaction = -4.0;

    params.sign = SignPolicy::POSITIVE;
    StochasticTransactions positive(params);
    REQUIRE(positive.nextVolume(f.make(0, 1.0, 1000.0, 10.0)) == 0.0);

    params.sign = SignPolicy::ANY;
    StochasticTransactions any(params);
    REQUIRE(any.nextVolume(f.make(0, 1.0, 1000.0, 10.0)) == Approx(-40.0));
}

TEST_CASE("Transactions: stochastic rejects bad probabilities", "[transactions]") {
    StochasticTransactionParams params;
    params.activityProbabilities = { 1.2 };
    REQUIRE_THROWS_AS(StochasticTransactions(params), ConfigurationError);

    params.activityProbabilities.clear();
    REQUIRE_THROWS_AS(StochasticTransactions(params), ConfigurationError);
}

TEST_CASE("Transactions: marketcap volume follows price and supply", "[transactions]") {
    ContextFixture f;
    MarketcapTransactions any(Distribution::constant(-0.1), SignPolicy::ANY);
    REQUIRE(any.nextVolume(f.make(0, 2.0, 1000.0)) == Approx(-200.0));

    MarketcapTransactions positive(Distribution::constant(-0.1), SignPolicy::POSITIVE);
    REQUIRE(positive.nextVolume(f.make(0, 2.0, 1000.0)) == Approx(200.0));

    MarketcapTransactions negative(Distribution::constant(0.1), SignPolicy::NEGATIVE);
    REQUIRE(negative.nextVolume(f.make(0, 2.0, 1000.0)) == Approx(-200.0));
}

// ---- Holding time --------------------------------------------------------------

TEST_CASE("HoldingTime: constant must be positive", "[holding]") {
    ContextFixture f;
    ConstantHoldingTime h(2.0);
    REQUIRE(h.nextHoldingTime(f.make()) == 2.0);
    REQUIRE_THROWS_AS(ConstantHoldingTime(0.0), ConfigurationError);
}

TEST_CASE("HoldingTime: stochastic draws respect the minimum", "[holding]") {
    ContextFixture f;
    StochasticHoldingTime h(Distribution::normal(0.0, 1.0), 0.25);
    for (int i = 0; i < 200; ++i) {
        REQUIRE(h.nextHoldingTime(f.make()) >= 0.25);
    }
    REQUIRE_THROWS_AS(StochasticHoldingTime(Distribution::constant(1.0), 0.0), ConfigurationError);
}

TEST_CASE("HoldingTime: adaptive starts from its initial value", "[holding]") {
    ContextFixture f;
    AdaptiveHoldingTime h(3.0, 0.5, 10.0);
    REQUIRE(h.nextHoldingTime(f.make()) == 3.0);
}

TEST_CASE("HoldingTime: adaptive follows the previous step and clamps", "[holding]") {
    ContextFixture f;
    f.history.beginRow();
    f.history.record(f.keys.price, 2.0);
    f.history.record(f.keys.tokenVolume, 100.0);
    f.history.record(f.keys.fiatVolume, 50.0);
    f.history.commitRow();

    AdaptiveHoldingTime h(3.0, 0.5, 10.0);
    REQUIRE(h.nextHoldingTime(f.make(1)) == Approx(4.0));

    AdaptiveHoldingTime capped(3.0, 0.5, 2.0);
    REQUIRE(capped.nextHoldingTime(f.make(1)) == 2.0);
}

// ---- Agent pools ---------------------------------------------------------------

TEST_CASE("AgentPool: reports nothing before activation", "[pools]") {
    ContextFixture f;
    AgentPool pool("late", "$",
        std::make_unique<ConstantUserGrowth>(10.0),
        std::make_unique<ConstantTransactions>(3.0),
        2);

    pool.step(f.make(0));
    REQUIRE(pool.getUsers() == 0.0);
    REQUIRE(pool.getVolume() == 0.0);

    pool.step(f.make(2));
    REQUIRE(pool.getUsers() == 10.0);
    REQUIRE(pool.getVolume() == Approx(30.0));
    REQUIRE(pool.getTransactionCount() == 10.0);
}

TEST_CASE("AgentPool: clones keep their own component state", "[pools]") {
    ContextFixture f;
    AgentPool pool("data", "$",
        std::make_unique<FromDataUserGrowth>(std::vector<double>{ 1.0, 2.0, 3.0 }),
        std::make_unique<ConstantTransactions>(1.0));

    pool.step(f.make(0));
    auto copy = pool.clone();

    pool.step(f.make(1));
    copy->step(f.make(1));
    REQUIRE(pool.getUsers() == 2.0);
    REQUIRE(copy->getUsers() == 2.0);

    pool.reset();
    pool.step(f.make(0));
    REQUIRE(pool.getUsers() == 1.0);
    copy->step(f.make(2));
    REQUIRE(copy->getUsers() == 3.0);
}

TEST_CASE("AgentPool: keys and validation", "[pools]") {
    AgentPool pool("retail", "$",
        std::make_unique<ConstantUserGrowth>(1.0),
        std::make_unique<ConstantTransactions>(1.0));
    REQUIRE(pool.usersKey() == "retail_users");
    REQUIRE(pool.transactionsKey() == "retail_transactions");

    REQUIRE_THROWS_AS(AgentPool("", "$",
        std::make_unique<ConstantUserGrowth>(1.0),
        std::make_unique<ConstantTransactions>(1.0)), ConfigurationError);
    REQUIRE_THROWS_AS(AgentPool("x", "$", nullptr,
        std::make_unique<ConstantTransactions>(1.0)), ConfigurationError);
}
