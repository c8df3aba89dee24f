#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "components/SupplyController.hpp"
#include "ContextFixture.hpp"
#include <cmath>
#include <limits>

using namespace tokensim;
using Catch::Approx;

TEST_CASE("Supply: percentage burn scales with supply", "[supply]") {
    ContextFixture f;
    RateSupplyController burn(SupplyDirection::BURN, 0.05 / 30.0, "perc");
    REQUIRE(burn.computeDelta(f.make(0, 1.0, 30000.0)) == Approx(-50.0));
    REQUIRE(burn.getStyle() == SupplyStyle::PERCENTAGE);
}

TEST_CASE("Supply: absolute mint adds a fixed amount", "[supply]") {
    ContextFixture f;
    RateSupplyController mint(SupplyDirection::MINT, 250.0, SupplyStyle::ABSOLUTE);
    REQUIRE(mint.computeDelta(f.make(0, 1.0, 10.0)) == 250.0);
    REQUIRE(mint.computeDelta(f.make(1, 1.0, 1e9)) == 250.0);
}

TEST_CASE("Supply: self-destructing controllers fire once per repetition", "[supply]") {
    ContextFixture f;
    RateSupplyController once(SupplyDirection::MINT, 100.0, "fixed", true);
    REQUIRE(once.computeDelta(f.make()) == 100.0);
    REQUIRE(once.computeDelta(f.make(1)) == 0.0);

    once.reset();
    REQUIRE(once.computeDelta(f.make()) == 100.0);
}

TEST_CASE("Supply: rate controllers reject bad parameters", "[supply]") {
    REQUIRE_THROWS_AS(RateSupplyController(SupplyDirection::BURN, 0.1, "percent"), ConfigurationError);
    REQUIRE_THROWS_AS(RateSupplyController(SupplyDirection::BURN, -0.1, "perc"), ConfigurationError);
    REQUIRE_THROWS_AS(RateSupplyController(SupplyDirection::MINT,
        std::numeric_limits<double>::infinity(), "fixed"), ConfigurationError);
}

TEST_CASE("Supply: vesting releases chunks after delay and cliff", "[supply]") {
    VestingSupplyController vesting(1200.0, 4, 2, 1);
    REQUIRE(vesting.getSchedule() == std::vector<double>{ 0.0, 0.0, 0.0, 300.0, 300.0, 300.0, 300.0 });

    ContextFixture f;
    double total = 0.0;
    for (int i = 0; i < 10; ++i) {
        total += vesting.computeDelta(f.make(static_cast<StepIndex>(i)));
    }
    REQUIRE(total == Approx(1200.0));

    vesting.reset();
    REQUIRE(vesting.computeDelta(f.make()) == 0.0);
}

TEST_CASE("Supply: vesting with no period releases everything at once", "[supply]") {
    VestingSupplyController vesting(500.0, 0);
    REQUIRE(vesting.getSchedule() == std::vector<double>{ 500.0 });
}

TEST_CASE("Supply: dumping follows a rounded schedule then stops", "[supply]") {
    DumpingSupplyController dump(100.0, 10.0, 4);
    REQUIRE(dump.getSchedule() == std::vector<double>{ 100.0, 70.0, 40.0, 10.0 });

    ContextFixture f;
    for (double expected : { 100.0, 70.0, 40.0, 10.0, 0.0, 0.0 }) {
        REQUIRE(dump.computeDelta(f.make()) == expected);
    }
}

TEST_CASE("Supply: adaptive stochastic parks and returns purchased tokens", "[supply]") {
    ContextFixture f;
    AdaptiveStochasticSupplyController adaptive(Distribution::constant(0.5), Distribution::constant(0.1));

    // 400 tokens bought at price 2 with holding time 1: 200 purchased, 100 parked, 10 returned
    double delta = adaptive.computeDelta(f.make(0, 2.0, 1000.0, 0.0, 0.0, 400.0, 1.0));
    REQUIRE(delta == Approx(-90.0));
    REQUIRE(adaptive.getInactiveTokens() == Approx(90.0));

    // Nothing bought: only returns
    delta = adaptive.computeDelta(f.make(1, 2.0, 1000.0, 0.0, 0.0, 0.0, 1.0));
    REQUIRE(delta == Approx(9.0));
    REQUIRE(adaptive.getInactiveTokens() == Approx(81.0));

    adaptive.reset();
    REQUIRE(adaptive.getInactiveTokens() == 0.0);
}

TEST_CASE("Supply: controllers clone independently", "[supply]") {
    ContextFixture f;
    DumpingSupplyController dump(5.0, 5.0, 2);
    dump.computeDelta(f.make());

    auto copy = dump.clone();
    REQUIRE(copy->computeDelta(f.make()) == 5.0);
    REQUIRE(copy->computeDelta(f.make()) == 0.0);
    REQUIRE(dump.computeDelta(f.make()) == 5.0);
    REQUIRE(copy->name() == "dumping");
}

TEST_CASE("Supply: from data adds recorded changes and repeats the last one", "[supply]") {
    ContextFixture f;
    FromDataSupplyController data({ 100.0, -40.0, 5.0 });
    for (double expected : { 100.0, -40.0, 5.0, 5.0, 5.0 }) {
        REQUIRE(data.computeDelta(f.make()) == expected);
    }

    data.reset();
    REQUIRE(data.computeDelta(f.make()) == 100.0);
    REQUIRE_NOTHROW(data.prepare(10));
}

TEST_CASE("Supply: from data without continuation refuses longer runs", "[supply]") {
    FromDataSupplyController strict({ 1.0, 2.0 }, false);
    REQUIRE_NOTHROW(strict.prepare(2));
    REQUIRE_THROWS_AS(strict.prepare(3), ConfigurationError);

    REQUIRE_THROWS_AS(FromDataSupplyController(std::vector<double>{}), ConfigurationError);
    REQUIRE_THROWS_AS(FromDataSupplyController({ 1.0, std::nan("") }), ConfigurationError);
}

TEST_CASE("Supply: speculators hold until take profit", "[supply]") {
    ContextFixture f;
    SpeculatorParams params;
    params.speculation = Distribution::constant(0.1);
    params.takeProfit = 1.2;
    params.stopLoss = 0.8;
    params.maxShareOfSupply = 0.5;
    SpeculatorSupplyController speculator(params);

    // 10% of 500 fiat at price 1 leaves circulation
    REQUIRE(speculator.computeDelta(f.make(0, 1.0, 1000.0, 0.0, 500.0)) == Approx(-50.0));
    REQUIRE(speculator.getHeldTokens() == Approx(50.0));

    // Inside the band: nothing moves
    REQUIRE(speculator.computeDelta(f.make(1, 1.1, 1000.0, 0.0, 0.0)) == Approx(0.0));
    REQUIRE(speculator.getOpenPositions() == 1);

    // Above take profit: the position is sold while a new one opens
    double bought = 100.0 * 0.1 / 1.3;
    REQUIRE(speculator.computeDelta(f.make(2, 1.3, 1000.0, 0.0, 100.0)) == Approx(50.0 - bought));
    REQUIRE(speculator.getHeldTokens() == Approx(bought));
    REQUIRE(speculator.getOpenPositions() == 1);
}

TEST_CASE("Supply: speculators sell at stop loss", "[supply]") {
    ContextFixture f;
    SpeculatorParams params;
    params.speculation = Distribution::constant(0.2);
    SpeculatorSupplyController speculator(params);

    speculator.computeDelta(f.make(0, 2.0, 1000.0, 0.0, 100.0));
    REQUIRE(speculator.getHeldTokens() == Approx(10.0));

    REQUIRE(speculator.computeDelta(f.make(1, 1.0, 1000.0, 0.0, 0.0)) == Approx(10.0));
    REQUIRE(speculator.getHeldTokens() == Approx(0.0));

    speculator.computeDelta(f.make(2, 1.0, 1000.0, 0.0, 100.0));
    speculator.reset();
    REQUIRE(speculator.getHeldTokens() == 0.0);
    REQUIRE(speculator.getOpenPositions() == 0);
}

TEST_CASE("Supply: speculator holdings are capped by supply share", "[supply]") {
    ContextFixture f;
    SpeculatorParams params;
    params.speculation = Distribution::constant(0.1);
    params.maxShareOfSupply = 0.01;
    SpeculatorSupplyController speculator(params);

    REQUIRE(speculator.computeDelta(f.make(0, 1.0, 1000.0, 0.0, 500.0)) == Approx(-10.0));
    REQUIRE(speculator.computeDelta(f.make(1, 1.0, 1000.0, 0.0, 500.0)) == Approx(0.0));

    // Without a price nothing can be bought
    SpeculatorSupplyController idle(params);
    REQUIRE(idle.computeDelta(f.make(0, 0.0, 1000.0, 0.0, 500.0)) == 0.0);
}

TEST_CASE("Supply: speculator parameters are validated", "[supply]") {
    SpeculatorParams params;
    params.takeProfit = 0.9;
    REQUIRE_THROWS_AS(SpeculatorSupplyController(params), ConfigurationError);

    params = SpeculatorParams();
    params.stopLoss = 1.5;
    REQUIRE_THROWS_AS(SpeculatorSupplyController(params), ConfigurationError);

    params = SpeculatorParams();
    params.maxShareOfSupply = 2.0;
    REQUIRE_THROWS_AS(SpeculatorSupplyController(params), ConfigurationError);
}
