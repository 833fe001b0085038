/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <boost/test/unit_test.hpp>
#include <crea/engine/weightcalculator.hpp>
#include <cred/marketdata/pricejoiner.hpp>
#include <cret/toplevelfixture.hpp>

#include "testmarket.hpp"

#include <cmath>

using namespace cre::data;
using namespace cre::analytics;
using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace testsuite;
using std::vector;

namespace {

struct WeightData : public cre::test::TopLevelFixture {
    WeightData() : copper("Copper", "Oct-2024", "LME"), nickel("Nickel", "Oct-2024", "LME"), zinc("Zinc", "Oct-2024", "LME") {
        Date d(30, September, 2024);
        prices = buildPriceHistory({PriceQuote(copper, d, 9000.0, "USD/MT"), PriceQuote(zinc, d, 2700.0, "USD/MT")});
    }

    vector<PricedPosition> priced(const vector<Position>& positions) const {
        return PriceJoiner(prices).joinLatest(normalised(positions));
    }

    InstrumentKey copper, nickel, zinc;
    QuantLib::ext::shared_ptr<PriceHistory> prices;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREAnalyticsTestSuite, cre::test::TopLevelFixture)

BOOST_FIXTURE_TEST_SUITE(WeightCalculatorTests, WeightData)

BOOST_AUTO_TEST_CASE(testWeights) {
    WeightCalculator calculator(priced({buildPosition(copper, 1000.0, "L"), buildPosition(zinc, 500.0, "S")}));
    Result<WeightVector> r = calculator.weights();
    BOOST_REQUIRE(r.ok());

    Real gross = 1000.0 * 9000.0 + 500.0 * 2700.0;
    BOOST_CHECK_CLOSE(calculator.grossExposure(), gross, 1e-10);
    BOOST_CHECK_EQUAL(calculator.pricedPositions(), 2);
    BOOST_CHECK(calculator.unpricedKeys().empty());

    const WeightVector& w = r.value();
    BOOST_REQUIRE_EQUAL(w.size(), 2);
    BOOST_CHECK_CLOSE(w.at(copper), 9.0e6 / gross, 1e-10);
    BOOST_CHECK_CLOSE(w.at(zinc), -1.35e6 / gross, 1e-10);

    Real sum = 0.0;
    for (const auto& kv : w)
        sum += std::fabs(kv.second);
    BOOST_CHECK_CLOSE(sum, 1.0, 1e-10);
}

BOOST_AUTO_TEST_CASE(testPositionsNettedPerInstrument) {
    WeightCalculator calculator(priced({buildPosition(copper, 1000.0, "L"), buildPosition(copper, 400.0, "S")}));
    Result<WeightVector> r = calculator.weights();
    BOOST_REQUIRE(r.ok());
    BOOST_CHECK_CLOSE(calculator.grossExposure(), 600.0 * 9000.0, 1e-10);
    BOOST_REQUIRE_EQUAL(r.value().size(), 1);
    BOOST_CHECK_CLOSE(r.value().at(copper), 1.0, 1e-10);
}

BOOST_AUTO_TEST_CASE(testOffsettingPositionsHaveZeroExposure) {
    WeightCalculator calculator(priced({buildPosition(copper, 1000.0, "L"), buildPosition(copper, 1000.0, "S")}));
    BOOST_CHECK_EQUAL(calculator.grossExposure(), 0.0);
    Result<WeightVector> r = calculator.weights();
    BOOST_CHECK(r.failedWith(RiskError::Kind::ZeroExposure));

    // same exposure in a different unit
    WeightCalculator inPounds(
        priced({buildPosition(copper, 1000.0, "L"), buildPosition(copper, 1000.0 / 0.0004536, "S", "LB")}));
    BOOST_CHECK_SMALL(inPounds.grossExposure(), 1e-6);
}

BOOST_AUTO_TEST_CASE(testUnpricedPositionsExcluded) {
    WeightCalculator calculator(priced({buildPosition(copper, 1000.0, "L"), buildPosition(nickel, 50.0, "L")}));
    BOOST_CHECK_EQUAL(calculator.pricedPositions(), 1);
    BOOST_REQUIRE_EQUAL(calculator.unpricedKeys().size(), 1);
    BOOST_CHECK(calculator.unpricedKeys()[0] == nickel);

    Result<WeightVector> r = calculator.weights();
    BOOST_REQUIRE(r.ok());
    BOOST_CHECK_EQUAL(r.value().size(), 1);
    BOOST_CHECK(r.value().find(nickel) == r.value().end());
    BOOST_CHECK_CLOSE(r.value().at(copper), 1.0, 1e-10);
}

BOOST_AUTO_TEST_CASE(testMissingMarketData) {
    WeightCalculator calculator(priced({buildPosition(nickel, 50.0, "L")}));
    BOOST_CHECK(calculator.weights().failedWith(RiskError::Kind::MissingMarketData));
}

BOOST_AUTO_TEST_CASE(testEmptyBook) {
    WeightCalculator calculator(priced(vector<Position>()));
    BOOST_CHECK(calculator.weights().failedWith(RiskError::Kind::ZeroExposure));
    BOOST_CHECK_EQUAL(calculator.grossExposure(), 0.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
