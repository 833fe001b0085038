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
#include <crea/engine/portfolioaggregator.hpp>
#include <crea/engine/varmessage.hpp>
#include <cret/toplevelfixture.hpp>

#include "testmarket.hpp"

using namespace cre::data;
using namespace cre::analytics;
using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace testsuite;
using std::string;
using std::vector;

namespace {

// copper and zinc are quoted, nickel is not
struct AggregatorData : public cre::test::TopLevelFixture {
    AggregatorData()
        : copper("Copper", "Oct-2024", "LME"), copperDec("Copper", "Dec-2024", "COMEX"),
          nickel("Nickel", "Oct-2024", "LME"), zinc("Zinc", "Oct-2024", "LME"), start(1, September, 2024) {
        vector<PriceQuote> quotes = buildQuotes(copper, start, 40, 9000.0, 9500.0, 30.0);
        vector<PriceQuote> more = buildQuotes(zinc, start, 40, 2800.0, 2650.0, 15.0);
        quotes.insert(quotes.end(), more.begin(), more.end());
        more = buildQuotes(copperDec, start, 40, 4.10, 4.30, 0.02, "USD/LB");
        quotes.insert(quotes.end(), more.begin(), more.end());
        prices = buildPriceHistory(quotes);

        book = normalised({buildPosition(copper, 1000.0, "L", "MT", "Trading", "Outright"),
                           buildPosition(copperDec, 250000.0, "S", "LB", "Trading", "Spread"),
                           buildPosition(zinc, 500.0, "S", "MT", "Hedging", "Outright"),
                           buildPosition(nickel, 100.0, "L", "MT", "Hedging", "Outright")});
    }

    InstrumentKey copper, copperDec, nickel, zinc;
    Date start;
    QuantLib::ext::shared_ptr<PriceHistory> prices;
    vector<Position> book;
};

void checkSameResults(const VarByLevel& x, const VarByLevel& y) {
    BOOST_REQUIRE_EQUAL(x.size(), y.size());
    for (const auto& level : x) {
        auto it = y.find(level.first);
        BOOST_REQUIRE(it != y.end());
        BOOST_REQUIRE_EQUAL(level.second.ok(), it->second.ok());
        if (!level.second.ok())
            continue;
        BOOST_REQUIRE_EQUAL(level.second.value().size(), it->second.value().size());
        for (const auto& kv : level.second.value()) {
            const Result<Real>& other = it->second.value().at(kv.first);
            BOOST_REQUIRE_EQUAL(kv.second.ok(), other.ok());
            if (kv.second.ok()) {
                BOOST_CHECK_EQUAL(kv.second.value(), other.value());
            } else {
                BOOST_CHECK(kv.second.error().kind() == other.error().kind());
            }
        }
    }
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREAnalyticsTestSuite, cre::test::TopLevelFixture)

BOOST_FIXTURE_TEST_SUITE(PortfolioAggregatorTests, AggregatorData)

BOOST_AUTO_TEST_CASE(testPartition) {
    auto byMetal = PortfolioAggregator::partition(book, BreakdownDimension::Metal);
    BOOST_REQUIRE_EQUAL(byMetal.size(), 3);
    BOOST_CHECK_EQUAL(byMetal.at("Copper").size(), 2);
    BOOST_CHECK_EQUAL(byMetal.at("Zinc").size(), 1);
    BOOST_CHECK_EQUAL(byMetal.at("Nickel").size(), 1);

    auto byExchange = PortfolioAggregator::partition(book, BreakdownDimension::Exchange);
    BOOST_CHECK_EQUAL(byExchange.size(), 2);
    BOOST_CHECK_EQUAL(byExchange.at("LME").size(), 3);

    auto total = PortfolioAggregator::partition(book, BreakdownDimension::Total);
    BOOST_REQUIRE_EQUAL(total.size(), 1);
    BOOST_CHECK_EQUAL(total.at("Total").size(), 4);
}

BOOST_AUTO_TEST_CASE(testBreakdown) {
    PortfolioAggregator aggregator(prices, VarMethod::Parametric);
    VarByLevel r = aggregator.breakdown(book, {"Total", "BUSINESS LINE", "METAL", "Desk"});
    BOOST_CHECK_EQUAL(r.size(), 4);

    // total
    BOOST_REQUIRE(r.at("Total").ok());
    const VarByValue& total = r.at("Total").value();
    BOOST_REQUIRE_EQUAL(total.size(), 1);
    BOOST_REQUIRE(total.at("Total").ok());
    Result<Real> direct = aggregator.total(book);
    BOOST_REQUIRE(direct.ok());
    BOOST_CHECK_EQUAL(total.at("Total").value(), direct.value());

    // one value per business line
    BOOST_REQUIRE(r.at("BUSINESS LINE").ok());
    const VarByValue& businessLines = r.at("BUSINESS LINE").value();
    BOOST_REQUIRE_EQUAL(businessLines.size(), 2);
    BOOST_CHECK(businessLines.at("Trading").ok());
    BOOST_CHECK(businessLines.at("Hedging").ok());

    // each partition runs the full pipeline on its own positions
    BOOST_REQUIRE(r.at("METAL").ok());
    const VarByValue& metals = r.at("METAL").value();
    BOOST_REQUIRE_EQUAL(metals.size(), 3);
    Result<Real> zincOnly =
        PortfolioVarEngine(prices, VarMethod::Parametric).var(normalised({buildPosition(zinc, 500.0, "S")}));
    BOOST_REQUIRE(metals.at("Zinc").ok());
    BOOST_CHECK_CLOSE(metals.at("Zinc").value(), zincOnly.value(), 1e-10);

    // a failing partition does not affect the others
    BOOST_CHECK(metals.at("Nickel").failedWith(RiskError::Kind::MissingMarketData));
    BOOST_CHECK(metals.at("Copper").ok());

    // unknown dimension
    BOOST_CHECK(r.at("Desk").failedWith(RiskError::Kind::UnknownBreakdownColumn));
}

BOOST_AUTO_TEST_CASE(testBadQuoteOnlyFailsItsPartition) {
    // copper as before, zinc with a zero quote inside the window
    vector<PriceQuote> quotes = buildQuotes(copper, start, 40, 9000.0, 9500.0, 30.0);
    vector<PriceQuote> zincQuotes = buildQuotes(zinc, start, 40, 2800.0, 2650.0, 15.0);
    zincQuotes[20].value = 0.0;
    quotes.insert(quotes.end(), zincQuotes.begin(), zincQuotes.end());
    auto withBadZinc = buildPriceHistory(quotes);

    for (Size threads : {1, 4}) {
        BOOST_TEST_MESSAGE("threads " << threads);
        PortfolioAggregator aggregator(withBadZinc, VarMethod::Parametric, 0.99, 365, 1, threads);
        VarByLevel r;
        BOOST_REQUIRE_NO_THROW(r = aggregator.breakdown(book, {"Total", "METAL"}));

        BOOST_REQUIRE(r.at("Total").ok());
        BOOST_CHECK(r.at("Total").value().at("Total").failedWith(RiskError::Kind::MissingMarketData));

        BOOST_REQUIRE(r.at("METAL").ok());
        const VarByValue& metals = r.at("METAL").value();
        BOOST_REQUIRE_EQUAL(metals.size(), 3);
        BOOST_CHECK(metals.at("Zinc").failedWith(RiskError::Kind::MissingMarketData));
        BOOST_CHECK(metals.at("Nickel").failedWith(RiskError::Kind::MissingMarketData));
        BOOST_REQUIRE(metals.at("Copper").ok());

        // the Dec copper position is unpriced here, so the partition is the Oct copper position alone
        Result<Real> copperOnly = PortfolioVarEngine(prices, VarMethod::Parametric)
                                      .var(normalised({buildPosition(copper, 1000.0, "L")}));
        BOOST_REQUIRE(copperOnly.ok());
        BOOST_CHECK_CLOSE(metals.at("Copper").value(), copperOnly.value(), 1e-10);
    }
}

BOOST_AUTO_TEST_CASE(testDimensionSpelling) {
    PortfolioAggregator aggregator(prices, VarMethod::Parametric);
    // both spellings name the same dimension, it is evaluated once
    VarByLevel r = aggregator.breakdown(book, {"metal", "METAL", "business_line"});
    BOOST_REQUIRE_EQUAL(r.size(), 2);
    BOOST_CHECK(r.find("METAL") != r.end());
    BOOST_CHECK(r.find("BUSINESS LINE") != r.end());
}

BOOST_AUTO_TEST_CASE(testThreadsGiveSameResults) {
    vector<string> dimensions = {"Total", "BUSINESS LINE", "STRATEGY", "METAL", "EXCHANGE", "MATURITY", "Desk"};
    for (auto method : {VarMethod::Parametric, VarMethod::Historical}) {
        VarByLevel sequential = PortfolioAggregator(prices, method, 0.99, 365, 1, 1).breakdown(book, dimensions);
        VarByLevel parallel = PortfolioAggregator(prices, method, 0.99, 365, 1, 4).breakdown(book, dimensions);
        checkSameResults(sequential, parallel);
    }
}

BOOST_AUTO_TEST_CASE(testEmptyBook) {
    PortfolioAggregator aggregator(prices, VarMethod::Parametric);
    BOOST_CHECK(aggregator.total(vector<Position>()).failedWith(RiskError::Kind::ZeroExposure));

    VarByLevel r = aggregator.breakdown(vector<Position>(), {"Total", "METAL"});
    BOOST_REQUIRE(r.at("Total").ok());
    BOOST_CHECK(r.at("Total").value().at("Total").failedWith(RiskError::Kind::ZeroExposure));
    BOOST_REQUIRE(r.at("METAL").ok());
    BOOST_CHECK(r.at("METAL").value().empty());
}

BOOST_AUTO_TEST_CASE(testInvalidThreads) {
    BOOST_CHECK_THROW(PortfolioAggregator aggregator(prices, VarMethod::Parametric, 0.99, 365, 1, 0), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testFailureMessage) {
    RiskError error(RiskError::Kind::MissingMarketData, "no quotes for NICKEL");

    VarFailureMessage partition(StructuredMessage::Category::Warning, error, "METAL", "Nickel");
    BOOST_CHECK_EQUAL(partition.message(), "no quotes for NICKEL");
    BOOST_CHECK(partition.group() == StructuredMessage::Group::Analytics);
    BOOST_CHECK_EQUAL(partition.subFields().at("analyticType"), "VaR");
    BOOST_CHECK_EQUAL(partition.subFields().at("errorKind"), "MissingMarketData");
    BOOST_CHECK_EQUAL(partition.subFields().at("dimension"), "METAL");
    BOOST_CHECK_EQUAL(partition.subFields().at("value"), "Nickel");

    VarFailureMessage total(StructuredMessage::Category::Error, error, "Total");
    BOOST_CHECK(total.category() == StructuredMessage::Category::Error);
    BOOST_CHECK_EQUAL(total.subFields().count("value"), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
