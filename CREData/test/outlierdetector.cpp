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
#include <cred/marketdata/outlierdetector.hpp>
#include <cred/portfolio/unitnormalizer.hpp>
#include <cret/toplevelfixture.hpp>

using namespace cre::data;
using namespace QuantLib;
using namespace boost::unit_test_framework;

namespace {

// 60 quotes alternating between 100 and 102, i.e. mean 101 and population standard deviation 1
std::vector<PriceQuote> alternatingQuotes(const InstrumentKey& k, const Date& start) {
    std::vector<PriceQuote> quotes;
    for (Size i = 0; i < 60; ++i)
        quotes.push_back(PriceQuote(k, start + static_cast<Date::serial_type>(i), i % 2 == 0 ? 100.0 : 102.0, "USD/MT"));
    return quotes;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREDataTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(OutlierDetectorTests)

BOOST_AUTO_TEST_CASE(testSpikeIsFlagged) {
    InstrumentKey copper("Copper", "Oct-2024", "LME");
    Date start(1, January, 2024);
    std::vector<PriceQuote> quotes = alternatingQuotes(copper, start);
    // mean + 10 standard deviations of the undisturbed series
    Date spikeDate = start + 60;
    quotes.push_back(PriceQuote(copper, spikeDate, 111.0, "USD/MT"));

    UnitNormalizer normalizer;
    OutlierDetector detector(4.0);
    std::vector<OutlierRecord> outliers = detector.outliers(normalizer.normalise(quotes));

    BOOST_REQUIRE_EQUAL(outliers.size(), 1);
    BOOST_CHECK(outliers[0].key == copper);
    BOOST_CHECK_EQUAL(outliers[0].date, spikeDate);
    BOOST_CHECK_EQUAL(outliers[0].value, 111.0);
    BOOST_CHECK(outliers[0].zScore > 4.0);
    BOOST_CHECK_EQUAL(detector.count(normalizer.normalise(quotes)), 1);

    // the spike is within a high enough threshold
    BOOST_CHECK_EQUAL(OutlierDetector(10.0).count(normalizer.normalise(quotes)), 0);
}

BOOST_AUTO_TEST_CASE(testGroupsAreIndependent) {
    InstrumentKey copper("Copper", "Oct-2024", "LME"), zinc("Zinc", "Oct-2024", "LME");
    Date start(1, January, 2024);
    std::vector<PriceQuote> quotes = alternatingQuotes(copper, start);
    // a zinc level far away from copper is no outlier of its own group
    for (Size i = 0; i < 10; ++i)
        quotes.push_back(PriceQuote(zinc, start + static_cast<Date::serial_type>(i), 2700.0 + i, "USD/MT"));

    UnitNormalizer normalizer;
    BOOST_CHECK_EQUAL(OutlierDetector().count(normalizer.normalise(quotes)), 0);
}

BOOST_AUTO_TEST_CASE(testZeroVarianceFlagsNothing) {
    InstrumentKey copper("Copper", "Oct-2024", "LME"), zinc("Zinc", "Oct-2024", "LME");
    Date start(1, January, 2024);
    std::vector<PriceQuote> quotes;
    for (Size i = 0; i < 20; ++i) {
        quotes.push_back(PriceQuote(copper, start + static_cast<Date::serial_type>(i), 9000.0, "USD/MT"));
        quotes.push_back(PriceQuote(zinc, start + static_cast<Date::serial_type>(i), 2700.0, "USD/MT"));
    }
    UnitNormalizer normalizer;
    BOOST_CHECK(OutlierDetector().outliers(normalizer.normalise(quotes)).empty());
}

BOOST_AUTO_TEST_CASE(testSingleObservationFlagsNothing) {
    UnitNormalizer normalizer;
    std::vector<PriceQuote> quotes = {
        PriceQuote(InstrumentKey("Copper", "Oct-2024", "LME"), Date(1, January, 2024), 9000.0, "USD/MT")};
    BOOST_CHECK_EQUAL(OutlierDetector().count(normalizer.normalise(quotes)), 0);
    BOOST_CHECK_EQUAL(OutlierDetector().count(std::vector<PriceQuote>()), 0);
}

BOOST_AUTO_TEST_CASE(testInvalidInput) {
    BOOST_CHECK_THROW(OutlierDetector detector(0.0), QuantLib::Error);
    BOOST_CHECK_THROW(OutlierDetector detector(-1.0), QuantLib::Error);

    // quotes must be normalised
    std::vector<PriceQuote> raw = {
        PriceQuote(InstrumentKey("Copper", "Oct-2024", "LME"), Date(1, January, 2024), 9000.0, "USD/MT")};
    BOOST_CHECK_THROW(OutlierDetector().outliers(raw), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
