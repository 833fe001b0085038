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
#include <cred/portfolio/unitnormalizer.hpp>
#include <cred/utilities/log.hpp>
#include <cret/toplevelfixture.hpp>

using namespace cre::data;
using namespace QuantLib;
using namespace boost::unit_test_framework;

namespace {

Position position(const std::string& longShort, Real volume, const std::string& unit) {
    Position p;
    p.key = InstrumentKey("Copper", "Oct-2024", "LME");
    p.longShort = longShort;
    p.volume = volume;
    p.unit = unit;
    return p;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREDataTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(UnitNormalizerTests)

BOOST_AUTO_TEST_CASE(testPoundRoundTrip) {
    UnitNormalizer normalizer;
    Real lbFactor = normalizer.volumeUnits().factor("LB");
    BOOST_CHECK_CLOSE(lbFactor, 0.0004536, 1e-12);

    for (Real volume : {1.0, 1000.0, 123456.789, 2.5e7}) {
        Real mass = normalizer.massVolume(volume, "LB");
        BOOST_CHECK_CLOSE(mass, volume * 0.0004536, 1e-10);
        BOOST_CHECK_CLOSE(mass / lbFactor, volume, 1e-10);
    }
    BOOST_CHECK_EQUAL(normalizer.massVolume(1000.0, "MT"), 1000.0);
    BOOST_CHECK(normalizer.unrecognisedUnits().empty());
}

BOOST_AUTO_TEST_CASE(testSign) {
    UnitNormalizer normalizer;

    Position l = normalizer.normalise(position("L", 1000.0, "MT"));
    BOOST_CHECK(l.normalised());
    BOOST_CHECK_EQUAL(l.massVolume, 1000.0);
    BOOST_CHECK_EQUAL(l.signedVolume, 1000.0);

    Position s = normalizer.normalise(position("S", 1000.0, "LB"));
    BOOST_CHECK_CLOSE(s.massVolume, 0.4536, 1e-10);
    BOOST_CHECK_CLOSE(s.signedVolume, -0.4536, 1e-10);
    BOOST_CHECK_EQUAL(normalizer.ambiguousSides(), 0);

    // anything but L is short, the ambiguous tags are counted
    Position x = normalizer.normalise(position("Long", 10.0, "MT"));
    BOOST_CHECK_EQUAL(x.signedVolume, -10.0);
    Position e = normalizer.normalise(position("", 10.0, "MT"));
    BOOST_CHECK_EQUAL(e.signedVolume, -10.0);
    BOOST_CHECK_EQUAL(normalizer.ambiguousSides(), 2);
}

BOOST_AUTO_TEST_CASE(testUnknownUnitPassesThrough) {
    UnitNormalizer normalizer;

    Position p = normalizer.normalise(position("L", 500.0, "KG"));
    BOOST_CHECK_EQUAL(p.massVolume, 500.0);
    normalizer.normalise(position("L", 10.0, "KG"));
    PriceQuote q = normalizer.normalise(PriceQuote(p.key, Date(1, October, 2024), 9000.0, "EUR/MT"));
    BOOST_CHECK_EQUAL(q.massQuote, 9000.0);

    BOOST_REQUIRE_EQUAL(normalizer.unrecognisedUnits().size(), 2);
    BOOST_CHECK_EQUAL(normalizer.unrecognisedUnits().at("KG"), 2);
    BOOST_CHECK_EQUAL(normalizer.unrecognisedUnits().at("EUR/MT"), 1);
}

BOOST_AUTO_TEST_CASE(testUnknownUnitIsLogged) {
    auto logger = QuantLib::ext::make_shared<BufferLogger>(CRE_WARNING);
    Log::instance().registerLogger(logger);
    Log::instance().setMask(255);
    Log::instance().switchOn();

    UnitNormalizer normalizer;
    normalizer.normalise(position("L", 1.0, "OZ"));
    normalizer.normalise(position("L", 1.0, "OZ"));

    // one warning on the first occurrence only
    BOOST_REQUIRE(logger->hasNext());
    std::string msg = logger->next();
    BOOST_CHECK(msg.find("'OZ' not recognised") != std::string::npos);
    BOOST_CHECK(!logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testQuoteIsDividedByFactor) {
    UnitNormalizer normalizer;
    InstrumentKey k("Copper", "Oct-2024", "COMEX");

    PriceQuote perPound = normalizer.normalise(PriceQuote(k, Date(1, October, 2024), 4.0, "USD/LB"));
    BOOST_CHECK(perPound.normalised());
    BOOST_CHECK_CLOSE(perPound.massQuote, 4.0 / 0.0004536, 1e-10);
    // the sign of a quote is never changed
    PriceQuote negative = normalizer.normalise(PriceQuote(k, Date(1, October, 2024), -5.0, "USD/MT"));
    BOOST_CHECK_EQUAL(negative.massQuote, -5.0);
}

BOOST_AUTO_TEST_CASE(testCustomTables) {
    UnitConversionTable volumes({{"KT", 1000.0}});
    UnitConversionTable prices({{"USD/KT", 1000.0}});
    UnitNormalizer normalizer(volumes, prices);

    Position p = normalizer.normalise(position("L", 2.0, "KT"));
    BOOST_CHECK_EQUAL(p.massVolume, 2000.0);
    PriceQuote q = normalizer.normalise(PriceQuote(p.key, Date(1, October, 2024), 9000000.0, "USD/KT"));
    BOOST_CHECK_EQUAL(q.massQuote, 9000.0);

    // the default tables are not consulted
    normalizer.normalise(position("L", 2.0, "MT"));
    BOOST_CHECK_EQUAL(normalizer.unrecognisedUnits().count("MT"), 1);
}

BOOST_AUTO_TEST_CASE(testInvalidTable) {
    BOOST_CHECK_THROW(UnitConversionTable({{"LB", 0.0}}), QuantLib::Error);
    BOOST_CHECK_THROW(UnitConversionTable({{"LB", -1.0}}), QuantLib::Error);
    BOOST_CHECK_THROW(UnitConversionTable::volumeDefaults().factor("KG"), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
