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

#include <crea/app/varanalytic.hpp>

#include <cred/marketdata/pricehistory.hpp>
#include <cred/portfolio/unitnormalizer.hpp>
#include <cred/utilities/log.hpp>

#include <boost/timer/timer.hpp>

using namespace cre::data;
using namespace QuantLib;
using std::vector;

namespace cre {
namespace analytics {

VarAnalyticResults VarAnalytic::run(const vector<Position>& positions, const vector<PriceQuote>& quotes) const {

    boost::timer::cpu_timer timer;
    LOG("VarAnalytic: start run with " << positions.size() << " positions and " << quotes.size() << " quotes");
    parameters_.log();

    VarAnalyticResults results;

    UnitNormalizer normalizer(parameters_.volumeUnits(), parameters_.priceUnits());
    vector<Position> book = normalizer.normalise(positions);
    vector<PriceQuote> normalisedQuotes = normalizer.normalise(quotes);
    results.unrecognisedUnits = normalizer.unrecognisedUnits();
    results.ambiguousSides = normalizer.ambiguousSides();

    // data quality check, it does not change the prices used below
    results.outliers = OutlierDetector(parameters_.outlierThreshold()).outliers(normalisedQuotes);
    results.outlierCount = results.outliers.size();

    auto prices = QuantLib::ext::make_shared<PriceHistory>(normalisedQuotes);

    PortfolioAggregator aggregator(prices, parameters_.method(), parameters_.confidence(),
                                   parameters_.lookbackDays(), parameters_.horizonDays(), parameters_.threads());
    results.totalVar = aggregator.total(book);
    if (parameters_.method() == VarMethod::Historical) {
        results.totalExpectedShortfall =
            PortfolioVarEngine(prices, parameters_.method(), parameters_.confidence(), parameters_.lookbackDays(),
                               parameters_.horizonDays())
                .expectedShortfall(book);
    }
    results.varByLevel = aggregator.breakdown(book, parameters_.breakdown());

    LOG("VarAnalytic: run finished, " << results.outlierCount << " outliers, timings: "
                                      << static_cast<double>(timer.elapsed().wall) / 1.0E9 << "s Wall");
    return results;
}

} // namespace analytics
} // namespace cre
