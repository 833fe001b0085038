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

#include <crea/engine/historicalsimulationvar.hpp>

#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/math/statistics/generalstatistics.hpp>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>

using namespace boost::accumulators;
using namespace cre::data;
using namespace QuantLib;
using std::vector;

namespace cre {
namespace analytics {

HistoricalSimulationVarCalculator::HistoricalSimulationVarCalculator(const vector<Real>& pnls) : pnls_(pnls) {
    QL_REQUIRE(!pnls_.empty(), "HistoricalSimulationVarCalculator: no P&L given");
}

Real HistoricalSimulationVarCalculator::quantile(Real confidence) const {
    QL_REQUIRE(confidence > 0.0 && confidence < 1.0,
               "HistoricalSimulationVarCalculator: confidence level " << confidence << " must be in (0, 1)");
    GeneralStatistics statistics;
    statistics.addSequence(pnls_.begin(), pnls_.end());
    return statistics.percentile(1.0 - confidence);
}

Real HistoricalSimulationVarCalculator::var(Real confidence) const { return -quantile(confidence); }

Real HistoricalSimulationVarCalculator::expectedShortfall(Real confidence) const {

    // calculate the quantile for the expected shortfall, the tail is never empty as it contains the quantile itself
    const Real q = quantile(confidence);

    accumulator_set<Real, stats<tag::mean>> acc;
    for (const auto pnl : pnls_) {
        if (pnl <= q)
            acc(pnl);
    }
    return -mean(acc);
}

Result<vector<Real>> dailyPnls(const PortfolioValueSeries& series) {
    if (series.size() < 2)
        return RiskError(RiskError::Kind::InsufficientHistory,
                         "dailyPnls: " + std::to_string(series.size()) + " valued dates, at least 2 required");
    vector<Real> pnls;
    pnls.reserve(series.size() - 1);
    for (Size i = 1; i < series.size(); ++i)
        pnls.push_back(series[i].value - series[i - 1].value);
    DLOG("dailyPnls: " << pnls.size() << " P&Ls from " << series.front().date << " to " << series.back().date);
    return pnls;
}

} // namespace analytics
} // namespace cre
