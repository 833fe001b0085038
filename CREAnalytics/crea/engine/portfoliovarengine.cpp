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

#include <crea/engine/covarianceestimator.hpp>
#include <crea/engine/historicalsimulationvar.hpp>
#include <crea/engine/parametricvar.hpp>
#include <crea/engine/portfoliovalueseries.hpp>
#include <crea/engine/portfoliovarengine.hpp>
#include <crea/engine/weightcalculator.hpp>

#include <cred/marketdata/pricejoiner.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <set>

using namespace cre::data;
using namespace QuantLib;
using std::vector;

namespace cre {
namespace analytics {

PortfolioVarEngine::PortfolioVarEngine(const QuantLib::ext::shared_ptr<PriceHistory>& prices, VarMethod method,
                                       Real confidence, Size lookbackDays, Size horizonDays)
    : prices_(prices), method_(method), confidence_(confidence), lookbackDays_(lookbackDays),
      horizonDays_(horizonDays) {
    QL_REQUIRE(prices_, "PortfolioVarEngine: no price history given");
    QL_REQUIRE(confidence_ > 0.0 && confidence_ < 1.0,
               "PortfolioVarEngine: confidence level " << confidence_ << " must be in (0, 1)");
    QL_REQUIRE(horizonDays_ > 0, "PortfolioVarEngine: horizon must be at least one day");
}

QuantLib::ext::shared_ptr<PriceHistory> PortfolioVarEngine::restrictedPrices(const vector<Position>& positions) const {
    vector<InstrumentKey> keys = instrumentKeys(positions);
    return QuantLib::ext::make_shared<PriceHistory>(prices_->restrictTo(std::set<InstrumentKey>(keys.begin(), keys.end())));
}

Result<Real> PortfolioVarEngine::var(const vector<Position>& positions) const {
    if (method_ == VarMethod::Parametric)
        return parametricVar(positions);

    Result<vector<Real>> p = pnls(positions);
    if (!p.ok())
        return p.error();
    Real v = HistoricalSimulationVarCalculator(p.value()).var(confidence_);
    DLOG("PortfolioVarEngine: historical VaR " << v << " from " << p.value().size() << " P&Ls");
    return v;
}

Result<Real> PortfolioVarEngine::expectedShortfall(const vector<Position>& positions) const {
    QL_REQUIRE(method_ == VarMethod::Historical,
               "PortfolioVarEngine: expected shortfall is only available for the historical method");
    Result<vector<Real>> p = pnls(positions);
    if (!p.ok())
        return p.error();
    return HistoricalSimulationVarCalculator(p.value()).expectedShortfall(confidence_);
}

Result<Real> PortfolioVarEngine::parametricVar(const vector<Position>& positions) const {
    auto prices = restrictedPrices(positions);

    WeightCalculator weightCalculator(PriceJoiner(prices).joinLatest(positions));
    Result<WeightVector> weights = weightCalculator.weights();
    if (!weights.ok())
        return weights.error();

    Result<CovarianceMatrix> covariance = CovarianceEstimator(lookbackDays_).estimate(*prices);
    if (!covariance.ok())
        return covariance.error();

    ParametricVarCalculator calculator(weights.value(), covariance.value(), weightCalculator.grossExposure());
    Real oneDay = calculator.var(confidence_);
    DLOG("PortfolioVarEngine: gross exposure " << weightCalculator.grossExposure() << ", volatility "
                                                << calculator.portfolioVolatility() << ", one day VaR " << oneDay);
    return scaleToHorizon(oneDay, horizonDays_);
}

Result<vector<Real>> PortfolioVarEngine::pnls(const vector<Position>& positions) const {
    auto prices = restrictedPrices(positions);

    // an instrument without any quote empties the all-or-nothing series, report the cause instead
    vector<InstrumentKey> missing;
    for (const auto& k : instrumentKeys(positions)) {
        if (!prices->has(k))
            missing.push_back(k);
    }
    if (!missing.empty())
        return RiskError(RiskError::Kind::MissingMarketData,
                         "PortfolioVarEngine: no quotes for " + to_string(missing) + ", no historical value series");

    return dailyPnls(PortfolioValueReconstructor(prices, lookbackDays_).build(positions));
}

} // namespace analytics
} // namespace cre
