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

#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/covariance.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/variates/covariate.hpp>

#include <algorithm>
#include <set>

using namespace boost::accumulators;
using namespace cre::data;
using namespace QuantLib;
using std::set;
using std::vector;

namespace cre {
namespace analytics {

CovarianceMatrix::CovarianceMatrix(const vector<InstrumentKey>& keys, const Matrix& matrix, Size observations)
    : keys_(keys), matrix_(matrix), observations_(observations) {
    QL_REQUIRE(matrix_.rows() == keys_.size() && matrix_.columns() == keys_.size(),
               "CovarianceMatrix: matrix is " << matrix_.rows() << "x" << matrix_.columns() << " but there are "
                                              << keys_.size() << " keys");
    QL_REQUIRE(std::is_sorted(keys_.begin(), keys_.end()), "CovarianceMatrix: keys must be sorted");
}

bool CovarianceMatrix::has(const InstrumentKey& key) const {
    return std::binary_search(keys_.begin(), keys_.end(), key);
}

Size CovarianceMatrix::index(const InstrumentKey& key) const {
    auto it = std::lower_bound(keys_.begin(), keys_.end(), key);
    QL_REQUIRE(it != keys_.end() && *it == key, "CovarianceMatrix: instrument " << key << " not found");
    return std::distance(keys_.begin(), it);
}

Real CovarianceMatrix::operator()(const InstrumentKey& k1, const InstrumentKey& k2) const {
    return matrix_[index(k1)][index(k2)];
}

CovarianceEstimator::CovarianceEstimator(Size lookbackDays) : lookbackDays_(lookbackDays) {}

Result<CovarianceMatrix> CovarianceEstimator::estimate(const PriceHistory& prices) const {

    if (prices.empty())
        return RiskError(RiskError::Kind::InsufficientHistory, "CovarianceEstimator: no prices given");

    // 1 lookback window
    PriceHistory window = prices.lookback(lookbackDays_);
    set<Date> dateSet = window.dates();
    vector<Date> dates(dateSet.begin(), dateSet.end());
    DLOG("CovarianceEstimator: " << lookbackDays_ << " day window up to " << to_string(prices.latestDate()) << " has "
                                 << dates.size() << " dates and " << window.data().size() << " instruments");

    // 2, 3 pivot and forward fill, every instrument in the window has at least one quote
    vector<InstrumentKey> keys;
    vector<vector<Real>> columns;
    for (const auto& kv : window.data()) {
        vector<Real> column(dates.size(), Null<Real>());
        auto q = kv.second.begin();
        Real last = Null<Real>();
        for (Size i = 0; i < dates.size(); ++i) {
            if (q != kv.second.end() && q->first == dates[i]) {
                last = q->second.massQuote;
                ++q;
            }
            column[i] = last;
        }
        keys.push_back(kv.first);
        columns.push_back(column);
    }
    for (const auto& k : prices.keys()) {
        if (!window.has(k)) {
            DLOG("CovarianceEstimator: no quotes for " << k << " in window, excluded");
        }
    }

    if (keys.empty())
        return RiskError(RiskError::Kind::InsufficientHistory,
                         "CovarianceEstimator: no instrument has quotes in the lookback window");

    // drop dates with a missing value, this can only be leading dates after the forward fill
    vector<Size> rows;
    for (Size i = 0; i < dates.size(); ++i) {
        bool complete = true;
        for (const auto& c : columns)
            complete = complete && c[i] != Null<Real>();
        if (complete)
            rows.push_back(i);
    }

    // 4 simple returns
    Size nReturns = rows.size() > 1 ? rows.size() - 1 : 0;
    if (nReturns < 2)
        return RiskError(RiskError::Kind::InsufficientHistory,
                         "CovarianceEstimator: " + std::to_string(nReturns) + " return observations for " +
                             std::to_string(keys.size()) + " instruments, at least 2 required");

    Size n = keys.size();
    Matrix returns(nReturns, n);
    for (Size j = 0; j < n; ++j) {
        for (Size r = 0; r < nReturns; ++r) {
            Real previous = columns[j][rows[r]];
            if (previous == 0.0)
                return RiskError(RiskError::Kind::MissingMarketData,
                                 "CovarianceEstimator: zero price for " + to_string(keys[j]) + " on " +
                                     to_string(dates[rows[r]]) + ", return undefined");
            returns[r][j] = columns[j][rows[r + 1]] / previous - 1.0;
        }
    }

    // 5 sample covariance, the boost accumulator is normalised by n so rescale by n / (n - 1)
    typedef accumulator_set<Real, stats<tag::covariance<Real, tag::covariate1>>> accumulator;
    Real bessel = static_cast<Real>(nReturns) / static_cast<Real>(nReturns - 1);
    Matrix covariance(n, n, 0.0);
    for (Size i = 0; i < n; ++i) {
        for (Size j = 0; j <= i; ++j) {
            accumulator acc;
            for (Size r = 0; r < nReturns; ++r)
                acc(returns[r][i], covariate1 = returns[r][j]);
            covariance[i][j] = covariance[j][i] = boost::accumulators::covariance(acc) * bessel;
        }
        // round off must not produce a negative variance
        covariance[i][i] = std::max(covariance[i][i], 0.0);
    }

    LOG("CovarianceEstimator: estimated " << n << "x" << n << " covariance from " << nReturns << " returns");
    return CovarianceMatrix(keys, covariance, nReturns);
}

} // namespace analytics
} // namespace cre
