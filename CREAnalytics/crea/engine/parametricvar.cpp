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

#include <crea/engine/parametricvar.hpp>

#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/math/distributions/normaldistribution.hpp>

#include <cmath>

using namespace cre::data;
using namespace QuantLib;

namespace cre {
namespace analytics {

ParametricVarCalculator::ParametricVarCalculator(const WeightVector& weights, const CovarianceMatrix& covariance,
                                                 Real portfolioValue)
    : covariance_(covariance), portfolioValue_(portfolioValue), w_(covariance.size(), 0.0) {
    QL_REQUIRE(portfolioValue_ >= 0.0, "ParametricVarCalculator: portfolio value must not be negative, got "
                                           << portfolioValue_);
    for (const auto& kv : weights) {
        if (covariance_.has(kv.first)) {
            w_[covariance_.index(kv.first)] = kv.second;
        } else {
            DLOG("ParametricVarCalculator: " << kv.first << " not in covariance matrix, weight " << kv.second
                                             << " set to zero");
        }
    }
}

Real ParametricVarCalculator::portfolioVolatility() const {
    if (w_.empty())
        return 0.0;
    Real variance = DotProduct(w_, covariance_.matrix() * w_);
    // w' Sigma w is non-negative up to round off
    return std::sqrt(std::max(variance, 0.0));
}

Real ParametricVarCalculator::var(Real confidence) const {
    QL_REQUIRE(confidence > 0.0 && confidence < 1.0,
               "ParametricVarCalculator: confidence level " << confidence << " must be in (0, 1)");
    Real z = InverseCumulativeNormal()(confidence);
    // a confidence below 50% gives a negative quantile, the loss is floored at zero
    return std::max(portfolioValue_ * z * portfolioVolatility(), 0.0);
}

Real scaleToHorizon(Real oneDayVar, Size horizonDays) {
    QL_REQUIRE(horizonDays > 0, "scaleToHorizon: horizon must be at least one day");
    return oneDayVar * std::sqrt(static_cast<Real>(horizonDays));
}

} // namespace analytics
} // namespace cre
