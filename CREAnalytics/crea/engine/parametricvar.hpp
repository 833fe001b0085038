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

/*! \file crea/engine/parametricvar.hpp
    \brief Variance-covariance var of a commodity book
    \ingroup engine
*/

#pragma once

#include <crea/engine/covarianceestimator.hpp>
#include <crea/engine/varcalculator.hpp>
#include <crea/engine/weightcalculator.hpp>

#include <ql/math/array.hpp>

namespace cre {
namespace analytics {

//! Parametric VaR Calculator
/*! VaR = portfolioValue * z * sqrt(w' Sigma w) with z the standard normal quantile of the confidence level. The
    weights are reindexed onto the instrument ordering of the covariance matrix, instruments without a covariance row
    get weight zero. The result is a one day VaR, use scaleToHorizon() for longer horizons.
    \ingroup engine
 */
class ParametricVarCalculator : public VarCalculator {
public:
    ParametricVarCalculator(const WeightVector& weights, const CovarianceMatrix& covariance,
                            QuantLib::Real portfolioValue);

    QuantLib::Real var(QuantLib::Real confidence) const override;

    //! sqrt(w' Sigma w), the volatility of the portfolio return
    QuantLib::Real portfolioVolatility() const;

    //! weights in covariance matrix order
    const QuantLib::Array& alignedWeights() const { return w_; }

private:
    CovarianceMatrix covariance_;
    QuantLib::Real portfolioValue_;
    QuantLib::Array w_;
};

//! Square root of time scaling of a one day VaR to \p horizonDays
QuantLib::Real scaleToHorizon(QuantLib::Real oneDayVar, QuantLib::Size horizonDays);

} // namespace analytics
} // namespace cre
