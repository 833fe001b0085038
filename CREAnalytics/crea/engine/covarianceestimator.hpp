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

/*! \file crea/engine/covarianceestimator.hpp
    \brief Sample covariance of daily commodity price returns
    \ingroup engine
*/

#pragma once

#include <cred/marketdata/pricehistory.hpp>
#include <cred/utilities/result.hpp>

#include <ql/math/matrix.hpp>

#include <vector>

namespace cre {
namespace analytics {

//! Covariance matrix of instrument returns with the instrument ordering of its rows and columns
class CovarianceMatrix {
public:
    CovarianceMatrix() : observations_(0) {}
    CovarianceMatrix(const std::vector<cre::data::InstrumentKey>& keys, const QuantLib::Matrix& matrix,
                     QuantLib::Size observations);

    const std::vector<cre::data::InstrumentKey>& keys() const { return keys_; }
    const QuantLib::Matrix& matrix() const { return matrix_; }
    //! number of return observations the matrix was estimated from
    QuantLib::Size observations() const { return observations_; }
    QuantLib::Size size() const { return keys_.size(); }

    bool has(const cre::data::InstrumentKey& key) const;
    //! row / column of \p key, throws if the key is not part of the matrix
    QuantLib::Size index(const cre::data::InstrumentKey& key) const;
    QuantLib::Real operator()(const cre::data::InstrumentKey& k1, const cre::data::InstrumentKey& k2) const;

private:
    std::vector<cre::data::InstrumentKey> keys_;
    QuantLib::Matrix matrix_;
    QuantLib::Size observations_;
};

//! Estimates the covariance of simple daily returns over a lookback window
/*! The steps are
    - restrict the history to [latest date - lookback, latest date]
    - pivot into a date x instrument table of mass prices
    - forward fill each instrument along the dates, instruments without any quote in the window are dropped
    - drop dates on which an instrument is still missing, i.e. the leading dates before its first quote
    - simple returns p_t / p_{t-1} - 1
    - sample covariance with divisor n - 1

    Fewer than two return observations or no surviving instrument yield RiskError::Kind::InsufficientHistory. A zero
    price that starts a return yields RiskError::Kind::MissingMarketData.
    \ingroup engine
 */
class CovarianceEstimator {
public:
    explicit CovarianceEstimator(QuantLib::Size lookbackDays = 365);

    cre::data::Result<CovarianceMatrix> estimate(const cre::data::PriceHistory& prices) const;

    QuantLib::Size lookbackDays() const { return lookbackDays_; }

private:
    QuantLib::Size lookbackDays_;
};

} // namespace analytics
} // namespace cre
