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

/*! \file crea/engine/portfoliovarengine.hpp
    \brief Full VaR pipeline for one set of positions
    \ingroup engine
*/

#pragma once

#include <crea/engine/varcalculator.hpp>

#include <cred/marketdata/pricehistory.hpp>
#include <cred/portfolio/position.hpp>
#include <cred/utilities/result.hpp>

#include <ql/shared_ptr.hpp>

#include <vector>

namespace cre {
namespace analytics {

//! Runs the VaR pipeline of the chosen method over a set of normalised positions
/*! The price history is first restricted to the instruments of the positions.

    Parametric: join latest prices, weights, covariance of the returns in the lookback window, one day VaR scaled by
    sqrt(horizonDays).

    Historical: portfolio value on each date of the lookback window on which every position has a quote, day over
    day P&L, negative (1 - confidence) quantile. No horizon scaling is applied, the P&L are one day changes.
    \ingroup engine
 */
class PortfolioVarEngine {
public:
    PortfolioVarEngine(const QuantLib::ext::shared_ptr<cre::data::PriceHistory>& prices, VarMethod method,
                       QuantLib::Real confidence = 0.99, QuantLib::Size lookbackDays = 365,
                       QuantLib::Size horizonDays = 1);

    cre::data::Result<QuantLib::Real> var(const std::vector<cre::data::Position>& positions) const;

    //! historical expected shortfall at the engine's confidence, throws for the parametric method
    cre::data::Result<QuantLib::Real> expectedShortfall(const std::vector<cre::data::Position>& positions) const;

    VarMethod method() const { return method_; }
    QuantLib::Real confidence() const { return confidence_; }

private:
    QuantLib::ext::shared_ptr<cre::data::PriceHistory>
    restrictedPrices(const std::vector<cre::data::Position>& positions) const;
    cre::data::Result<QuantLib::Real> parametricVar(const std::vector<cre::data::Position>& positions) const;
    cre::data::Result<std::vector<QuantLib::Real>> pnls(const std::vector<cre::data::Position>& positions) const;

    QuantLib::ext::shared_ptr<cre::data::PriceHistory> prices_;
    VarMethod method_;
    QuantLib::Real confidence_;
    QuantLib::Size lookbackDays_;
    QuantLib::Size horizonDays_;
};

} // namespace analytics
} // namespace cre
