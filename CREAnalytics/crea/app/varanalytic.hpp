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

/*! \file crea/app/varanalytic.hpp
    \brief VaR run over a position snapshot and a price history
    \ingroup app
*/

#pragma once

#include <crea/app/varparameters.hpp>
#include <crea/engine/portfolioaggregator.hpp>

#include <cred/marketdata/outlierdetector.hpp>
#include <cred/marketdata/pricequote.hpp>
#include <cred/portfolio/position.hpp>

#include <boost/optional.hpp>

#include <map>
#include <string>
#include <vector>

namespace cre {
namespace analytics {

//! Outcome of a VaRAnalytic run
struct VarAnalyticResults {
    VarAnalyticResults() : totalVar(cre::data::RiskError(cre::data::RiskError::Kind::InsufficientHistory, "not run")) {}

    //! VaR of the whole book
    cre::data::Result<QuantLib::Real> totalVar;
    //! expected shortfall of the whole book, historical method only
    boost::optional<cre::data::Result<QuantLib::Real>> totalExpectedShortfall;
    //! VaR per breakdown dimension and dimension value
    VarByLevel varByLevel;
    //! number of quotes flagged by the data quality check
    QuantLib::Size outlierCount = 0;
    std::vector<cre::data::OutlierRecord> outliers;
    //! unit tags passed through with factor 1 and their number of occurrences
    std::map<std::string, QuantLib::Size> unrecognisedUnits;
    //! long/short tags other than L or S, treated as short
    QuantLib::Size ambiguousSides = 0;
};

//! Runs the VaR analytic
/*! Normalises the positions and quotes, runs the outlier check on the quotes, builds the price history and computes
    the total VaR and the breakdown configured in the parameters.
    \ingroup app
 */
class VarAnalytic {
public:
    explicit VarAnalytic(const VarParameters& parameters) : parameters_(parameters) {}

    VarAnalyticResults run(const std::vector<cre::data::Position>& positions,
                           const std::vector<cre::data::PriceQuote>& quotes) const;

    const VarParameters& parameters() const { return parameters_; }

private:
    VarParameters parameters_;
};

} // namespace analytics
} // namespace cre
