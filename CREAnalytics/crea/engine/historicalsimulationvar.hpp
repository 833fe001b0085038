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

/*! \file crea/engine/historicalsimulationvar.hpp
    \brief Historical simulation var from a portfolio value series
    \ingroup engine
*/

#pragma once

#include <crea/engine/portfoliovalueseries.hpp>
#include <crea/engine/varcalculator.hpp>

#include <cred/utilities/result.hpp>

#include <vector>

namespace cre {
namespace analytics {

//! HistoricalSimulation VaR Calculator
/*! The VaR is the negative of the empirical (1 - confidence) quantile of the P&L sample, i.e. a loss is reported as
    a positive number. It is not floored, a sample without losses in its tail yields a negative VaR.
    \ingroup engine
 */
class HistoricalSimulationVarCalculator : public VarCalculator {
public:
    explicit HistoricalSimulationVarCalculator(const std::vector<QuantLib::Real>& pnls);

    QuantLib::Real var(QuantLib::Real confidence) const override;

    //! mean loss of the P&Ls at or below the (1 - confidence) quantile, reported as a positive number
    QuantLib::Real expectedShortfall(QuantLib::Real confidence) const;

    const std::vector<QuantLib::Real>& pnls() const { return pnls_; }

private:
    QuantLib::Real quantile(QuantLib::Real confidence) const;
    std::vector<QuantLib::Real> pnls_;
};

//! Day over day changes value_t - value_{t-1}, InsufficientHistory if the series has fewer than two dates
cre::data::Result<std::vector<QuantLib::Real>> dailyPnls(const PortfolioValueSeries& series);

} // namespace analytics
} // namespace cre
