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

/*! \file crea/engine/portfoliovalueseries.hpp
    \brief Historical value of a fixed book
    \ingroup engine
*/

#pragma once

#include <cred/marketdata/pricejoiner.hpp>

#include <ql/shared_ptr.hpp>

#include <vector>

namespace cre {
namespace analytics {

//! Value of the book on one historical date
struct PortfolioValue {
    QuantLib::Date date;
    QuantLib::Real value;
};

//! Portfolio values in ascending date order
typedef std::vector<PortfolioValue> PortfolioValueSeries;

//! Revalues a fixed set of positions on each historical date
/*! For each date of the price history in [latest date - lookback, latest date] the positions are joined with the
    quotes of exactly that date and sum(signedVolume * massPrice) is recorded. A date is kept only if every position
    has a quote on it.
    \ingroup engine
 */
class PortfolioValueReconstructor {
public:
    PortfolioValueReconstructor(const QuantLib::ext::shared_ptr<cre::data::PriceHistory>& prices,
                                QuantLib::Size lookbackDays = 365);

    //! the positions must be normalised, an empty book yields an empty series
    PortfolioValueSeries build(const std::vector<cre::data::Position>& positions) const;

private:
    QuantLib::ext::shared_ptr<cre::data::PriceHistory> prices_;
    QuantLib::Size lookbackDays_;
};

} // namespace analytics
} // namespace cre
