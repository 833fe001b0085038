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

/*! \file cred/marketdata/pricejoiner.hpp
    \brief Attach market prices to positions
    \ingroup marketdata
*/

#pragma once

#include <cred/marketdata/pricehistory.hpp>
#include <cred/portfolio/position.hpp>

#include <ql/shared_ptr.hpp>

#include <boost/optional.hpp>

#include <vector>

namespace cre {
namespace data {

//! A position together with the mass price selected for it
/*! The price is none if no quote matched, it is never set to zero in that case. */
struct PricedPosition {
    PricedPosition() {}
    PricedPosition(const Position& position, const boost::optional<QuantLib::Real>& massPrice,
                   const QuantLib::Date& priceDate)
        : position(position), massPrice(massPrice), priceDate(priceDate) {}

    Position position;
    boost::optional<QuantLib::Real> massPrice;
    //! date of the selected quote, null date if there is none
    QuantLib::Date priceDate;

    bool hasPrice() const { return massPrice != boost::none; }
    //! signedVolume * massPrice, throws if there is no price
    QuantLib::Real signedValue() const;
};

//! Joins positions with quotes from a price history
/*! Two join modes are supported:
    - latest as of a horizon, i.e. the quote with the maximum date on or before the horizon
    - exact date, i.e. the quote dated on the requested date

    The positions are expected to be normalised. Unmatched positions are logged and returned without a price.
    \ingroup marketdata
 */
class PriceJoiner {
public:
    explicit PriceJoiner(const QuantLib::ext::shared_ptr<PriceHistory>& prices);

    std::vector<PricedPosition> joinLatest(const std::vector<Position>& positions,
                                           const QuantLib::Date& horizon = QuantLib::Date::maxDate()) const;

    std::vector<PricedPosition> joinOn(const std::vector<Position>& positions, const QuantLib::Date& date) const;

    const QuantLib::ext::shared_ptr<PriceHistory>& prices() const { return prices_; }

private:
    QuantLib::ext::shared_ptr<PriceHistory> prices_;
};

//! Distinct instrument keys of the positions that did not receive a price
std::vector<InstrumentKey> unpriced(const std::vector<PricedPosition>& positions);

} // namespace data
} // namespace cre
