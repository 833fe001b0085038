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

/*! \file cred/marketdata/pricequote.hpp
    \brief Historical market quote of a commodity contract
    \ingroup marketdata
*/

#pragma once

#include <cred/portfolio/instrumentkey.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <string>

namespace cre {
namespace data {

//! One row of the price history
/*! massQuote is the price per metric ton, set by the UnitNormalizer. The sign of a quote is never changed.
    \ingroup marketdata
 */
struct PriceQuote {
    PriceQuote() {}
    PriceQuote(const InstrumentKey& key, const QuantLib::Date& date, QuantLib::Real value, const std::string& unit)
        : key(key), date(date), value(value), unit(unit) {}

    InstrumentKey key;
    QuantLib::Date date;
    QuantLib::Real value = 0.0;
    std::string unit;

    QuantLib::Real massQuote = QuantLib::Null<QuantLib::Real>();

    bool normalised() const { return massQuote != QuantLib::Null<QuantLib::Real>(); }
};

} // namespace data
} // namespace cre
