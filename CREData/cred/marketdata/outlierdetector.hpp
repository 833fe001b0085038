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

/*! \file cred/marketdata/outlierdetector.hpp
    \brief Z-score based data quality check on price histories
    \ingroup marketdata
*/

#pragma once

#include <cred/marketdata/pricequote.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <vector>

namespace cre {
namespace data {

//! A quote flagged by the OutlierDetector
struct OutlierRecord {
    InstrumentKey key;
    QuantLib::Date date;
    QuantLib::Real value;
    QuantLib::Real zScore;
};

//! Flags quotes whose mass price is far away from the mean of their instrument
/*! The quotes are grouped by instrument key. Within a group the population z-score (divisor n) of each mass price is
    computed and quotes with |z| > threshold are flagged. Groups with fewer than two quotes or without any dispersion
    flag nothing.

    Every input row counts, duplicates for the same instrument and date included.
    \ingroup marketdata
 */
class OutlierDetector {
public:
    explicit OutlierDetector(QuantLib::Real threshold = 4.0);

    //! flagged quotes ordered by instrument key and input order, the quotes must be normalised
    std::vector<OutlierRecord> outliers(const std::vector<PriceQuote>& quotes) const;
    //! number of flagged quotes
    QuantLib::Size count(const std::vector<PriceQuote>& quotes) const { return outliers(quotes).size(); }

    QuantLib::Real threshold() const { return threshold_; }

private:
    QuantLib::Real threshold_;
};

} // namespace data
} // namespace cre
