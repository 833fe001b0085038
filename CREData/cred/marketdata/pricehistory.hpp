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

/*! \file cred/marketdata/pricehistory.hpp
    \brief In memory price panel keyed by instrument and date
    \ingroup marketdata
*/

#pragma once

#include <cred/marketdata/pricequote.hpp>

#include <ql/time/date.hpp>

#include <boost/optional.hpp>

#include <map>
#include <set>
#include <vector>

namespace cre {
namespace data {

//! Historical mass normalised quotes, one per instrument and date
/*! Quotes are added in input order. If a quote for an instrument and date is already present it is replaced by the
    later one, i.e. the last row in input order wins. This is the tie break for duplicate dates.
    \ingroup marketdata
 */
class PriceHistory {
public:
    typedef std::map<QuantLib::Date, PriceQuote> Series;

    PriceHistory() {}
    //! Build from normalised quotes, quotes without a date are skipped with a warning
    explicit PriceHistory(const std::vector<PriceQuote>& quotes);

    //! add a normalised quote, throws if the quote is not normalised
    void add(const PriceQuote& quote);

    bool empty() const { return data_.empty(); }
    //! number of (instrument, date) points
    QuantLib::Size size() const;

    bool has(const InstrumentKey& key) const { return data_.find(key) != data_.end(); }
    //! quotes of one instrument ordered by date, throws if the instrument has no quotes
    const Series& series(const InstrumentKey& key) const;

    std::set<InstrumentKey> keys() const;
    //! union of the quote dates across instruments
    std::set<QuantLib::Date> dates() const;
    //! most recent quote date across instruments, throws if empty
    QuantLib::Date latestDate() const;

    //! latest quote on or before \p horizon, none if there is no such quote
    boost::optional<PriceQuote> latest(const InstrumentKey& key,
                                       const QuantLib::Date& horizon = QuantLib::Date::maxDate()) const;
    //! quote on exactly \p date, none if there is no such quote
    boost::optional<PriceQuote> on(const InstrumentKey& key, const QuantLib::Date& date) const;

    //! sub panel with the given instruments only
    PriceHistory restrictTo(const std::set<InstrumentKey>& keys) const;
    //! sub panel with quotes dated in [start, end]
    PriceHistory window(const QuantLib::Date& start, const QuantLib::Date& end) const;
    //! sub panel with quotes dated in [latestDate() - lookbackDays, latestDate()], calendar days
    PriceHistory lookback(QuantLib::Size lookbackDays) const;

    const std::map<InstrumentKey, Series>& data() const { return data_; }

private:
    std::map<InstrumentKey, Series> data_;
};

} // namespace data
} // namespace cre
