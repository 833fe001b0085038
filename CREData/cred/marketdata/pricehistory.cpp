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

#include <cred/marketdata/pricehistory.hpp>
#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;
using std::set;
using std::vector;

namespace cre {
namespace data {

PriceHistory::PriceHistory(const vector<PriceQuote>& quotes) {
    Size skipped = 0;
    for (const auto& q : quotes) {
        if (q.date == Date()) {
            TLOG("PriceHistory: skipping quote for " << q.key << " without a date");
            ++skipped;
            continue;
        }
        add(q);
    }
    if (skipped > 0) {
        WLOG("PriceHistory: skipped " << skipped << " quotes without a date");
    }
    DLOG("PriceHistory: loaded " << size() << " quotes for " << data_.size() << " instruments");
}

void PriceHistory::add(const PriceQuote& quote) {
    QL_REQUIRE(quote.normalised(), "PriceHistory: quote for " << quote.key << " on " << quote.date
                                                              << " is not normalised");
    QL_REQUIRE(quote.date != Date(), "PriceHistory: quote for " << quote.key << " has no date");
    auto res = data_[quote.key].insert(std::make_pair(quote.date, quote));
    if (!res.second) {
        TLOG("PriceHistory: replacing quote for " << quote.key << " on " << quote.date << " ("
                                                  << res.first->second.massQuote << " -> " << quote.massQuote << ")");
        res.first->second = quote;
    }
}

Size PriceHistory::size() const {
    Size n = 0;
    for (const auto& kv : data_)
        n += kv.second.size();
    return n;
}

const PriceHistory::Series& PriceHistory::series(const InstrumentKey& key) const {
    auto it = data_.find(key);
    QL_REQUIRE(it != data_.end(), "PriceHistory: no quotes for " << key);
    return it->second;
}

set<InstrumentKey> PriceHistory::keys() const {
    set<InstrumentKey> result;
    for (const auto& kv : data_)
        result.insert(kv.first);
    return result;
}

set<Date> PriceHistory::dates() const {
    set<Date> result;
    for (const auto& kv : data_) {
        for (const auto& q : kv.second)
            result.insert(q.first);
    }
    return result;
}

Date PriceHistory::latestDate() const {
    QL_REQUIRE(!data_.empty(), "PriceHistory: no quotes, latest date undefined");
    Date d = Date::minDate();
    for (const auto& kv : data_) {
        if (!kv.second.empty())
            d = std::max(d, kv.second.rbegin()->first);
    }
    return d;
}

boost::optional<PriceQuote> PriceHistory::latest(const InstrumentKey& key, const Date& horizon) const {
    auto it = data_.find(key);
    if (it == data_.end())
        return boost::none;
    // first quote strictly after the horizon, the one before it is the latest on or before the horizon
    auto q = it->second.upper_bound(horizon);
    if (q == it->second.begin())
        return boost::none;
    return std::prev(q)->second;
}

boost::optional<PriceQuote> PriceHistory::on(const InstrumentKey& key, const Date& date) const {
    auto it = data_.find(key);
    if (it == data_.end())
        return boost::none;
    auto q = it->second.find(date);
    if (q == it->second.end())
        return boost::none;
    return q->second;
}

PriceHistory PriceHistory::restrictTo(const set<InstrumentKey>& keys) const {
    PriceHistory result;
    for (const auto& k : keys) {
        auto it = data_.find(k);
        if (it != data_.end())
            result.data_.insert(*it);
    }
    return result;
}

PriceHistory PriceHistory::window(const Date& start, const Date& end) const {
    PriceHistory result;
    for (const auto& kv : data_) {
        auto first = kv.second.lower_bound(start);
        auto last = kv.second.upper_bound(end);
        if (first != last)
            result.data_[kv.first].insert(first, last);
    }
    return result;
}

PriceHistory PriceHistory::lookback(Size lookbackDays) const {
    if (data_.empty())
        return PriceHistory();
    Date end = latestDate();
    // floor the start at the earliest representable date
    Date start = end.serialNumber() - Date::minDate().serialNumber() > static_cast<Date::serial_type>(lookbackDays)
                     ? end - static_cast<Date::serial_type>(lookbackDays)
                     : Date::minDate();
    return window(start, end);
}

} // namespace data
} // namespace cre
