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

#include <cred/marketdata/pricejoiner.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <set>

using namespace QuantLib;
using std::vector;

namespace cre {
namespace data {

Real PricedPosition::signedValue() const {
    QL_REQUIRE(hasPrice(), "PricedPosition: no price for " << position.key);
    QL_REQUIRE(position.normalised(), "PricedPosition: position in " << position.key << " is not normalised");
    return position.signedVolume * (*massPrice);
}

PriceJoiner::PriceJoiner(const QuantLib::ext::shared_ptr<PriceHistory>& prices) : prices_(prices) {
    QL_REQUIRE(prices_, "PriceJoiner: no price history given");
}

vector<PricedPosition> PriceJoiner::joinLatest(const vector<Position>& positions, const Date& horizon) const {
    vector<PricedPosition> result;
    result.reserve(positions.size());
    for (const auto& p : positions) {
        auto q = prices_->latest(p.key, horizon);
        if (q) {
            result.push_back(PricedPosition(p, q->massQuote, q->date));
        } else {
            WLOG("PriceJoiner: no quote for " << p.key << " on or before "
                                              << (horizon == Date::maxDate() ? "latest" : to_string(horizon)));
            result.push_back(PricedPosition(p, boost::none, Date()));
        }
    }
    return result;
}

vector<PricedPosition> PriceJoiner::joinOn(const vector<Position>& positions, const Date& date) const {
    vector<PricedPosition> result;
    result.reserve(positions.size());
    for (const auto& p : positions) {
        auto q = prices_->on(p.key, date);
        if (q) {
            result.push_back(PricedPosition(p, q->massQuote, q->date));
        } else {
            // gaps on individual days are normal for the exact date join, the caller decides how to report them
            DLOG("PriceJoiner: no quote for " << p.key << " on " << date);
            result.push_back(PricedPosition(p, boost::none, Date()));
        }
    }
    return result;
}

vector<InstrumentKey> unpriced(const vector<PricedPosition>& positions) {
    std::set<InstrumentKey> keys;
    for (const auto& p : positions) {
        if (!p.hasPrice())
            keys.insert(p.position.key);
    }
    return vector<InstrumentKey>(keys.begin(), keys.end());
}

} // namespace data
} // namespace cre
