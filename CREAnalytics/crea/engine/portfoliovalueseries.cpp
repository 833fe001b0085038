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

#include <crea/engine/portfoliovalueseries.hpp>

#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

using namespace cre::data;
using namespace QuantLib;
using std::vector;

namespace cre {
namespace analytics {

PortfolioValueReconstructor::PortfolioValueReconstructor(const QuantLib::ext::shared_ptr<PriceHistory>& prices,
                                                         Size lookbackDays)
    : prices_(prices), lookbackDays_(lookbackDays) {
    QL_REQUIRE(prices_, "PortfolioValueReconstructor: no price history given");
}

PortfolioValueSeries PortfolioValueReconstructor::build(const vector<Position>& positions) const {
    PortfolioValueSeries series;
    if (positions.empty() || prices_->empty())
        return series;

    PriceJoiner joiner(prices_);
    Size dropped = 0;
    for (const auto& d : prices_->lookback(lookbackDays_).dates()) {
        auto priced = joiner.joinOn(positions, d);
        bool complete = true;
        Real value = 0.0;
        for (const auto& p : priced) {
            if (!p.hasPrice()) {
                complete = false;
                break;
            }
            value += p.signedValue();
        }
        if (complete) {
            series.push_back({d, value});
        } else {
            TLOG("PortfolioValueReconstructor: " << d << " dropped, not every position has a quote");
            ++dropped;
        }
    }

    DLOG("PortfolioValueReconstructor: " << series.size() << " dates valued, " << dropped << " dropped");
    return series;
}

} // namespace analytics
} // namespace cre
