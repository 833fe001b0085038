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

#include <cred/marketdata/outlierdetector.hpp>
#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include <cmath>
#include <map>

using namespace boost::accumulators;
using namespace QuantLib;
using std::map;
using std::vector;

namespace cre {
namespace data {

OutlierDetector::OutlierDetector(Real threshold) : threshold_(threshold) {
    QL_REQUIRE(threshold_ > 0.0, "OutlierDetector: threshold must be positive, got " << threshold_);
}

vector<OutlierRecord> OutlierDetector::outliers(const vector<PriceQuote>& quotes) const {

    map<InstrumentKey, vector<const PriceQuote*>> groups;
    for (const auto& q : quotes) {
        QL_REQUIRE(q.normalised(), "OutlierDetector: quote for " << q.key << " on " << q.date << " is not normalised");
        groups[q.key].push_back(&q);
    }

    vector<OutlierRecord> result;
    for (const auto& g : groups) {
        if (g.second.size() < 2) {
            TLOG("OutlierDetector: skipping " << g.first << ", single observation");
            continue;
        }

        // boost variance is the population variance, i.e. divisor n
        accumulator_set<Real, stats<tag::mean, tag::variance>> acc;
        for (auto q : g.second)
            acc(q->massQuote);
        Real m = mean(acc);
        Real sd = std::sqrt(std::max(variance(acc), 0.0));
        if (close_enough(sd, 0.0) || sd <= QL_EPSILON * std::fabs(m)) {
            TLOG("OutlierDetector: skipping " << g.first << ", no dispersion");
            continue;
        }

        for (auto q : g.second) {
            Real z = (q->massQuote - m) / sd;
            if (std::fabs(z) > threshold_) {
                DLOG("OutlierDetector: " << q->key << " on " << q->date << " value " << q->massQuote << " z-score "
                                         << z);
                result.push_back({q->key, q->date, q->massQuote, z});
            }
        }
    }

    if (!result.empty()) {
        WLOG("OutlierDetector: " << result.size() << " of " << quotes.size() << " quotes exceed z-score threshold "
                                 << threshold_);
    }
    return result;
}

} // namespace data
} // namespace cre
