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

#include <crea/engine/weightcalculator.hpp>

#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <cmath>

using namespace cre::data;
using namespace QuantLib;
using std::vector;

namespace cre {
namespace analytics {

WeightCalculator::WeightCalculator(const vector<PricedPosition>& positions)
    : grossExposure_(0.0), priced_(0), unpriced_(unpriced(positions)) {
    for (const auto& p : positions) {
        if (!p.hasPrice())
            continue;
        signedValues_[p.position.key] += p.signedValue();
        ++priced_;
    }
    // positions are netted per instrument before the gross exposure is taken
    for (const auto& kv : signedValues_)
        grossExposure_ += std::fabs(kv.second);
    if (!unpriced_.empty()) {
        WLOG("WeightCalculator: " << unpriced_.size() << " instruments without price excluded from the weights: "
                                  << to_string(unpriced_));
    }
}

Result<WeightVector> WeightCalculator::weights() const {
    if (priced_ == 0 && !unpriced_.empty())
        return RiskError(RiskError::Kind::MissingMarketData,
                         "WeightCalculator: no position has a price, missing " + to_string(unpriced_));

    if (grossExposure_ == 0.0)
        return RiskError(RiskError::Kind::ZeroExposure, "WeightCalculator: gross exposure is zero");

    WeightVector w;
    for (const auto& kv : signedValues_)
        w[kv.first] = kv.second / grossExposure_;
    return w;
}

} // namespace analytics
} // namespace cre
