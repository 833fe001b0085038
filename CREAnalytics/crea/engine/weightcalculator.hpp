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

/*! \file crea/engine/weightcalculator.hpp
    \brief Signed exposure weights of a priced book
    \ingroup engine
*/

#pragma once

#include <cred/marketdata/pricejoiner.hpp>
#include <cred/utilities/result.hpp>

#include <map>
#include <vector>

namespace cre {
namespace analytics {

//! Signed weight per instrument, the absolute weights sum to one
typedef std::map<cre::data::InstrumentKey, QuantLib::Real> WeightVector;

//! Computes exposure weights and the gross exposure of a priced book
/*! The signed value signedVolume * massPrice of each position is summed by instrument and divided by the gross
    exposure, the sum over instruments of the absolute net signed values. A long and an exactly offsetting short in
    the same instrument therefore have zero gross exposure. The gross exposure is also the portfolio value scaling the
    parametric VaR, so that value times weight gives back the net signed value of each instrument. Positions without a price are not valued, they are
    reported and left out.
    \ingroup engine
 */
class WeightCalculator {
public:
    explicit WeightCalculator(const std::vector<cre::data::PricedPosition>& positions);

    /*! MissingMarketData if none of the positions has a price, ZeroExposure if the gross exposure is zero, which
        includes the empty book */
    cre::data::Result<WeightVector> weights() const;

    //! sum over instruments of the absolute net signed value
    QuantLib::Real grossExposure() const { return grossExposure_; }

    QuantLib::Size pricedPositions() const { return priced_; }
    const std::vector<cre::data::InstrumentKey>& unpricedKeys() const { return unpriced_; }

private:
    std::map<cre::data::InstrumentKey, QuantLib::Real> signedValues_;
    QuantLib::Real grossExposure_;
    QuantLib::Size priced_;
    std::vector<cre::data::InstrumentKey> unpriced_;
};

} // namespace analytics
} // namespace cre
