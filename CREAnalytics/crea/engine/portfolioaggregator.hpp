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

/*! \file crea/engine/portfolioaggregator.hpp
    \brief VaR of a book and of its partitions by position attribute
    \ingroup engine
*/

#pragma once

#include <crea/engine/portfoliovarengine.hpp>

#include <map>
#include <string>
#include <vector>

namespace cre {
namespace analytics {

//! VaR per distinct value of one breakdown dimension
typedef std::map<std::string, cre::data::Result<QuantLib::Real>> VarByValue;

//! VaR per breakdown dimension, an unknown dimension maps to an UnknownBreakdownColumn error
typedef std::map<std::string, cre::data::Result<VarByValue>> VarByLevel;

//! Breaks the VaR of a book down by position attributes
/*! Total runs the VaR pipeline over the whole book. Any other dimension partitions the positions by the distinct
    values of that attribute and reruns the full pipeline per partition against the prices of the partition's
    instruments. A failure in one partition is recorded in its Result and does not affect the others.

    The partitions can be evaluated on several worker threads, the results do not depend on the number of threads.
    \ingroup engine
 */
class PortfolioAggregator {
public:
    PortfolioAggregator(const QuantLib::ext::shared_ptr<cre::data::PriceHistory>& prices, VarMethod method,
                        QuantLib::Real confidence = 0.99, QuantLib::Size lookbackDays = 365,
                        QuantLib::Size horizonDays = 1, QuantLib::Size nThreads = 1);

    //! VaR of the whole book
    cre::data::Result<QuantLib::Real> total(const std::vector<cre::data::Position>& positions) const;

    //! VaR per value of each of the given dimensions, the dimension names are parsed with parseBreakdownDimension
    VarByLevel breakdown(const std::vector<cre::data::Position>& positions,
                         const std::vector<std::string>& dimensions) const;

    //! the positions grouped by the value of dimension \p d
    static std::map<std::string, std::vector<cre::data::Position>>
    partition(const std::vector<cre::data::Position>& positions, cre::data::BreakdownDimension d);

private:
    PortfolioVarEngine engine_;
    QuantLib::Size nThreads_;
};

} // namespace analytics
} // namespace cre
