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

#pragma once

#include <cred/marketdata/pricehistory.hpp>
#include <cred/marketdata/pricequote.hpp>
#include <cred/portfolio/position.hpp>

#include <ql/shared_ptr.hpp>
#include <ql/time/date.hpp>

#include <string>
#include <vector>

namespace testsuite {

//! Utilities to set up simple test books and price histories
/*!
  \ingroup tests
*/

//! A position with the given attributes, not normalised
cre::data::Position buildPosition(const cre::data::InstrumentKey& key, QuantLib::Real volume,
                                  const std::string& longShort, const std::string& unit = "MT",
                                  const std::string& businessLine = "Trading", const std::string& strategy = "Outright",
                                  const std::string& contractType = "Future", const std::string& currency = "USD");

//! Positions normalised with the default unit tables
std::vector<cre::data::Position> normalised(const std::vector<cre::data::Position>& positions);

/*! One quote per calendar day starting at \p start, moving linearly from \p from to \p to. A non zero \p noise is
    added on even and subtracted on odd days, so that the series has down days even if it trends up.
*/
std::vector<cre::data::PriceQuote> buildQuotes(const cre::data::InstrumentKey& key, const QuantLib::Date& start,
                                               QuantLib::Size days, QuantLib::Real from, QuantLib::Real to,
                                               QuantLib::Real noise = 0.0, const std::string& unit = "USD/MT");

//! Price history of the quotes normalised with the default unit tables
QuantLib::ext::shared_ptr<cre::data::PriceHistory> buildPriceHistory(const std::vector<cre::data::PriceQuote>& quotes);

} // namespace testsuite
