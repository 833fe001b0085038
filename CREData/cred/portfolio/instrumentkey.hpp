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

/*! \file cred/portfolio/instrumentkey.hpp
    \brief Identity of a listed commodity contract
    \ingroup portfolio
*/

#pragma once

#include <ql/time/date.hpp>

#include <ostream>
#include <string>

namespace cre {
namespace data {

//! Instrument key (metal, maturity month, exchange)
/*! The key used to match positions to quotes and to index covariance matrices and weight vectors. The maturity is
    held as a month label of the form Mon-YYYY (e.g. Oct-2024) so that matching is an exact string comparison.
    \ingroup portfolio
 */
struct InstrumentKey {
    InstrumentKey() {}
    InstrumentKey(const std::string& metal, const std::string& maturity, const std::string& exchange)
        : metal(metal), maturity(maturity), exchange(exchange) {}

    std::string metal;
    std::string maturity;
    std::string exchange;

    //! Id of the form Metal_Maturity_Exchange, e.g. Copper_Oct-2024_LME
    std::string id() const;
};

bool operator<(const InstrumentKey& lhs, const InstrumentKey& rhs);
bool operator==(const InstrumentKey& lhs, const InstrumentKey& rhs);
bool operator!=(const InstrumentKey& lhs, const InstrumentKey& rhs);

std::ostream& operator<<(std::ostream& out, const InstrumentKey& key);

//! Maturity month label Mon-YYYY of a contract maturing on date \p d
std::string maturityMonthLabel(const QuantLib::Date& d);

} // namespace data
} // namespace cre
