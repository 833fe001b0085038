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

#include <cred/portfolio/instrumentkey.hpp>

#include <ql/errors.hpp>

#include <tuple>

using QuantLib::Date;
using std::string;

namespace cre {
namespace data {

string InstrumentKey::id() const { return metal + "_" + maturity + "_" + exchange; }

bool operator<(const InstrumentKey& lhs, const InstrumentKey& rhs) {
    return std::tie(lhs.metal, lhs.maturity, lhs.exchange) < std::tie(rhs.metal, rhs.maturity, rhs.exchange);
}

bool operator==(const InstrumentKey& lhs, const InstrumentKey& rhs) {
    return lhs.metal == rhs.metal && lhs.maturity == rhs.maturity && lhs.exchange == rhs.exchange;
}

bool operator!=(const InstrumentKey& lhs, const InstrumentKey& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& out, const InstrumentKey& key) { return out << key.id(); }

string maturityMonthLabel(const Date& d) {
    static const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    QL_REQUIRE(d != Date(), "maturityMonthLabel: empty date");
    return string(months[static_cast<int>(d.month()) - 1]) + "-" + std::to_string(d.year());
}

} // namespace data
} // namespace cre
