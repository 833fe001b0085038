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

#include <cred/portfolio/position.hpp>

#include <ql/errors.hpp>

#include <set>

using std::string;
using std::vector;

namespace cre {
namespace data {

std::ostream& operator<<(std::ostream& out, const BreakdownDimension& d) {
    switch (d) {
    case BreakdownDimension::Total:
        return out << "Total";
    case BreakdownDimension::BusinessLine:
        return out << "BUSINESS LINE";
    case BreakdownDimension::Strategy:
        return out << "STRATEGY";
    case BreakdownDimension::ContractType:
        return out << "CONTRACTTYPE";
    case BreakdownDimension::Metal:
        return out << "METAL";
    case BreakdownDimension::Exchange:
        return out << "EXCHANGE";
    case BreakdownDimension::Currency:
        return out << "CURRENCY";
    case BreakdownDimension::Maturity:
        return out << "MATURITY";
    default:
        QL_FAIL("Unknown BreakdownDimension");
    }
}

string breakdownValue(const Position& p, const BreakdownDimension& d) {
    switch (d) {
    case BreakdownDimension::Total:
        return "Total";
    case BreakdownDimension::BusinessLine:
        return p.businessLine;
    case BreakdownDimension::Strategy:
        return p.strategy;
    case BreakdownDimension::ContractType:
        return p.contractType;
    case BreakdownDimension::Metal:
        return p.key.metal;
    case BreakdownDimension::Exchange:
        return p.key.exchange;
    case BreakdownDimension::Currency:
        return p.currency;
    case BreakdownDimension::Maturity:
        return p.key.maturity;
    default:
        QL_FAIL("Unknown BreakdownDimension");
    }
}

vector<InstrumentKey> instrumentKeys(const vector<Position>& positions) {
    std::set<InstrumentKey> keys;
    for (const auto& p : positions)
        keys.insert(p.key);
    return vector<InstrumentKey>(keys.begin(), keys.end());
}

} // namespace data
} // namespace cre
