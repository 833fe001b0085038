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

#include <cred/utilities/result.hpp>

namespace cre {
namespace data {

std::ostream& operator<<(std::ostream& out, const RiskError::Kind& kind) {
    switch (kind) {
    case RiskError::Kind::MissingMarketData:
        return out << "MissingMarketData";
    case RiskError::Kind::ZeroExposure:
        return out << "ZeroExposure";
    case RiskError::Kind::InsufficientHistory:
        return out << "InsufficientHistory";
    case RiskError::Kind::UnknownBreakdownColumn:
        return out << "UnknownBreakdownColumn";
    default:
        QL_FAIL("Unknown RiskError::Kind");
    }
}

std::ostream& operator<<(std::ostream& out, const RiskError& error) {
    return out << error.kind() << ": " << error.message();
}

} // namespace data
} // namespace cre
