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

#include <cred/utilities/to_string.hpp>

#include <iomanip>

namespace cre {
namespace data {

std::string to_string(const QuantLib::Date& date) {
    if (date == QuantLib::Date())
        return "1901-01-01";
    std::ostringstream oss;
    oss << date.year() << '-' << std::setw(2) << std::setfill('0') << static_cast<int>(date.month()) << '-'
        << std::setw(2) << std::setfill('0') << date.dayOfMonth();
    return oss.str();
}

std::string to_string(bool aBool) { return aBool ? "true" : "false"; }

} // namespace data
} // namespace cre
