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

/*! \file cred/utilities/to_string.hpp
    \brief string conversion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace cre {
namespace data {

//! Convert QuantLib::Date to std::string
/*!
  Returns date as a string in YYYY-MM-DD format, which matches parseDate()
  \ingroup utilities
*/
std::string to_string(const QuantLib::Date& date);

//! Convert bool to std::string
/*!
  Returns "true" for true and "false" for false
  \ingroup utilities
*/
std::string to_string(bool aBool);

//! Convert type to std::string
/*!
  Utility to give a string for any type that has an ostream operator
  \ingroup utilities
*/
template <class T> inline std::string to_string(const T& t) {
    std::ostringstream oss;
    oss << t;
    return oss.str();
}

//! Convert vector to std::string
/*!
  Returns a vector into a single string, with elements separated by Period.
  \ingroup utilities
*/
template <class T> std::string to_string(const std::vector<T>& vec, const std::string& sep = ",") {
    std::ostringstream oss;
    for (std::size_t i = 0; i < vec.size(); ++i) {
        oss << vec[i];
        if (i < vec.size() - 1) {
            oss << sep;
        }
    }
    return oss.str();
}

} // namespace data
} // namespace cre
