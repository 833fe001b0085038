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

/*! \file cred/utilities/parsers.hpp
    \brief Map text representations to internal types
    \ingroup utilities
*/

#pragma once

#include <cred/portfolio/position.hpp>
#include <cred/portfolio/unitnormalizer.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <boost/algorithm/string.hpp>

#include <functional>
#include <string>
#include <vector>

namespace cre {
namespace data {

//! Convert std::string to QuantLib::Date
/*!
  Accepted formats are yyyy-mm-dd, yyyymmdd and the day first dd/mm/yyyy of the book keeping exports.
  \ingroup utilities
 */
QuantLib::Date parseDate(const std::string& s);

//! Convert text to Real
/*!
  \ingroup utilities
 */
QuantLib::Real parseReal(const std::string& s);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
 */
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to a breakdown dimension
/*! Accepts the position column names (e.g. BUSINESS LINE, METAL) case insensitively, with blanks or underscores
    between words, and Total. Throws for anything else.
    \ingroup utilities
 */
BreakdownDimension parseBreakdownDimension(const std::string& s);

//! Attempt to convert text to a breakdown dimension, returns false if \p s is not a position attribute
bool tryParseBreakdownDimension(const std::string& s, BreakdownDimension& result);

//! Convert text of the form UNIT:factor,UNIT:factor to a unit conversion table
/*!
  \ingroup utilities
 */
UnitConversionTable parseUnitConversionTable(const std::string& s);

//! Convert comma separated list to vector of strings, blanks around the tokens are removed, empty tokens dropped
/*!
  \ingroup utilities
 */
std::vector<std::string> parseListOfValues(std::string s);

//! Convert comma separated list to vector of values using the given parser
/*!
  \ingroup utilities
 */
template <class T>
std::vector<T> parseListOfValues(const std::string& s, std::function<T(std::string)> parser) {
    std::vector<T> vec;
    for (auto const& token : parseListOfValues(s))
        vec.push_back(parser(token));
    return vec;
}

} // namespace data
} // namespace cre
