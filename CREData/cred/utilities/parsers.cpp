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

#include <cred/utilities/parsers.hpp>

#include <ql/errors.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cctype>
#include <map>

using namespace QuantLib;
using std::map;
using std::string;
using std::vector;

namespace cre {
namespace data {

namespace {

bool allDigits(const string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

Integer parseDatePart(const string& s, const string& date) {
    QL_REQUIRE(!s.empty() && allDigits(s),
               "Cannot convert \"" << date << "\" to Date, \"" << s << "\" is not a number");
    return boost::lexical_cast<Integer>(s);
}

} // namespace

Date parseDate(const string& s) {
    QL_REQUIRE(!s.empty(), "Cannot convert empty string to date");

    string str = boost::trim_copy(s);
    Integer y, m, d;
    if (str.size() == 10 && str[4] == '-' && str[7] == '-') {
        // yyyy-mm-dd
        y = parseDatePart(str.substr(0, 4), s);
        m = parseDatePart(str.substr(5, 2), s);
        d = parseDatePart(str.substr(8, 2), s);
    } else if (str.size() == 8 && allDigits(str)) {
        // yyyymmdd
        y = parseDatePart(str.substr(0, 4), s);
        m = parseDatePart(str.substr(4, 2), s);
        d = parseDatePart(str.substr(6, 2), s);
    } else {
        // dd/mm/yyyy, day first
        vector<string> tokens;
        boost::split(tokens, str, boost::is_any_of("/"));
        QL_REQUIRE(tokens.size() == 3 && tokens[2].size() == 4,
                   "Cannot convert \"" << s << "\" to Date, expected yyyy-mm-dd, yyyymmdd or dd/mm/yyyy");
        d = parseDatePart(tokens[0], s);
        m = parseDatePart(tokens[1], s);
        y = parseDatePart(tokens[2], s);
    }
    QL_REQUIRE(m >= 1 && m <= 12, "Cannot convert \"" << s << "\" to Date, invalid month " << m);
    QL_REQUIRE(y >= 1901 && y <= 2199, "Cannot convert \"" << s << "\" to Date, year " << y << " out of range");
    QL_REQUIRE(d >= 1 && d <= Date::endOfMonth(Date(1, static_cast<Month>(m), y)).dayOfMonth(),
               "Cannot convert \"" << s << "\" to Date, invalid day " << d);
    return Date(d, static_cast<Month>(m), y);
}

Real parseReal(const string& s) {
    try {
        // thousands separators are common in the book keeping exports
        return boost::lexical_cast<Real>(boost::erase_all_copy(boost::trim_copy(s), ","));
    } catch (std::exception&) {
        QL_FAIL("Failed to parseReal(\"" << s << "\")");
    }
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(boost::trim_copy(s));
    } catch (std::exception&) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\")");
    }
}

bool tryParseBreakdownDimension(const string& s, BreakdownDimension& result) {
    static map<string, BreakdownDimension> m = {{"TOTAL", BreakdownDimension::Total},
                                                {"BUSINESS LINE", BreakdownDimension::BusinessLine},
                                                {"BUSINESSLINE", BreakdownDimension::BusinessLine},
                                                {"STRATEGY", BreakdownDimension::Strategy},
                                                {"CONTRACTTYPE", BreakdownDimension::ContractType},
                                                {"CONTRACT TYPE", BreakdownDimension::ContractType},
                                                {"METAL", BreakdownDimension::Metal},
                                                {"EXCHANGE", BreakdownDimension::Exchange},
                                                {"CURRENCY", BreakdownDimension::Currency},
                                                {"MATURITY", BreakdownDimension::Maturity}};

    string key = boost::to_upper_copy(boost::trim_copy(s));
    boost::replace_all(key, "_", " ");
    auto it = m.find(key);
    if (it == m.end())
        return false;
    result = it->second;
    return true;
}

BreakdownDimension parseBreakdownDimension(const string& s) {
    BreakdownDimension d;
    QL_REQUIRE(tryParseBreakdownDimension(s, d), "Breakdown dimension \"" << s << "\" not recognized");
    return d;
}

UnitConversionTable parseUnitConversionTable(const string& s) {
    map<string, Real> factors;
    for (auto const& token : parseListOfValues(s)) {
        // the unit itself may contain a slash (USD/LB) but never a colon
        auto pos = token.rfind(':');
        QL_REQUIRE(pos != string::npos && pos > 0 && pos + 1 < token.size(),
                   "parseUnitConversionTable: expected UNIT:factor, got \"" << token << "\"");
        string unit = boost::trim_copy(token.substr(0, pos));
        QL_REQUIRE(factors.find(unit) == factors.end(), "parseUnitConversionTable: duplicate unit \"" << unit << "\"");
        factors[unit] = parseReal(token.substr(pos + 1));
    }
    return UnitConversionTable(factors);
}

vector<string> parseListOfValues(string s) {
    boost::trim(s);
    vector<string> tokens, result;
    if (s.empty())
        return result;
    boost::split(tokens, s, boost::is_any_of(","));
    for (auto& t : tokens) {
        boost::trim(t);
        if (!t.empty())
            result.push_back(t);
    }
    return result;
}

} // namespace data
} // namespace cre
