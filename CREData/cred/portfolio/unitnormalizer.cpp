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

#include <cred/portfolio/unitnormalizer.hpp>
#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;
using std::map;
using std::string;
using std::vector;

namespace cre {
namespace data {

UnitConversionTable::UnitConversionTable(const map<string, Real>& factors) : factors_(factors) {
    for (const auto& kv : factors_) {
        QL_REQUIRE(kv.second > 0.0,
                   "UnitConversionTable: factor for unit '" << kv.first << "' must be positive, got " << kv.second);
    }
}

Real UnitConversionTable::factor(const string& unit) const {
    auto it = factors_.find(unit);
    QL_REQUIRE(it != factors_.end(), "UnitConversionTable: unit '" << unit << "' not found");
    return it->second;
}

UnitConversionTable UnitConversionTable::volumeDefaults() { return UnitConversionTable({{"LB", 0.0004536}, {"MT", 1.0}}); }

UnitConversionTable UnitConversionTable::priceDefaults() {
    return UnitConversionTable({{"USD/LB", 0.0004536}, {"USD/MT", 1.0}});
}

UnitNormalizer::UnitNormalizer(const UnitConversionTable& volumeUnits, const UnitConversionTable& priceUnits)
    : volumeUnits_(volumeUnits), priceUnits_(priceUnits) {}

Real UnitNormalizer::factor(const UnitConversionTable& table, const string& unit) {
    if (table.has(unit))
        return table.factor(unit);
    if (unrecognisedUnits_[unit]++ == 0) {
        WLOG("UnitNormalizer: unit '" << unit << "' not recognised, passing values through with factor 1");
    }
    return 1.0;
}

Real UnitNormalizer::massVolume(Real volume, const string& unit) { return volume * factor(volumeUnits_, unit); }

Real UnitNormalizer::signedVolume(Real massVolume, const string& longShort) {
    if (longShort == "L")
        return massVolume;
    if (longShort != "S") {
        ++ambiguousSides_;
        WLOG("UnitNormalizer: long/short flag '" << longShort << "' is neither L nor S, treated as short");
    }
    return -massVolume;
}

Real UnitNormalizer::massQuote(Real quote, const string& unit) { return quote / factor(priceUnits_, unit); }

Position UnitNormalizer::normalise(const Position& position) {
    Position p = position;
    p.massVolume = massVolume(p.volume, p.unit);
    p.signedVolume = signedVolume(p.massVolume, p.longShort);
    return p;
}

PriceQuote UnitNormalizer::normalise(const PriceQuote& quote) {
    PriceQuote q = quote;
    q.massQuote = massQuote(q.value, q.unit);
    return q;
}

vector<Position> UnitNormalizer::normalise(const vector<Position>& positions) {
    vector<Position> result;
    result.reserve(positions.size());
    for (const auto& p : positions)
        result.push_back(normalise(p));
    DLOG("UnitNormalizer: normalised " << result.size() << " positions");
    return result;
}

vector<PriceQuote> UnitNormalizer::normalise(const vector<PriceQuote>& quotes) {
    vector<PriceQuote> result;
    result.reserve(quotes.size());
    for (const auto& q : quotes)
        result.push_back(normalise(q));
    DLOG("UnitNormalizer: normalised " << result.size() << " quotes");
    return result;
}

} // namespace data
} // namespace cre
