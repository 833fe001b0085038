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

/*! \file cred/portfolio/unitnormalizer.hpp
    \brief Conversion of volumes and quotes to metric tons
    \ingroup portfolio
*/

#pragma once

#include <cred/marketdata/pricequote.hpp>
#include <cred/portfolio/position.hpp>

#include <ql/types.hpp>

#include <map>
#include <string>
#include <vector>

namespace cre {
namespace data {

//! Closed mapping from a unit tag to its metric ton factor
/*! For volume units the factor converts a volume into metric tons (LB -> 0.0004536). For price units it is the
    factor of the quoted mass unit (USD/LB -> 0.0004536), the quote is divided by it.
    \ingroup portfolio
 */
class UnitConversionTable {
public:
    UnitConversionTable() {}
    UnitConversionTable(const std::map<std::string, QuantLib::Real>& factors);

    bool has(const std::string& unit) const { return factors_.find(unit) != factors_.end(); }
    //! throws if the unit is not in the table
    QuantLib::Real factor(const std::string& unit) const;
    const std::map<std::string, QuantLib::Real>& factors() const { return factors_; }

    //! LB and MT
    static UnitConversionTable volumeDefaults();
    //! USD/LB and USD/MT
    static UnitConversionTable priceDefaults();

private:
    std::map<std::string, QuantLib::Real> factors_;
};

//! Unit and sign normalisation of positions and quotes
/*! Units that are not in the conversion table pass through unchanged, i.e. with factor 1. This is a permissive
    policy that may hide a misspelled unit, so every pass-through is logged as a warning and counted per unit tag,
    see unrecognisedUnits(). Likewise a long/short tag other than L or S is treated as short and counted in
    ambiguousSides().
    \ingroup portfolio
 */
class UnitNormalizer {
public:
    UnitNormalizer(const UnitConversionTable& volumeUnits = UnitConversionTable::volumeDefaults(),
                   const UnitConversionTable& priceUnits = UnitConversionTable::priceDefaults());

    //! volume * factor(unit)
    QuantLib::Real massVolume(QuantLib::Real volume, const std::string& unit);
    //! +massVolume for L, -massVolume otherwise
    QuantLib::Real signedVolume(QuantLib::Real massVolume, const std::string& longShort);
    //! quote / factor(unit)
    QuantLib::Real massQuote(QuantLib::Real quote, const std::string& unit);

    Position normalise(const Position& position);
    PriceQuote normalise(const PriceQuote& quote);
    std::vector<Position> normalise(const std::vector<Position>& positions);
    std::vector<PriceQuote> normalise(const std::vector<PriceQuote>& quotes);

    //! unit tags that were passed through with factor 1, with the number of occurrences
    const std::map<std::string, QuantLib::Size>& unrecognisedUnits() const { return unrecognisedUnits_; }
    //! number of long/short tags that were neither L nor S
    QuantLib::Size ambiguousSides() const { return ambiguousSides_; }

    const UnitConversionTable& volumeUnits() const { return volumeUnits_; }
    const UnitConversionTable& priceUnits() const { return priceUnits_; }

private:
    QuantLib::Real factor(const UnitConversionTable& table, const std::string& unit);

    UnitConversionTable volumeUnits_, priceUnits_;
    std::map<std::string, QuantLib::Size> unrecognisedUnits_;
    QuantLib::Size ambiguousSides_ = 0;
};

} // namespace data
} // namespace cre
