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

/*! \file cred/portfolio/position.hpp
    \brief Position record of a commodity book
    \ingroup portfolio
*/

#pragma once

#include <cred/portfolio/instrumentkey.hpp>

#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace cre {
namespace data {

//! One entry of a position snapshot
/*! The raw fields are populated by the loading collaborator, the mass normalised fields are set by the
    UnitNormalizer and are null until then.
    \ingroup portfolio
 */
struct Position {
    InstrumentKey key;
    std::string contractType;
    std::string businessLine;
    std::string strategy;
    std::string currency;
    //! L for long, anything else is treated as short
    std::string longShort;
    QuantLib::Real volume = 0.0;
    std::string unit;

    //! volume in metric tons
    QuantLib::Real massVolume = QuantLib::Null<QuantLib::Real>();
    //! mass volume with the long/short sign applied
    QuantLib::Real signedVolume = QuantLib::Null<QuantLib::Real>();

    bool normalised() const { return signedVolume != QuantLib::Null<QuantLib::Real>(); }
};

//! Attribute of a position by which a book can be broken down
enum class BreakdownDimension { Total, BusinessLine, Strategy, ContractType, Metal, Exchange, Currency, Maturity };

std::ostream& operator<<(std::ostream& out, const BreakdownDimension& d);

//! Value of the breakdown attribute \p d for position \p p, "Total" for BreakdownDimension::Total
std::string breakdownValue(const Position& p, const BreakdownDimension& d);

//! Distinct instrument keys of a set of positions
std::vector<InstrumentKey> instrumentKeys(const std::vector<Position>& positions);

} // namespace data
} // namespace cre
