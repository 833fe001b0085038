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

/*! \file crea/engine/varcalculator.hpp
    \brief Base class for a var calculation
    \ingroup engine
*/

#pragma once

#include <ql/types.hpp>

#include <ostream>
#include <string>

namespace cre {
namespace analytics {

//! VaR Calculator
class VarCalculator {
public:
    VarCalculator() {}
    virtual ~VarCalculator() {}

    //! value at risk as a positive loss at the given confidence level in (0, 1)
    virtual QuantLib::Real var(QuantLib::Real confidence) const = 0;
};

//! VaR methodology
enum class VarMethod { Parametric, Historical };

VarMethod parseVarMethod(const std::string& method);
std::ostream& operator<<(std::ostream& out, const VarMethod& method);

} // namespace analytics
} // namespace cre
