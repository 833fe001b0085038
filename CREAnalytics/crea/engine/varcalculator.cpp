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

#include <crea/engine/varcalculator.hpp>

#include <ql/errors.hpp>

#include <map>

using namespace std;

namespace cre {
namespace analytics {

VarMethod parseVarMethod(const string& s) {
    static map<string, VarMethod> m = {{"Parametric", VarMethod::Parametric},
                                       {"VarianceCovariance", VarMethod::Parametric},
                                       {"Historical", VarMethod::Historical},
                                       {"HistoricalSimulation", VarMethod::Historical}};

    auto it = m.find(s);
    if (it != m.end())
        return it->second;
    else
        QL_FAIL("VaR method \"" << s << "\" not recognized");
}

ostream& operator<<(ostream& out, const VarMethod& method) {
    switch (method) {
    case VarMethod::Parametric:
        return out << "Parametric";
    case VarMethod::Historical:
        return out << "Historical";
    default:
        QL_FAIL("Invalid VarMethod");
    }
}

} // namespace analytics
} // namespace cre
