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

/*! \file crea/engine/varmessage.hpp
    \brief Structured log record for a VaR figure that could not be computed
    \ingroup engine
*/

#pragma once

#include <cred/utilities/log.hpp>
#include <cred/utilities/result.hpp>
#include <cred/utilities/to_string.hpp>

#include <map>
#include <string>

namespace cre {
namespace analytics {

//! Structured message for a failed VaR figure
/*! The sub fields carry the error kind and the breakdown dimension. The dimension value is only added for a
    partition of a breakdown level, the total VaR is reported with dimension "Total" and no value.
    \ingroup engine
 */
class VarFailureMessage : public cre::data::StructuredMessage {
public:
    VarFailureMessage(const Category& category, const cre::data::RiskError& error, const std::string& dimension,
                      const std::string& value = std::string())
        : StructuredMessage(category, Group::Analytics, error.message(),
                            std::map<std::string, std::string>({{"analyticType", "VaR"},
                                                                {"errorKind", cre::data::to_string(error.kind())},
                                                                {"dimension", dimension}})) {
        if (!value.empty())
            subFields_["value"] = value;
    }
};

} // namespace analytics
} // namespace cre
