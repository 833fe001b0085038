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

/*! \file crea/app/varparameters.hpp
    \brief Parameters of a VaR run
    \ingroup app
*/

#pragma once

#include <crea/engine/varcalculator.hpp>

#include <cred/portfolio/unitnormalizer.hpp>

#include <ql/types.hpp>

#include <map>
#include <string>
#include <vector>

namespace cre {
namespace analytics {

/*! Typed container of the VaR run parameters. All options have defaults. Typed setters validate their argument,
    string setters parse it first. fromMap() loads a flat key/value group, see the keys below.

    key              | default                  | meaning
    -----------------|--------------------------|----------------------------------------------
    confidence       | 0.99                     | confidence level in (0, 1)
    lookbackDays     | 365                      | calendar days of price history used
    horizonDays      | 1                        | parametric VaR is scaled by sqrt(horizonDays)
    breakdown        | Total                    | comma separated breakdown dimensions
    outlierThreshold | 4.0                      | z-score threshold of the data quality check
    method           | Parametric               | Parametric or Historical
    threads          | 1                        | number of partition worker threads
    volumeUnits      | LB:0.0004536,MT:1        | volume unit to metric ton factors
    priceUnits       | USD/LB:0.0004536,USD/MT:1 | price unit to per metric ton divisors

    \ingroup app
 */
class VarParameters {
public:
    VarParameters();

    // Setters
    void setConfidence(QuantLib::Real c);
    void setConfidence(const std::string& s); // parse to Real
    void setLookbackDays(QuantLib::Size n) { lookbackDays_ = n; }
    void setLookbackDays(const std::string& s); // parse to Size
    void setHorizonDays(QuantLib::Size n);
    void setHorizonDays(const std::string& s); // parse to Size
    void setBreakdown(const std::vector<std::string>& dimensions) { breakdown_ = dimensions; }
    void setBreakdown(const std::string& s); // parse to vector<string>
    void setOutlierThreshold(QuantLib::Real t);
    void setOutlierThreshold(const std::string& s); // parse to Real
    void setMethod(VarMethod m) { method_ = m; }
    void setMethod(const std::string& s) { method_ = parseVarMethod(s); }
    void setThreads(QuantLib::Size n);
    void setThreads(const std::string& s); // parse to Size
    void setVolumeUnits(const cre::data::UnitConversionTable& t) { volumeUnits_ = t; }
    void setVolumeUnits(const std::string& s); // parse to UnitConversionTable
    void setPriceUnits(const cre::data::UnitConversionTable& t) { priceUnits_ = t; }
    void setPriceUnits(const std::string& s); // parse to UnitConversionTable

    //! set every known key of \p params, unknown keys are logged and ignored
    void fromMap(const std::map<std::string, std::string>& params);

    // Getters
    QuantLib::Real confidence() const { return confidence_; }
    QuantLib::Size lookbackDays() const { return lookbackDays_; }
    QuantLib::Size horizonDays() const { return horizonDays_; }
    const std::vector<std::string>& breakdown() const { return breakdown_; }
    QuantLib::Real outlierThreshold() const { return outlierThreshold_; }
    VarMethod method() const { return method_; }
    QuantLib::Size threads() const { return threads_; }
    const cre::data::UnitConversionTable& volumeUnits() const { return volumeUnits_; }
    const cre::data::UnitConversionTable& priceUnits() const { return priceUnits_; }

    //! write the parameters to the log
    void log() const;

private:
    QuantLib::Real confidence_ = 0.99;
    QuantLib::Size lookbackDays_ = 365;
    QuantLib::Size horizonDays_ = 1;
    std::vector<std::string> breakdown_ = {"Total"};
    QuantLib::Real outlierThreshold_ = 4.0;
    VarMethod method_ = VarMethod::Parametric;
    QuantLib::Size threads_ = 1;
    cre::data::UnitConversionTable volumeUnits_;
    cre::data::UnitConversionTable priceUnits_;
};

} // namespace analytics
} // namespace cre
