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

#include <crea/app/varparameters.hpp>

#include <cred/utilities/log.hpp>
#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <functional>

using namespace cre::data;
using namespace QuantLib;
using std::map;
using std::string;

namespace cre {
namespace analytics {

namespace {

Size parseSize(const string& s, const string& name) {
    Integer n = parseInteger(s);
    QL_REQUIRE(n >= 0, "VarParameters: " << name << " must not be negative, got " << s);
    return static_cast<Size>(n);
}

} // namespace

VarParameters::VarParameters()
    : volumeUnits_(UnitConversionTable::volumeDefaults()), priceUnits_(UnitConversionTable::priceDefaults()) {}

void VarParameters::setConfidence(Real c) {
    QL_REQUIRE(c > 0.0 && c < 1.0, "VarParameters: confidence level " << c << " must be in (0, 1)");
    confidence_ = c;
}

void VarParameters::setConfidence(const string& s) { setConfidence(parseReal(s)); }

void VarParameters::setLookbackDays(const string& s) { setLookbackDays(parseSize(s, "lookbackDays")); }

void VarParameters::setHorizonDays(Size n) {
    QL_REQUIRE(n > 0, "VarParameters: horizon must be at least one day");
    horizonDays_ = n;
}

void VarParameters::setHorizonDays(const string& s) { setHorizonDays(parseSize(s, "horizonDays")); }

void VarParameters::setBreakdown(const string& s) {
    std::vector<string> dimensions = parseListOfValues(s);
    QL_REQUIRE(!dimensions.empty(), "VarParameters: empty breakdown list");
    breakdown_ = dimensions;
}

void VarParameters::setOutlierThreshold(Real t) {
    QL_REQUIRE(t > 0.0, "VarParameters: outlier threshold must be positive, got " << t);
    outlierThreshold_ = t;
}

void VarParameters::setOutlierThreshold(const string& s) { setOutlierThreshold(parseReal(s)); }

void VarParameters::setThreads(Size n) {
    QL_REQUIRE(n > 0, "VarParameters: number of threads must be positive");
    threads_ = n;
}

void VarParameters::setThreads(const string& s) { setThreads(parseSize(s, "threads")); }

void VarParameters::setVolumeUnits(const string& s) { volumeUnits_ = parseUnitConversionTable(s); }

void VarParameters::setPriceUnits(const string& s) { priceUnits_ = parseUnitConversionTable(s); }

void VarParameters::fromMap(const map<string, string>& params) {
    static const map<string, std::function<void(VarParameters&, const string&)>> setters = {
        {"confidence", [](VarParameters& p, const string& s) { p.setConfidence(s); }},
        {"lookbackDays", [](VarParameters& p, const string& s) { p.setLookbackDays(s); }},
        {"horizonDays", [](VarParameters& p, const string& s) { p.setHorizonDays(s); }},
        {"breakdown", [](VarParameters& p, const string& s) { p.setBreakdown(s); }},
        {"outlierThreshold", [](VarParameters& p, const string& s) { p.setOutlierThreshold(s); }},
        {"method", [](VarParameters& p, const string& s) { p.setMethod(s); }},
        {"threads", [](VarParameters& p, const string& s) { p.setThreads(s); }},
        {"volumeUnits", [](VarParameters& p, const string& s) { p.setVolumeUnits(s); }},
        {"priceUnits", [](VarParameters& p, const string& s) { p.setPriceUnits(s); }}};

    for (const auto& kv : params) {
        auto it = setters.find(kv.first);
        if (it == setters.end()) {
            WLOG("VarParameters: unknown parameter '" << kv.first << "' ignored");
            continue;
        }
        DLOG("VarParameters: " << kv.first << " = " << kv.second);
        it->second(*this, kv.second);
    }
}

void VarParameters::log() const {
    LOG("VaR parameters:");
    LOG("confidence       = " << confidence_);
    LOG("lookbackDays     = " << lookbackDays_);
    LOG("horizonDays      = " << horizonDays_);
    LOG("breakdown        = " << to_string(breakdown_));
    LOG("outlierThreshold = " << outlierThreshold_);
    LOG("method           = " << method_);
    LOG("threads          = " << threads_);
    for (const auto& kv : volumeUnits_.factors())
        LOG("volumeUnit       = " << kv.first << ":" << kv.second);
    for (const auto& kv : priceUnits_.factors())
        LOG("priceUnit        = " << kv.first << ":" << kv.second);
}

} // namespace analytics
} // namespace cre
