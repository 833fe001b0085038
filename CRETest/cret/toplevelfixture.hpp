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

/*! \file cret/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <cred/utilities/log.hpp>
#include <ql/settings.hpp>

using QuantLib::SavedSettings;

namespace cre {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    SavedSettings savedSettings;

    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture()
        : logEnabled_(cre::data::Log::instance().enabled()), logMask_(cre::data::Log::instance().mask()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Remove a buffer logger a test case has registered
        if (cre::data::Log::instance().hasLogger(cre::data::BufferLogger::name))
            cre::data::Log::instance().removeLogger(cre::data::BufferLogger::name);
        // Restore the log state of the suite
        cre::data::Log::instance().setMask(logMask_);
        if (logEnabled_)
            cre::data::Log::instance().switchOn();
        else
            cre::data::Log::instance().switchOff();
    }

private:
    bool logEnabled_;
    unsigned logMask_;
};
} // namespace test
} // namespace cre
