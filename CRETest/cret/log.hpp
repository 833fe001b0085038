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

/*! \file cret/log.hpp
    \brief Routes CRE log output of the unit test suites
*/

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/test/unit_test.hpp>
#include <cred/utilities/log.hpp>

#include <string>

namespace cre {
namespace test {

//! Writes CRE log messages as Boost.Test messages, visible with --log_level=test_suite
class BoostTestLogger : public cre::data::Logger {
public:
    BoostTestLogger() : cre::data::Logger("BoostTestLogger") {}
    virtual void log(unsigned, const std::string& msg) override { BOOST_TEST_MESSAGE(msg); }
};

//! CRE log options understood by the test runners
/*! --cre_log_mask[=mask]  log to the Boost.Test output, the mask defaults to 255
    --cre_log_file=path     log to a file instead
    --cre_log_stderr        echo alerts to stderr as well
 */
struct TestLogOptions {
    boost::optional<unsigned> mask;
    std::string file;
    bool stderrAlerts = false;

    bool enabled() const { return mask || !file.empty(); }
};

inline TestLogOptions parseTestLogOptions(int argc, char** argv) {
    TestLogOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        std::string value;
        std::string::size_type eq = arg.find('=');
        if (eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }
        if (arg == "--cre_log_mask")
            options.mask = value.empty() ? 255u : boost::lexical_cast<unsigned>(boost::trim_copy(value));
        else if (arg == "--cre_log_file")
            options.file = value;
        else if (arg == "--cre_log_stderr")
            options.stderrAlerts = true;
    }
    return options;
}

//! Sets up CRE logging for a test runner from its command line, logging stays off without a --cre_log option
inline void setupTestLogging(int argc, char** argv) {
    TestLogOptions options = parseTestLogOptions(argc, argv);
    if (!options.enabled())
        return;

    cre::data::Log& log = cre::data::Log::instance();
    log.removeAllLoggers();
    if (options.file.empty())
        log.registerLogger(QuantLib::ext::make_shared<BoostTestLogger>());
    else
        log.registerLogger(QuantLib::ext::make_shared<cre::data::FileLogger>(options.file));
    if (options.stderrAlerts)
        log.registerLogger(QuantLib::ext::make_shared<cre::data::StderrLogger>());
    log.setMask(options.mask ? *options.mask : 255u);
    log.switchOn();
}

} // namespace test
} // namespace cre
