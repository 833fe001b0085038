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

/*! \file cred/utilities/result.hpp
    \brief Outcome of a risk computation that may fail for a recoverable, data related reason
    \ingroup utilities
*/

#pragma once

#include <ql/errors.hpp>

#include <boost/optional.hpp>

#include <ostream>
#include <string>

namespace cre {
namespace data {

//! Recoverable data condition that prevents a risk figure from being computed
/*! Invalid input (e.g. a confidence level outside (0,1)) is not a RiskError, it is reported by throwing a
    QuantLib::Error instead.
 */
class RiskError {
public:
    enum class Kind {
        //! no quote for an instrument under the requested join mode
        MissingMarketData,
        //! gross position value is zero, weights are undefined
        ZeroExposure,
        //! not enough aligned dates or returns for a covariance or P&L quantile
        InsufficientHistory,
        //! breakdown dimension not part of the position record
        UnknownBreakdownColumn
    };

    RiskError(Kind kind, const std::string& message) : kind_(kind), message_(message) {}

    Kind kind() const { return kind_; }
    const std::string& message() const { return message_; }

private:
    Kind kind_;
    std::string message_;
};

std::ostream& operator<<(std::ostream& out, const RiskError::Kind& kind);

std::ostream& operator<<(std::ostream& out, const RiskError& error);

//! Holds either a value or the RiskError explaining why there is none
template <class T> class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(const RiskError& error) : error_(error) {}

    bool ok() const { return value_ != boost::none; }

    const T& value() const {
        QL_REQUIRE(ok(), "Result holds no value: " << *error_);
        return *value_;
    }

    const RiskError& error() const {
        QL_REQUIRE(!ok(), "Result holds a value, not an error");
        return *error_;
    }

    //! true if the result failed with the given kind
    bool failedWith(RiskError::Kind kind) const { return !ok() && error_->kind() == kind; }

private:
    boost::optional<T> value_;
    boost::optional<RiskError> error_;
};

} // namespace data
} // namespace cre
