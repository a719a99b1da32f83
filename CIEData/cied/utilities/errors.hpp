/*
 Copyright (C) 2025 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CIE, a free-software/open-source library
 for transparent calculation of interest on insolvency claims

 CIE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to claim review and calculation standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file cied/utilities/errors.hpp
    \brief Error kinds raised by the calculation engine
    \ingroup utilities
*/

#pragma once

#include <ql/errors.hpp>
#include <ql/time/date.hpp>

#include <boost/current_function.hpp>

#include <sstream>
#include <string>

namespace cie {
namespace data {

//! Base class of all errors raised for a calculation request
/*! The error carries its kind and the offending request field, both are surfaced verbatim to the caller.
    \ingroup utilities
*/
class CalculationError : public QuantLib::Error {
public:
    CalculationError(const std::string& file, long line, const std::string& function, const std::string& kind,
                     const std::string& field, const std::string& message);

    const std::string& kind() const { return kind_; }
    const std::string& field() const { return field_; }
    //! the message without file and line decoration
    const std::string& message() const { return message_; }

private:
    std::string kind_, field_, message_;
};

//! Malformed request, caller error
class ValidationError : public CalculationError {
public:
    ValidationError(const std::string& file, long line, const std::string& function, const std::string& field,
                    const std::string& message)
        : CalculationError(file, line, function, "ValidationError", field, message) {}

protected:
    ValidationError(const std::string& file, long line, const std::string& function, const std::string& kind,
                    const std::string& field, const std::string& message)
        : CalculationError(file, line, function, kind, field, message) {}
};

//! Payment dated outside the calculation range or out of order
class InvalidPaymentDateError : public ValidationError {
public:
    InvalidPaymentDateError(const std::string& file, long line, const std::string& function,
                            const std::string& field, const std::string& message)
        : ValidationError(file, line, function, "InvalidPaymentDateError", field, message) {}
};

//! Mode specific parameter omitted or contradicted
class InvalidParameterError : public CalculationError {
public:
    InvalidParameterError(const std::string& file, long line, const std::string& function,
                          const std::string& field, const std::string& message)
        : CalculationError(file, line, function, "InvalidParameterError", field, message) {}
};

//! Compound request without a compounding cycle
class MissingCycleError : public CalculationError {
public:
    MissingCycleError(const std::string& file, long line, const std::string& function, const std::string& field,
                      const std::string& message)
        : CalculationError(file, line, function, "MissingCycleError", field, message) {}
};

//! Benchmark rate requested before the first entry of the rate table
class RateNotFoundError : public CalculationError {
public:
    RateNotFoundError(const std::string& file, long line, const std::string& function, const std::string& term,
                      const QuantLib::Date& date, const std::string& message)
        : CalculationError(file, line, function, "RateNotFoundError", "term", message), term_(term), date_(date) {}

    const std::string& term() const { return term_; }
    const QuantLib::Date& date() const { return date_; }

private:
    std::string term_;
    QuantLib::Date date_;
};

} // namespace data
} // namespace cie

/*! Throw an error of the given kind for the given request field if the condition is not met, in the same
    manner as QL_REQUIRE.
*/
#define CIE_REQUIRE(condition, ErrorType, field, message)                                                            \
    if (!(condition)) {                                                                                                \
        std::ostringstream _cie_msg_stream;                                                                            \
        _cie_msg_stream << message;                                                                                    \
        throw ErrorType(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, field, _cie_msg_stream.str());                    \
    } else

//! Throw an error of the given kind for the given request field
#define CIE_FAIL(ErrorType, field, message)                                                                            \
    do {                                                                                                               \
        std::ostringstream _cie_msg_stream;                                                                            \
        _cie_msg_stream << message;                                                                                    \
        throw ErrorType(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, field, _cie_msg_stream.str());                    \
    } while (false)
