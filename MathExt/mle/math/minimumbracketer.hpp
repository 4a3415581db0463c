/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file mle/math/minimumbracketer.hpp
    \brief base class for the search of a triplet bracketing a minimum
    \ingroup math
*/

#pragma once

#include <mle/math/scalarminimizer.hpp>

#include <ql/types.hpp>

#include <array>
#include <ostream>
#include <string>

namespace MathExt {
using QuantLib::Real;
using QuantLib::Size;

//! three abscissas with f(x1) less than f(x0) and f(x2)
/*! x1 lies between x0 and x2, the triplet is either increasing or decreasing. */
struct BracketTriplet {
    Real x0, x1, x2;
    Real f0, f1, f2;
};

//! outcome of a bracketing search
struct BracketingResult {
    enum class Status { Bracketed, NotBracketed };

    Status status;
    //! last triplet visited, the bracket if status is Bracketed
    BracketTriplet triplet;
    //! number of function evaluations spent
    Size evaluations;
    //! reason of a failed search, empty otherwise
    std::string message;

    bool bracketed() const { return status == Status::Bracketed; }
};

std::ostream& operator<<(std::ostream& out, BracketingResult::Status status);

//! Base class for minimum bracketers
/*! Given two starting points, a bracketer searches (possibly outside of the given
    interval) for three points x0, x1, x2 such that x1 lies between x0 and x2 and
    f(x1) is strictly less than f(x0) and f(x2).

    \ingroup math
*/
class MinimumBracketer {
public:
    //! magnification of successive steps when a search moves outward
    static constexpr Real GOLDEN = 1.618034;

    virtual ~MinimumBracketer() {}

    /*! Runs the search and reports its outcome. A search that runs out of iterations
        or hits a NaN or -inf value is reported as NotBracketed, invalid inputs throw. */
    virtual BracketingResult bracket(const ScalarFunction& f, Real lower, Real upper) const = 0;

    //! the bracketing triplet {x0, x1, x2}, throws if no bracket was found
    std::array<Real, 3> bracketedPoints(const ScalarFunction& f, Real lower, Real upper) const;

protected:
    void checkInputs(const ScalarFunction& f, Real lower, Real upper) const;
};

} // namespace MathExt
