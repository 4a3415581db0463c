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

/*! \file mle/math/scalarminimizer.hpp
    \brief interface for one dimensional minimizers
    \ingroup math
*/

#pragma once

#include <ql/types.hpp>

#include <functional>

namespace MathExt {
using QuantLib::Real;

//! one dimensional function to be minimized
typedef std::function<Real(Real)> ScalarFunction;

//! Interface for minimizers of real functions of one real argument
/*! Implementations hold no state that changes between calls.
    \ingroup math
*/
class ScalarMinimizer {
public:
    virtual ~ScalarMinimizer() {}
    //! minimum search started from a single point
    virtual Real minimize(const ScalarFunction& f, Real startPosition) const = 0;
    //! minimum search started from a point inside the given bounds
    virtual Real minimize(const ScalarFunction& f, Real startPosition, Real lower, Real upper) const = 0;
};

} // namespace MathExt
