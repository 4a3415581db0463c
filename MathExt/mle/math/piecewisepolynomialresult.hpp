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

/*! \file mle/math/piecewisepolynomialresult.hpp
    \brief knots and coefficients of a piecewise polynomial
    \ingroup math
*/

#pragma once

#include <ql/math/array.hpp>
#include <ql/math/matrix.hpp>

namespace MathExt {
using QuantLib::Array;
using QuantLib::Matrix;
using QuantLib::Real;
using QuantLib::Size;

//! Piecewise polynomial in one variable with one or more output dimensions
/*! The polynomial on interval i, i.e. between knots[i] and knots[i+1], is written in the
    local variable u = x - knots[i]. Row i * dimensions + d of the coefficient matrix holds
    the coefficients of output dimension d on interval i, from the highest degree down to
    the constant term. The number of columns is the order, i.e. the degree plus one.

    Instances are immutable.

    \ingroup math
*/
class PiecewisePolynomialResult {
public:
    /*! \param knots strictly increasing, finite, at least two of them
        \param coefMatrix dimensions * (knots.size() - 1) rows, order columns
        \param order number of coefficients per piece
        \param dimensions number of output dimensions
    */
    PiecewisePolynomialResult(const Array& knots, const Matrix& coefMatrix, Size order, Size dimensions);

    const Array& knots() const { return knots_; }
    const Matrix& coefMatrix() const { return coefMatrix_; }
    Size numberOfIntervals() const { return knots_.size() - 1; }
    Size order() const { return order_; }
    Size dimensions() const { return dimensions_; }

    //! index of the interval used for x, the first and last interval extend to -inf and +inf
    Size interval(Real x) const;

private:
    Array knots_;
    Matrix coefMatrix_;
    Size order_, dimensions_;
};

} // namespace MathExt
