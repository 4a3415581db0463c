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

/*! \file mle/math/piecewisepolynomialfunction1d.hpp
    \brief evaluation, differentiation and integration of piecewise polynomials
    \ingroup math
*/

#pragma once

#include <mle/math/piecewisepolynomialresult.hpp>

#include <ql/shared_ptr.hpp>

#include <vector>

namespace MathExt {

//! Evaluates a PiecewisePolynomialResult and its derivatives and integrals
/*! A key x is evaluated on the interval returned by PiecewisePolynomialResult::interval(),
    keys outside of the knot range are extrapolated with the first or last piece.

    All inputs are checked before anything is evaluated: the polynomial must not be null,
    key vectors must not be empty and keys must be neither NaN nor infinite.

    Single key methods return one value per output dimension, key vector methods return
    a dimensions x keys matrix.

    \ingroup math
*/
class PiecewisePolynomialFunction1D {
public:
    //! values at a single key
    Array evaluate(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp, Real xKey) const;
    //! values at each key, row d holds output dimension d
    Matrix evaluateMany(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp,
                        const std::vector<Real>& xKeys) const;
    //! one matrix as returned by evaluateMany() per key set
    std::vector<Matrix> evaluateBatched(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp,
                                        const std::vector<std::vector<Real>>& xKeys) const;

    //! first derivative at a single key, requires order >= 2
    Array differentiate(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp, Real xKey) const;
    //! first derivative at each key, requires order >= 2
    Matrix differentiateMany(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp,
                             const std::vector<Real>& xKeys) const;

    //! second derivative at a single key, requires order >= 3
    Array differentiateTwice(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp, Real xKey) const;
    //! second derivative at each key, requires order >= 3
    Matrix differentiateTwiceMany(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp,
                                  const std::vector<Real>& xKeys) const;

    /*! integral from initialKey to xKey, only one dimensional polynomials can be integrated;
        the sign flips if xKey < initialKey */
    Real integrate(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp, Real initialKey, Real xKey) const;
    //! integrals from initialKey to each key
    Array integrateMany(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp, Real initialKey,
                        const std::vector<Real>& xKeys) const;

    //! the piecewise first derivative, of order pp->order() - 1
    QuantLib::ext::shared_ptr<PiecewisePolynomialResult>
    derivative(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp) const;
    //! the piecewise second derivative, of order pp->order() - 2
    QuantLib::ext::shared_ptr<PiecewisePolynomialResult>
    secondDerivative(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp) const;
    /*! the antiderivative vanishing at initialKey, of order pp->order() + 1

        The integration constant of the interval containing initialKey is chosen such that
        the antiderivative vanishes at initialKey, the constants of the other intervals
        follow from continuity at the knots.
    */
    QuantLib::ext::shared_ptr<PiecewisePolynomialResult>
    antiderivative(const QuantLib::ext::shared_ptr<PiecewisePolynomialResult>& pp, Real initialKey) const;
};

} // namespace MathExt
