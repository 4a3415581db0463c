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

#include <mle/math/piecewisepolynomialfunction1d.hpp>

#include <ql/errors.hpp>

#include <cmath>

using QuantLib::ext::shared_ptr;

namespace MathExt {

namespace {

void checkPolynomial(const shared_ptr<PiecewisePolynomialResult>& pp) {
    QL_REQUIRE(pp, "PiecewisePolynomialFunction1D: piecewise polynomial must not be null");
}

void checkKey(Real x) {
    QL_REQUIRE(!std::isnan(x), "PiecewisePolynomialFunction1D: key is NaN");
    QL_REQUIRE(!std::isinf(x), "PiecewisePolynomialFunction1D: key (" << x << ") is infinite");
}

void checkKeys(const std::vector<Real>& xKeys) {
    QL_REQUIRE(!xKeys.empty(), "PiecewisePolynomialFunction1D: no keys given");
    for (Size i = 0; i < xKeys.size(); ++i) {
        QL_REQUIRE(!std::isnan(xKeys[i]), "PiecewisePolynomialFunction1D: key #" << i << " is NaN");
        QL_REQUIRE(!std::isinf(xKeys[i]),
                   "PiecewisePolynomialFunction1D: key #" << i << " (" << xKeys[i] << ") is infinite");
    }
}

void checkOrder(const shared_ptr<PiecewisePolynomialResult>& pp, Size minOrder, const char* operation) {
    QL_REQUIRE(pp->order() >= minOrder, "PiecewisePolynomialFunction1D: cannot " << operation << " a polynomial of order "
                                                                                 << pp->order() << ", order "
                                                                                 << minOrder << " required");
}

// Horner scheme on row r, starting with the highest degree coefficient
Real horner(const Matrix& coefs, Size r, Real u) {
    Real result = 0.0;
    for (Size j = 0; j < coefs.columns(); ++j)
        result = result * u + coefs[r][j];
    return result;
}

Array valueAt(const PiecewisePolynomialResult& pp, Real x) {
    Size i = pp.interval(x);
    Real u = x - pp.knots()[i];
    Size dim = pp.dimensions();
    Array result(dim);
    for (Size d = 0; d < dim; ++d)
        result[d] = horner(pp.coefMatrix(), i * dim + d, u);
    return result;
}

Matrix valuesAt(const PiecewisePolynomialResult& pp, const std::vector<Real>& xKeys) {
    Size dim = pp.dimensions();
    Matrix result(dim, xKeys.size());
    for (Size k = 0; k < xKeys.size(); ++k) {
        Size i = pp.interval(xKeys[k]);
        Real u = xKeys[k] - pp.knots()[i];
        for (Size d = 0; d < dim; ++d)
            result[d][k] = horner(pp.coefMatrix(), i * dim + d, u);
    }
    return result;
}

// coefficients multiplied by their power, applied n times, lowering the order by n
shared_ptr<PiecewisePolynomialResult> differentiated(const PiecewisePolynomialResult& pp, Size n) {
    const Matrix& c = pp.coefMatrix();
    Size order = pp.order() - n;
    Matrix res(c.rows(), order);
    for (Size j = 0; j < order; ++j) {
        Real factor = 1.0;
        for (Size m = 0; m < n; ++m)
            factor *= static_cast<Real>(pp.order() - 1 - j - m);
        for (Size r = 0; r < c.rows(); ++r)
            res[r][j] = factor * c[r][j];
    }
    return QuantLib::ext::make_shared<PiecewisePolynomialResult>(pp.knots(), res, order, pp.dimensions());
}

} // namespace

Array PiecewisePolynomialFunction1D::evaluate(const shared_ptr<PiecewisePolynomialResult>& pp, Real xKey) const {
    checkPolynomial(pp);
    checkKey(xKey);
    return valueAt(*pp, xKey);
}

Matrix PiecewisePolynomialFunction1D::evaluateMany(const shared_ptr<PiecewisePolynomialResult>& pp,
                                                   const std::vector<Real>& xKeys) const {
    checkPolynomial(pp);
    checkKeys(xKeys);
    return valuesAt(*pp, xKeys);
}

std::vector<Matrix> PiecewisePolynomialFunction1D::evaluateBatched(const shared_ptr<PiecewisePolynomialResult>& pp,
                                                                   const std::vector<std::vector<Real>>& xKeys) const {
    checkPolynomial(pp);
    QL_REQUIRE(!xKeys.empty(), "PiecewisePolynomialFunction1D: no key sets given");
    for (auto const& keys : xKeys)
        checkKeys(keys);
    std::vector<Matrix> result;
    result.reserve(xKeys.size());
    for (auto const& keys : xKeys)
        result.push_back(valuesAt(*pp, keys));
    return result;
}

Array PiecewisePolynomialFunction1D::differentiate(const shared_ptr<PiecewisePolynomialResult>& pp,
                                                   Real xKey) const {
    checkPolynomial(pp);
    checkKey(xKey);
    checkOrder(pp, 2, "differentiate");
    return valueAt(*differentiated(*pp, 1), xKey);
}

Matrix PiecewisePolynomialFunction1D::differentiateMany(const shared_ptr<PiecewisePolynomialResult>& pp,
                                                        const std::vector<Real>& xKeys) const {
    checkPolynomial(pp);
    checkKeys(xKeys);
    checkOrder(pp, 2, "differentiate");
    return valuesAt(*differentiated(*pp, 1), xKeys);
}

Array PiecewisePolynomialFunction1D::differentiateTwice(const shared_ptr<PiecewisePolynomialResult>& pp,
                                                        Real xKey) const {
    checkPolynomial(pp);
    checkKey(xKey);
    checkOrder(pp, 3, "differentiate twice");
    return valueAt(*differentiated(*pp, 2), xKey);
}

Matrix PiecewisePolynomialFunction1D::differentiateTwiceMany(const shared_ptr<PiecewisePolynomialResult>& pp,
                                                             const std::vector<Real>& xKeys) const {
    checkPolynomial(pp);
    checkKeys(xKeys);
    checkOrder(pp, 3, "differentiate twice");
    return valuesAt(*differentiated(*pp, 2), xKeys);
}

Real PiecewisePolynomialFunction1D::integrate(const shared_ptr<PiecewisePolynomialResult>& pp, Real initialKey,
                                              Real xKey) const {
    checkPolynomial(pp);
    checkKey(xKey);
    return valueAt(*antiderivative(pp, initialKey), xKey)[0];
}

Array PiecewisePolynomialFunction1D::integrateMany(const shared_ptr<PiecewisePolynomialResult>& pp,
                                                   Real initialKey, const std::vector<Real>& xKeys) const {
    checkPolynomial(pp);
    checkKeys(xKeys);
    Matrix values = valuesAt(*antiderivative(pp, initialKey), xKeys);
    return Array(values.row_begin(0), values.row_end(0));
}

shared_ptr<PiecewisePolynomialResult>
PiecewisePolynomialFunction1D::derivative(const shared_ptr<PiecewisePolynomialResult>& pp) const {
    checkPolynomial(pp);
    checkOrder(pp, 2, "differentiate");
    return differentiated(*pp, 1);
}

shared_ptr<PiecewisePolynomialResult>
PiecewisePolynomialFunction1D::secondDerivative(const shared_ptr<PiecewisePolynomialResult>& pp) const {
    checkPolynomial(pp);
    checkOrder(pp, 3, "differentiate twice");
    return differentiated(*pp, 2);
}

shared_ptr<PiecewisePolynomialResult>
PiecewisePolynomialFunction1D::antiderivative(const shared_ptr<PiecewisePolynomialResult>& pp,
                                              Real initialKey) const {
    checkPolynomial(pp);
    QL_REQUIRE(!std::isnan(initialKey), "PiecewisePolynomialFunction1D: initial key is NaN");
    QL_REQUIRE(!std::isinf(initialKey), "PiecewisePolynomialFunction1D: initial key (" << initialKey
                                                                                       << ") is infinite");
    QL_REQUIRE(pp->dimensions() == 1, "PiecewisePolynomialFunction1D: cannot integrate a polynomial with "
                                          << pp->dimensions() << " dimensions, dimension should be 1");

    const Array& knots = pp->knots();
    const Matrix& c = pp->coefMatrix();
    Size order = pp->order();
    Size nIntervals = pp->numberOfIntervals();

    // degree k coefficient divided by k + 1, the constant term is filled in below
    Matrix res(nIntervals, order + 1, 0.0);
    for (Size i = 0; i < nIntervals; ++i) {
        for (Size j = 0; j < order; ++j)
            res[i][j] = c[i][j] / static_cast<Real>(order - j);
    }

    // vanishing at initialKey fixes the constant of its interval
    Size ref = pp->interval(initialKey);
    res[ref][order] = -horner(res, ref, initialKey - knots[ref]);

    // continuity at the knots fixes the others, moving right ...
    for (Size i = ref + 1; i < nIntervals; ++i)
        res[i][order] = horner(res, i - 1, knots[i] - knots[i - 1]);

    // ... and moving left
    for (Size i = ref; i > 0; --i)
        res[i - 1][order] = res[i][order] - horner(res, i - 1, knots[i] - knots[i - 1]);

    return QuantLib::ext::make_shared<PiecewisePolynomialResult>(knots, res, order + 1, 1);
}

} // namespace MathExt
