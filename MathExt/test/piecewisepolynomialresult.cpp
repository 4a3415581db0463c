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


#include "toplevelfixture.hpp"
#include <boost/test/unit_test.hpp>
#include <mle/math/piecewisepolynomialresult.hpp>

#include <ql/errors.hpp>

#include <limits>

using namespace MathExt;
using namespace QuantLib;
using namespace boost::unit_test_framework;

namespace {

Array knots(std::initializer_list<Real> values) { return Array(values.begin(), values.end()); }

} // namespace

BOOST_FIXTURE_TEST_SUITE(MathExtTestSuite, mle::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(PiecewisePolynomialResultTest)

BOOST_AUTO_TEST_CASE(testAccessors) {

    BOOST_TEST_MESSAGE("Testing piecewise polynomial result accessors...");

    Matrix coefs(6, 4, 0.0);
    coefs[5][3] = 7.0;
    PiecewisePolynomialResult pp(knots({1.0, 2.0, 3.0, 4.0}), coefs, 4, 2);

    BOOST_CHECK_EQUAL(pp.knots().size(), Size(4));
    BOOST_CHECK_EQUAL(pp.knots()[3], 4.0);
    BOOST_CHECK_EQUAL(pp.numberOfIntervals(), Size(3));
    BOOST_CHECK_EQUAL(pp.order(), Size(4));
    BOOST_CHECK_EQUAL(pp.dimensions(), Size(2));
    BOOST_CHECK_EQUAL(pp.coefMatrix().rows(), Size(6));
    BOOST_CHECK_EQUAL(pp.coefMatrix().columns(), Size(4));
    BOOST_CHECK_EQUAL(pp.coefMatrix()[5][3], 7.0);

    // the result holds its own copy of the inputs
    coefs[5][3] = 0.0;
    BOOST_CHECK_EQUAL(pp.coefMatrix()[5][3], 7.0);
}

BOOST_AUTO_TEST_CASE(testInterval) {

    BOOST_TEST_MESSAGE("Testing piecewise polynomial interval lookup...");

    PiecewisePolynomialResult pp(knots({1.0, 2.0, 3.0, 4.0}), Matrix(3, 2, 1.0), 2, 1);

    BOOST_CHECK_EQUAL(pp.interval(-100.0), Size(0));
    BOOST_CHECK_EQUAL(pp.interval(0.999), Size(0));
    BOOST_CHECK_EQUAL(pp.interval(1.0), Size(0));
    BOOST_CHECK_EQUAL(pp.interval(1.5), Size(0));
    BOOST_CHECK_EQUAL(pp.interval(2.0), Size(1));
    BOOST_CHECK_EQUAL(pp.interval(2.999), Size(1));
    BOOST_CHECK_EQUAL(pp.interval(3.0), Size(2));
    BOOST_CHECK_EQUAL(pp.interval(4.0), Size(2));
    BOOST_CHECK_EQUAL(pp.interval(1.0E6), Size(2));

    PiecewisePolynomialResult single(knots({-1.0, 1.0}), Matrix(1, 1, 1.0), 1, 1);
    BOOST_CHECK_EQUAL(single.interval(-5.0), Size(0));
    BOOST_CHECK_EQUAL(single.interval(1.0), Size(0));
    BOOST_CHECK_EQUAL(single.interval(5.0), Size(0));
}

BOOST_AUTO_TEST_CASE(testInvalidInputs) {

    BOOST_TEST_MESSAGE("Testing piecewise polynomial result rejects inconsistent inputs...");

    Real nan = std::numeric_limits<Real>::quiet_NaN();
    Real inf = std::numeric_limits<Real>::infinity();

    BOOST_CHECK_NO_THROW(PiecewisePolynomialResult(knots({1.0, 2.0, 3.0}), Matrix(2, 3, 0.0), 3, 1));

    // knots
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0}), Matrix(0, 3, 0.0), 3, 1), QuantLib::Error);
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({2.0, 1.0, 3.0}), Matrix(2, 3, 0.0), 3, 1), QuantLib::Error);
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, 1.0, 3.0}), Matrix(2, 3, 0.0), 3, 1), QuantLib::Error);
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, nan, 3.0}), Matrix(2, 3, 0.0), 3, 1), QuantLib::Error);
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, 2.0, inf}), Matrix(2, 3, 0.0), 3, 1), QuantLib::Error);

    // order and dimensions
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, 2.0, 3.0}), Matrix(2, 0), 0, 1), QuantLib::Error);
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, 2.0, 3.0}), Matrix(0, 3), 3, 0), QuantLib::Error);

    // coefficient matrix shape
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, 2.0, 3.0}), Matrix(3, 3, 0.0), 3, 1), QuantLib::Error);
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, 2.0, 3.0}), Matrix(2, 3, 0.0), 3, 2), QuantLib::Error);
    BOOST_CHECK_THROW(PiecewisePolynomialResult(knots({1.0, 2.0, 3.0}), Matrix(2, 4, 0.0), 3, 1), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
