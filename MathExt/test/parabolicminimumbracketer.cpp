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
#include <mle/math/parabolicminimumbracketer.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace MathExt;
using namespace QuantLib;
using namespace boost::unit_test_framework;

namespace {

// x1 strictly between x0 and x2, f(x1) strictly below the outer values
void checkBracket(const BracketingResult& result, const ScalarFunction& f, Real xMin) {
    BOOST_REQUIRE_MESSAGE(result.bracketed(), "no bracket found: " << result.message);
    const BracketTriplet& t = result.triplet;
    BOOST_TEST_MESSAGE("  bracket {" << t.x0 << ", " << t.x1 << ", " << t.x2 << "}");
    BOOST_CHECK((t.x1 - t.x0) * (t.x2 - t.x1) > 0.0);
    BOOST_CHECK(t.f1 < t.f0);
    BOOST_CHECK(t.f1 < t.f2);
    BOOST_CHECK_EQUAL(t.f0, f(t.x0));
    BOOST_CHECK_EQUAL(t.f1, f(t.x1));
    BOOST_CHECK_EQUAL(t.f2, f(t.x2));
    BOOST_CHECK(std::min(t.x0, t.x2) < xMin && xMin < std::max(t.x0, t.x2));
    BOOST_CHECK(result.message.empty());
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(MathExtTestSuite, mle::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ParabolicMinimumBracketerTest)

BOOST_AUTO_TEST_CASE(testBracketInsideInterval) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer with the minimum inside the start interval...");

    ParabolicMinimumBracketer bracketer;
    ScalarFunction f = [](Real x) { return (x - 3.0) * (x - 3.0); };

    checkBracket(bracketer.bracket(f, 0.0, 10.0), f, 3.0);
    checkBracket(bracketer.bracket(f, 10.0, 0.0), f, 3.0);
    checkBracket(bracketer.bracket(f, 2.0, 3.5), f, 3.0);
}

BOOST_AUTO_TEST_CASE(testBracketOutsideInterval) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer searching outward of the start interval...");

    ParabolicMinimumBracketer bracketer;

    ScalarFunction cosh = [](Real x) { return std::cosh(x - 1.0); };
    BracketingResult result = bracketer.bracket(cosh, -5.0, -4.0);
    checkBracket(result, cosh, 1.0);
    BOOST_CHECK(std::max(result.triplet.x0, result.triplet.x2) > -4.0);

    ScalarFunction far = [](Real x) { return 0.5 * (x - 1.0E4) * (x - 1.0E4); };
    result = bracketer.bracket(far, 0.0, 1.0);
    checkBracket(result, far, 1.0E4);

    ScalarFunction left = [](Real x) { return std::exp(-x) + std::exp(2.0 * (x + 20.0)); };
    result = bracketer.bracket(left, 5.0, 6.0);
    checkBracket(result, left, -(2.0 * 20.0 + std::log(2.0)) / 3.0);
}

BOOST_AUTO_TEST_CASE(testBracketedPoints) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer triplet accessor...");

    ParabolicMinimumBracketer bracketer;
    ScalarFunction f = [](Real x) { return (x + 1.0) * (x + 1.0); };

    BracketingResult result = bracketer.bracket(f, 1.0, 2.0);
    std::array<Real, 3> points = bracketer.bracketedPoints(f, 1.0, 2.0);
    BOOST_CHECK_EQUAL(points[0], result.triplet.x0);
    BOOST_CHECK_EQUAL(points[1], result.triplet.x1);
    BOOST_CHECK_EQUAL(points[2], result.triplet.x2);
}

BOOST_AUTO_TEST_CASE(testNoMinimum) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer on functions without a minimum...");

    ParabolicMinimumBracketer bracketer(10);

    ScalarFunction linear = [](Real x) { return 2.0 * x - 1.0; };
    BracketingResult result;
    BOOST_CHECK_NO_THROW(result = bracketer.bracket(linear, 0.0, 1.0));
    BOOST_CHECK_EQUAL(result.status, BracketingResult::Status::NotBracketed);
    BOOST_CHECK(!result.bracketed());
    BOOST_CHECK(!result.message.empty());
    // three initial evaluations, at most two per outward step
    BOOST_CHECK(result.evaluations <= Size(3 + 2 * 10));
    BOOST_CHECK_THROW(bracketer.bracketedPoints(linear, 0.0, 1.0), QuantLib::Error);

    ScalarFunction decreasing = [](Real x) { return -std::log(x); };
    BOOST_CHECK(!bracketer.bracket(decreasing, 1.0, 2.0).bracketed());
}

BOOST_AUTO_TEST_CASE(testNoStrictMinimum) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer on functions without a strict minimum...");

    ParabolicMinimumBracketer bracketer;

    // overflows to -inf while walking downhill
    ScalarFunction minusExp = [](Real x) { return -std::exp(x); };
    BracketingResult result = bracketer.bracket(minusExp, 0.0, 1.0);
    BOOST_CHECK_EQUAL(result.status, BracketingResult::Status::NotBracketed);
    BOOST_CHECK(result.message.find("-inf") != std::string::npos);
    BOOST_CHECK_THROW(bracketer.bracketedPoints(minusExp, 0.0, 1.0), QuantLib::Error);

    ScalarFunction constant = [](Real) { return 1.0; };
    result = bracketer.bracket(constant, 0.0, 1.0);
    BOOST_CHECK_EQUAL(result.status, BracketingResult::Status::NotBracketed);
    BOOST_CHECK(result.message.find("iterations") != std::string::npos);
    BOOST_CHECK(result.evaluations <= Size(3 + 2 * bracketer.maxIterations()));

    // flat on the start interval, rising to the right
    ScalarFunction flat = [](Real x) { return x < 2.0 ? 1.0 : x - 1.0; };
    result = bracketer.bracket(flat, 0.0, 1.0);
    BOOST_CHECK_EQUAL(result.status, BracketingResult::Status::NotBracketed);
    BOOST_CHECK(result.message.find("flat") != std::string::npos);
    BOOST_CHECK_EQUAL(result.evaluations, Size(4));
}

BOOST_AUTO_TEST_CASE(testEqualStartValues) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer with equal function values at the start points...");

    ParabolicMinimumBracketer bracketer;
    ScalarFunction f = [](Real x) { return (x - 0.5) * (x - 0.5); };

    BracketingResult result = bracketer.bracket(f, 0.0, 1.0);
    checkBracket(result, f, 0.5);
    BOOST_CHECK_EQUAL(result.triplet.x1, 0.5);
    BOOST_CHECK_EQUAL(result.evaluations, Size(4));
}

BOOST_AUTO_TEST_CASE(testNaN) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer stops on NaN function values...");

    ParabolicMinimumBracketer bracketer;

    ScalarFunction root = [](Real x) { return std::sqrt(x); };
    BracketingResult result = bracketer.bracket(root, -2.0, -1.0);
    BOOST_CHECK(!result.bracketed());
    BOOST_CHECK(result.message.find("NaN") != std::string::npos);
    BOOST_CHECK_EQUAL(result.evaluations, Size(3));

    // defined on the start interval only, the search walks into the undefined region
    ScalarFunction log = [](Real x) { return std::log(x); };
    BOOST_CHECK(!bracketer.bracket(log, 2.0, 1.0).bracketed());
}

BOOST_AUTO_TEST_CASE(testInvalidInputs) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer rejects invalid inputs...");

    ParabolicMinimumBracketer bracketer;
    ScalarFunction f = [](Real x) { return x * x; };
    Real nan = std::numeric_limits<Real>::quiet_NaN();
    Real inf = std::numeric_limits<Real>::infinity();

    BOOST_CHECK_THROW(bracketer.bracket(ScalarFunction(), 0.0, 1.0), QuantLib::Error);
    BOOST_CHECK_THROW(bracketer.bracket(f, 1.0, 1.0), QuantLib::Error);
    BOOST_CHECK_THROW(bracketer.bracket(f, nan, 1.0), QuantLib::Error);
    BOOST_CHECK_THROW(bracketer.bracket(f, 0.0, nan), QuantLib::Error);
    BOOST_CHECK_THROW(bracketer.bracket(f, -inf, 1.0), QuantLib::Error);
    BOOST_CHECK_THROW(bracketer.bracket(f, 0.0, inf), QuantLib::Error);

    BOOST_CHECK_THROW(ParabolicMinimumBracketer(0), QuantLib::Error);
    BOOST_CHECK_THROW(ParabolicMinimumBracketer(100, 100.0, 1.0), QuantLib::Error);
    BOOST_CHECK_THROW(ParabolicMinimumBracketer(100, 1.5, 2.0), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testSettings) {

    BOOST_TEST_MESSAGE("Testing parabolic bracketer settings...");

    ParabolicMinimumBracketer bracketer;
    BOOST_CHECK_EQUAL(bracketer.maxIterations(), Size(100));
    BOOST_CHECK_EQUAL(bracketer.maxMagnification(), 100.0);
    BOOST_CHECK_EQUAL(bracketer.growthFactor(), MinimumBracketer::GOLDEN);

    // a larger growth factor reaches a distant minimum with fewer evaluations
    ScalarFunction f = [](Real x) { return std::fabs(x - 1.0E3); };
    BracketingResult slow = ParabolicMinimumBracketer(100, 2.0, 1.5).bracket(f, 0.0, 1.0);
    BracketingResult fast = ParabolicMinimumBracketer(100, 10.0, 4.0).bracket(f, 0.0, 1.0);
    checkBracket(slow, f, 1.0E3);
    checkBracket(fast, f, 1.0E3);
    BOOST_CHECK(fast.evaluations < slow.evaluations);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
