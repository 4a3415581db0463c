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

#include <mle/math/goldensectionminimizer1d.hpp>
#include <mle/math/parabolicminimumbracketer.hpp>
#include <mle/utilities/log.hpp>

#include <ql/errors.hpp>

#include <cmath>
#include <sstream>

namespace MathExt {

const Real GoldenSectionMinimizer1D::GOLDEN = 0.5 * (std::sqrt(5.0) - 1.0);

std::ostream& operator<<(std::ostream& out, MinimizationResult::Status status) {
    switch (status) {
    case MinimizationResult::Status::Converged:
        return out << "Converged";
    case MinimizationResult::Status::BracketingFailed:
        return out << "BracketingFailed";
    case MinimizationResult::Status::MaxIterationsExceeded:
        return out << "MaxIterationsExceeded";
    default:
        QL_FAIL("unknown minimization status (" << static_cast<int>(status) << ")");
    }
}

GoldenSectionMinimizer1D::GoldenSectionMinimizer1D(const QuantLib::ext::shared_ptr<MinimumBracketer>& bracketer,
                                                   Real accuracy, Size maxIterations)
    : bracketer_(bracketer), accuracy_(accuracy), maxIterations_(maxIterations) {
    if (!bracketer_)
        bracketer_ = QuantLib::ext::make_shared<ParabolicMinimumBracketer>();
    QL_REQUIRE(accuracy_ > 0.0, "GoldenSectionMinimizer1D: accuracy (" << accuracy_ << ") must be positive");
    QL_REQUIRE(maxIterations_ > 0, "GoldenSectionMinimizer1D: maxIterations must be positive");
}

Real GoldenSectionMinimizer1D::minimize(const ScalarFunction&, Real) const {
    QL_FAIL("GoldenSectionMinimizer1D: unsupported operation, need lower and upper bounds to use this minimization "
            "method");
}

Real GoldenSectionMinimizer1D::minimize(const ScalarFunction& f, Real, Real lower, Real upper) const {
    return minimize(f, lower, upper);
}

Real GoldenSectionMinimizer1D::minimize(const ScalarFunction& f, Real lower, Real upper) const {
    MinimizationResult result = search(f, lower, upper);
    QL_REQUIRE(result.status != MinimizationResult::Status::BracketingFailed,
               "GoldenSectionMinimizer1D: " << result.message);
    QL_REQUIRE(result.status != MinimizationResult::Status::MaxIterationsExceeded,
               "GoldenSectionMinimizer1D: " << result.message);
    return result.xMin;
}

MinimizationResult GoldenSectionMinimizer1D::search(const ScalarFunction& f, Real lower, Real upper) const {

    QL_REQUIRE(f, "GoldenSectionMinimizer1D: function must not be empty");

    BracketingResult bracket = bracketer_->bracket(f, lower, upper);

    MinimizationResult result;
    result.iterations = 0;
    result.evaluations = bracket.evaluations;

    if (!bracket.bracketed()) {
        result.status = MinimizationResult::Status::BracketingFailed;
        result.xMin = bracket.triplet.x1;
        result.fMin = bracket.triplet.f1;
        std::ostringstream msg;
        msg << "could not bracket a minimum starting from [" << lower << ", " << upper << "]: " << bracket.message;
        result.message = msg.str();
        return result;
    }

    auto value = [&f, &result](Real x) {
        ++result.evaluations;
        return f(x);
    };

    // x0, x1, x2, x3 are ordered (increasing or decreasing), the new interior point is
    // placed in the larger of the two bracket sections
    const BracketTriplet& t = bracket.triplet;
    Real x0 = t.x0, x3 = t.x2, x1, x2, f1, f2;
    if (std::fabs(t.x2 - t.x1) > std::fabs(t.x1 - t.x0)) {
        x1 = t.x1;
        f1 = t.f1;
        x2 = t.x2 + GOLDEN * (t.x1 - t.x2);
        f2 = value(x2);
    } else {
        x2 = t.x1;
        f2 = t.f1;
        x1 = t.x0 + GOLDEN * (t.x1 - t.x0);
        f1 = value(x1);
    }

    while (std::fabs(x3 - x0) > accuracy_ * (std::fabs(x1) + std::fabs(x2))) {
        if (result.iterations >= maxIterations_) {
            result.status = MinimizationResult::Status::MaxIterationsExceeded;
            result.xMin = f1 < f2 ? x1 : x2;
            result.fMin = f1 < f2 ? f1 : f2;
            std::ostringstream msg;
            msg << "could not find minimum within " << maxIterations_ << " iterations, interval [" << x0 << ", " << x3
                << "] did not shrink below the accuracy " << accuracy_
                << ": this should not happen because the minimum should have been successfully bracketed";
            result.message = msg.str();
            return result;
        }
        if (f2 < f1) {
            Real x = GOLDEN * (x2 - x3) + x3;
            x0 = x1;
            x1 = x2;
            x2 = x;
            f1 = f2;
            f2 = value(x);
        } else {
            Real x = GOLDEN * (x1 - x0) + x0;
            x3 = x2;
            x2 = x1;
            x1 = x;
            f2 = f1;
            f1 = value(x);
        }
        ++result.iterations;
    }

    result.status = MinimizationResult::Status::Converged;
    if (f1 < f2) {
        result.xMin = x1;
        result.fMin = f1;
    } else {
        result.xMin = x2;
        result.fMin = f2;
    }
    DLOG("GoldenSectionMinimizer1D: minimum " << result.fMin << " at " << result.xMin << " after "
                                              << result.iterations << " iterations and " << result.evaluations
                                              << " function evaluations");
    return result;
}

} // namespace MathExt
