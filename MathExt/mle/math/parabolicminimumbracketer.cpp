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

#include <mle/math/parabolicminimumbracketer.hpp>
#include <mle/utilities/log.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace MathExt {

namespace {
// guards the parabolic step against a vanishing denominator
const Real TINY = 1.0e-20;

BracketTriplet triplet(Real x0, Real x1, Real x2, Real f0, Real f1, Real f2) {
    BracketTriplet t;
    t.x0 = x0;
    t.x1 = x1;
    t.x2 = x2;
    t.f0 = f0;
    t.f1 = f1;
    t.f2 = f2;
    return t;
}

// NaN and -inf values cannot take part in a bracket
bool unusable(Real v) { return std::isnan(v) || (std::isinf(v) && v < 0.0); }
} // namespace

ParabolicMinimumBracketer::ParabolicMinimumBracketer(Size maxIterations, Real maxMagnification, Real growthFactor)
    : maxIterations_(maxIterations), maxMagnification_(maxMagnification), growthFactor_(growthFactor) {
    QL_REQUIRE(maxIterations_ > 0, "ParabolicMinimumBracketer: maxIterations must be positive");
    QL_REQUIRE(growthFactor_ > 1.0, "ParabolicMinimumBracketer: growthFactor (" << growthFactor_
                                                                               << ") must be greater than 1");
    QL_REQUIRE(maxMagnification_ >= growthFactor_, "ParabolicMinimumBracketer: maxMagnification ("
                                                       << maxMagnification_ << ") must not be less than growthFactor ("
                                                       << growthFactor_ << ")");
}

BracketingResult ParabolicMinimumBracketer::bracket(const ScalarFunction& f, Real lower, Real upper) const {

    checkInputs(f, lower, upper);

    BracketingResult result;
    result.status = BracketingResult::Status::NotBracketed;
    result.evaluations = 0;

    auto value = [&f, &result](Real x) {
        ++result.evaluations;
        return f(x);
    };

    Real x1 = lower, x2 = upper;
    Real f1 = value(x1), f2 = value(x2);
    // x1 -> x2 is the downhill direction
    if (f2 > f1) {
        std::swap(x1, x2);
        std::swap(f1, f2);
    }
    Real x3 = x2 + growthFactor_ * (x2 - x1);
    Real f3 = value(x3);

    Size iterations = 0;
    Real u, fu;
    while (true) {
        result.triplet = triplet(x1, x2, x3, f1, f2, f3);
        if (unusable(f1) || unusable(f2) || unusable(f3)) {
            std::ostringstream msg;
            msg << "function value is NaN or -inf at one of " << x1 << ", " << x2 << ", " << x3;
            result.message = msg.str();
            return result;
        }
        if (!std::isfinite(x3)) {
            result.message = "search left the range of finite abscissas";
            return result;
        }
        if (f2 < f3) {
            if (f2 < f1)
                break;
            // f(x1) == f(x2) < f(x3), the midpoint of x1 and x2 decides
            Real xm = 0.5 * (x1 + x2);
            Real fm = value(xm);
            if (unusable(fm)) {
                std::ostringstream msg;
                msg << "function value is NaN or -inf at " << xm;
                result.message = msg.str();
                return result;
            }
            if (fm < f2) {
                result.triplet = triplet(x1, xm, x2, f1, fm, f2);
                break;
            }
            if (fm > f2) {
                result.triplet = triplet(xm, x2, x3, fm, f2, f3);
                break;
            }
            result.triplet = triplet(x1, xm, x2, f1, fm, f2);
            std::ostringstream msg;
            msg << "function is flat on [" << std::min(x1, x2) << ", " << std::max(x1, x2) << "]";
            result.message = msg.str();
            return result;
        }
        if (iterations++ >= maxIterations_) {
            std::ostringstream msg;
            msg << "no bracket found within " << maxIterations_ << " iterations, last triplet " << x1 << ", " << x2
                << ", " << x3;
            result.message = msg.str();
            return result;
        }

        Real r = (x2 - x1) * (f2 - f3);
        Real q = (x2 - x3) * (f2 - f1);
        Real denom = 2.0 * std::copysign(std::max(std::fabs(q - r), TINY), q - r);
        u = x2 - ((x2 - x3) * q - (x2 - x1) * r) / denom;
        Real uLim = x2 + maxMagnification_ * (x3 - x2);

        if ((x2 - u) * (u - x3) > 0.0) {
            // parabolic step between x2 and x3
            fu = value(u);
            if (fu < f3 && fu < f2 && !unusable(fu)) {
                result.triplet = triplet(x2, u, x3, f2, fu, f3);
                break;
            } else if (fu > f2 && f2 < f1) {
                result.triplet = triplet(x1, x2, u, f1, f2, fu);
                break;
            }
            u = x3 + growthFactor_ * (x3 - x2);
            fu = value(u);
        } else if ((x3 - u) * (u - uLim) > 0.0) {
            // parabolic step between x3 and the allowed limit
            fu = value(u);
            if (fu < f3) {
                x2 = x3;
                x3 = u;
                u = x3 + growthFactor_ * (x3 - x2);
                f2 = f3;
                f3 = fu;
                fu = value(u);
            }
        } else if ((u - uLim) * (uLim - x3) >= 0.0) {
            u = uLim;
            fu = value(u);
        } else {
            u = x3 + growthFactor_ * (x3 - x2);
            fu = value(u);
        }

        x1 = x2;
        x2 = x3;
        x3 = u;
        f1 = f2;
        f2 = f3;
        f3 = fu;
        TLOG("ParabolicMinimumBracketer: iteration " << iterations << ", triplet " << x1 << ", " << x2 << ", " << x3);
    }

    result.status = BracketingResult::Status::Bracketed;
    DLOG("ParabolicMinimumBracketer: bracketed minimum in {" << result.triplet.x0 << ", " << result.triplet.x1 << ", "
                                                             << result.triplet.x2 << "} after " << result.evaluations
                                                             << " function evaluations");
    return result;
}

} // namespace MathExt
