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

#include <mle/math/minimumbracketer.hpp>

#include <ql/errors.hpp>

#include <cmath>

namespace MathExt {

std::ostream& operator<<(std::ostream& out, BracketingResult::Status status) {
    switch (status) {
    case BracketingResult::Status::Bracketed:
        return out << "Bracketed";
    case BracketingResult::Status::NotBracketed:
        return out << "NotBracketed";
    default:
        QL_FAIL("unknown bracketing status (" << static_cast<int>(status) << ")");
    }
}

std::array<Real, 3> MinimumBracketer::bracketedPoints(const ScalarFunction& f, Real lower, Real upper) const {
    BracketingResult result = bracket(f, lower, upper);
    QL_REQUIRE(result.bracketed(), "could not bracket a minimum starting from [" << lower << ", " << upper
                                                                                 << "]: " << result.message);
    return {{result.triplet.x0, result.triplet.x1, result.triplet.x2}};
}

void MinimumBracketer::checkInputs(const ScalarFunction& f, Real lower, Real upper) const {
    QL_REQUIRE(f, "function to bracket must not be empty");
    QL_REQUIRE(std::isfinite(lower), "lower bound (" << lower << ") must be finite");
    QL_REQUIRE(std::isfinite(upper), "upper bound (" << upper << ") must be finite");
    QL_REQUIRE(lower != upper, "lower (" << lower << ") and upper (" << upper << ") bounds must be distinct");
}

} // namespace MathExt
