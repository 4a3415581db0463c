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

#include <mle/math/piecewisepolynomialresult.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <cmath>

namespace MathExt {

PiecewisePolynomialResult::PiecewisePolynomialResult(const Array& knots, const Matrix& coefMatrix, Size order,
                                                     Size dimensions)
    : knots_(knots), coefMatrix_(coefMatrix), order_(order), dimensions_(dimensions) {
    QL_REQUIRE(knots_.size() >= 2, "PiecewisePolynomialResult: at least two knots required, got " << knots_.size());
    for (Size i = 0; i < knots_.size(); ++i) {
        QL_REQUIRE(std::isfinite(knots_[i]), "PiecewisePolynomialResult: knot #" << i << " (" << knots_[i]
                                                                                  << ") is not finite");
        QL_REQUIRE(i == 0 || knots_[i - 1] < knots_[i], "PiecewisePolynomialResult: knots must be strictly increasing, got "
                                                            << knots_[i - 1] << " followed by " << knots_[i]);
    }
    QL_REQUIRE(order_ >= 1, "PiecewisePolynomialResult: order must be at least 1");
    QL_REQUIRE(dimensions_ >= 1, "PiecewisePolynomialResult: dimensions must be at least 1");
    QL_REQUIRE(coefMatrix_.rows() == dimensions_ * (knots_.size() - 1),
               "PiecewisePolynomialResult: coefficient matrix has " << coefMatrix_.rows() << " rows, expected "
                                                                    << dimensions_ * (knots_.size() - 1) << " ("
                                                                    << dimensions_ << " dimensions times "
                                                                    << knots_.size() - 1 << " intervals)");
    QL_REQUIRE(coefMatrix_.columns() == order_, "PiecewisePolynomialResult: coefficient matrix has "
                                                    << coefMatrix_.columns() << " columns, expected order " << order_);
}

Size PiecewisePolynomialResult::interval(Real x) const {
    // number of knots <= x among knots[0], ..., knots[n-2]
    Size i = std::upper_bound(knots_.begin(), knots_.end() - 1, x) - knots_.begin();
    return i == 0 ? 0 : i - 1;
}

} // namespace MathExt
